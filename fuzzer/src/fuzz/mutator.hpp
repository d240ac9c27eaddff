// mutator.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Registry of named mutation operators and uniform dispatch
// over them.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "random-source.hpp"

namespace sqlmut
{
namespace fuzz
{

enum class Operator
{
    kDeleteRandomCharacter,
    kInsertRandomCharacter,
    kFlipRandomCharacter,
    kReplaceSqlToken,
    kDuplicateSqlClause,
    kShuffleSqlTokens,
};

/**
 * Apply `op` once to `input`.
 */
std::string Apply(Operator op, const std::string &input, RandomSource &random);

/**
 * Returns the snake_case name of the operator
 */
const char *OperatorName(Operator op);

/**
 * An ordered, non-empty set of operators to choose from while mutating.
 */
class Registry
{
public:
    /**
     * Construct a registry over `operators`.
     *
     * Throws InvalidConfiguration when `operators` is empty.
     */
    explicit Registry(std::vector<Operator> operators);

    /**
     * delete / insert / flip a single character
     */
    static Registry Generic();

    /**
     * token replace, keyword duplication, token shuffle
     */
    static Registry Sql();

    /**
     * Generic() followed by Sql()
     */
    static Registry Combined();

    /**
     * Look up a predefined registry by name: "generic", "sql" or "combined".
     *
     * Throws InvalidConfiguration on an unknown name.
     */
    static Registry Named(const std::string &name);

    /**
     * Select one operator uniformly at random
     */
    Operator Choose(RandomSource &random) const;

    /**
     * Select one operator and apply it to `input`.
     */
    std::string Mutate(const std::string &input, RandomSource &random) const;

    bool Contains(Operator op) const;

    inline const std::vector<Operator> &Operators() const
    {
        return this->operators;
    };

    inline size_t Size() const
    {
        return this->operators.size();
    };

private:
    std::vector<Operator> operators;
};

}
}
