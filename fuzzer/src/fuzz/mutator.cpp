#include "mutator.hpp"

#include "errors.hpp"
#include "mutations.hpp"
#include "sql-mutations.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sqlmut
{
namespace fuzz
{

std::string Apply(Operator op, const std::string &input, RandomSource &random)
{
    switch (op)
    {
    case Operator::kDeleteRandomCharacter:
        return delete_random_character(input, random);
    case Operator::kInsertRandomCharacter:
        return insert_random_character(input, random);
    case Operator::kFlipRandomCharacter:
        return flip_random_character(input, random);
    case Operator::kReplaceSqlToken:
        return replace_sql_token(input, random);
    case Operator::kDuplicateSqlClause:
        return duplicate_sql_clause(input, random);
    case Operator::kShuffleSqlTokens:
        return shuffle_sql_tokens(input, random);
    }
    throw std::logic_error("Unreachable");
}

const char *OperatorName(Operator op)
{
    switch (op)
    {
    case Operator::kDeleteRandomCharacter:
        return "delete_random_character";
    case Operator::kInsertRandomCharacter:
        return "insert_random_character";
    case Operator::kFlipRandomCharacter:
        return "flip_random_character";
    case Operator::kReplaceSqlToken:
        return "replace_sql_token";
    case Operator::kDuplicateSqlClause:
        return "duplicate_sql_clause";
    case Operator::kShuffleSqlTokens:
        return "shuffle_sql_tokens";
    }
    throw std::logic_error("Unreachable");
}

Registry::Registry(std::vector<Operator> operators)
    : operators(std::move(operators))
{
    if (this->operators.empty())
    {
        throw InvalidConfiguration("operator registry must not be empty");
    }
}

Registry Registry::Generic()
{
    return Registry({
        Operator::kDeleteRandomCharacter,
        Operator::kInsertRandomCharacter,
        Operator::kFlipRandomCharacter,
    });
}

Registry Registry::Sql()
{
    return Registry({
        Operator::kReplaceSqlToken,
        Operator::kDuplicateSqlClause,
        Operator::kShuffleSqlTokens,
    });
}

Registry Registry::Combined()
{
    std::vector<Operator> all = Generic().Operators();
    Registry sql = Sql();
    all.insert(all.end(), sql.Operators().begin(), sql.Operators().end());
    return Registry(all);
}

Registry Registry::Named(const std::string &name)
{
    if (name == "generic")
    {
        return Generic();
    }
    else if (name == "sql")
    {
        return Sql();
    }
    else if (name == "combined")
    {
        return Combined();
    }
    throw InvalidConfiguration("unknown operator registry: " + name);
}

Operator Registry::Choose(RandomSource &random) const
{
    return random.Pick(this->operators);
}

std::string Registry::Mutate(const std::string &input, RandomSource &random) const
{
    return Apply(this->Choose(random), input, random);
}

bool Registry::Contains(Operator op) const
{
    return std::find(this->operators.begin(), this->operators.end(), op) != this->operators.end();
}

}
}
