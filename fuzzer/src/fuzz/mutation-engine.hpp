// mutation-engine.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Produces fuzz candidates: first the seeds, verbatim and in order,
// then mutants of random population members.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "corpus.hpp"
#include "mutator.hpp"
#include "random-source.hpp"

namespace sqlmut
{
namespace fuzz
{

const int32_t DEFAULT_MIN_MUTATIONS = 2;
const int32_t DEFAULT_MAX_MUTATIONS = 10;

class MutationEngine
{
public:
    /**
     * Construct a MutationEngine.
     *
     * @param seeds initial inputs; dispensed verbatim before any mutation
     * @param min_mutations minimum number of operators applied per candidate
     * @param max_mutations maximum number of operators applied per candidate
     * @param random the random source used by every operator
     * @param registry the operators to choose among
     *
     * Throws InvalidConfiguration when `seeds` is empty, `min_mutations`
     * is negative, or `max_mutations < min_mutations`.
     */
    MutationEngine(
        const std::vector<std::string> &seeds,
        int32_t min_mutations = DEFAULT_MIN_MUTATIONS,
        int32_t max_mutations = DEFAULT_MAX_MUTATIONS,
        RandomSource random = RandomSource(),
        Registry registry = Registry::Generic());

    /**
     * Returns the next seed while seeding; afterwards returns a
     * freshly created candidate.
     */
    std::string ProduceNext();

    /**
     * Pick a population member and apply a random number of
     * mutations to it, each applied to the previous output.
     */
    std::string CreateCandidate();

    /**
     * Apply a single randomly chosen operator from the active registry
     */
    std::string Mutate(const std::string &input);

    /**
     * Add `candidate` to the population. No deduplication.
     */
    void AddSeed(const std::string &candidate);

    /**
     * Return to the seeding state with the original population.
     */
    void Reset();

    void SetRegistry(const Registry &registry);

    inline const Registry &GetRegistry() const
    {
        return this->registry;
    };

    inline const Corpus &GetCorpus() const
    {
        return this->corpus;
    };

    inline CorpusState State() const
    {
        return this->corpus.State();
    };

    /**
     * The string most recently returned by ProduceNext()
     */
    inline const std::string &LastInput() const
    {
        return this->last_input;
    };

private:
    Corpus corpus;
    int32_t min_mutations;
    int32_t max_mutations;
    RandomSource random;
    Registry registry;
    std::string last_input;
};

}
}
