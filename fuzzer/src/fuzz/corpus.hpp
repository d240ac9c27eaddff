// corpus.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Maintains the population of strings to mutate, and the cursor
// which dispenses the original seeds.
//

#pragma once

#include <cstdint>
#include <vector>
#include <string>

#include "random-source.hpp"

namespace sqlmut
{
namespace fuzz
{

enum class CorpusState
{
    // some original seeds have not been dispensed yet
    kSeeding,
    // every original seed was dispensed once
    kMutating,
};

/**
 * Contains the original seed list and the population grown from it.
 *
 * The population starts as a copy of the seeds and only ever grows.
 */
class Corpus
{
public:
    explicit Corpus(const std::vector<std::string> &seeds);

    /**
     * Append an entry to the population. The seed list is untouched.
     */
    void Add(const std::string &entry);

    /**
     * Gets the ith population entry.
     *
     * Returns nullptr when out of bounds.
     */
    const std::string *Get(size_t i) const;

    /**
     * Select a population entry uniformly at random
     */
    const std::string &Pick(RandomSource &random) const;

    /**
     * Returns true while some seeds have not been dispensed
     */
    bool HasPendingSeed() const;

    /**
     * Returns the seed at the cursor and advances the cursor.
     *
     * NOTE: HasPendingSeed() MUST be true
     */
    const std::string &NextSeed();

    /**
     * Restore the population to the seed list and rewind the cursor.
     */
    void Reset();

    CorpusState State() const;

    /**
     * The number of entries in the population
     */
    size_t Size() const;

    /**
     * The number of original seeds
     */
    size_t SeedCount() const;

    /**
     * Index of the next seed to dispense
     */
    size_t SeedCursor() const;

private:
    /**
     * The caller-supplied seeds, in order
     */
    std::vector<std::string> seeds;

    /**
     * Candidates available for mutation
     */
    std::vector<std::string> population;

    size_t seed_cursor;
};

}
}
