// random-source.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Seedable source of randomness shared by the mutation operators
// and the mutation engine.
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace sqlmut
{
namespace fuzz
{

class RandomSource
{
public:
    /**
     * Construct a RandomSource seeded from std::random_device
     */
    RandomSource();

    /**
     * Construct a RandomSource which replays the same sequence
     * for the same seed.
     */
    explicit RandomSource(uint64_t seed);

    /**
     * Re-seed the generator
     */
    void Seed(uint64_t seed);

    /**
     * Uniform integer in the inclusive range [lo, hi].
     *
     * NOTE: lo MUST be <= hi
     */
    int64_t Between(int64_t lo, int64_t hi);

    /**
     * Uniform index in [0, n). n MUST be nonzero.
     */
    size_t Index(size_t n);

    /**
     * True with probability `p`
     */
    bool Chance(double p);

    /**
     * Picks a uniformly random element of `container`.
     */
    template<typename T>
    const T &Pick(const std::vector<T> &container)
    {
        if (container.empty())
        {
            throw std::logic_error("No candidates available (Pick)");
        }
        return container[this->Index(container.size())];
    }

    /**
     * Randomly permute the range [begin, end)
     */
    template<typename It>
    void Shuffle(It begin, It end)
    {
        std::shuffle(begin, end, this->rng);
    }

private:
    std::mt19937_64 rng;
};

}
}
