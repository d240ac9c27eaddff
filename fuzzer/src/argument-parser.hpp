// argument-parser.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Parses arguments for the sqlmut candidate generator
//

#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace sqlmut
{

/**
 * Holds details about parsed command-line arguments
 */
class ParsedArguments {
public:
    /**
     * The seeds to start from, in order
     */
    std::vector<std::string> seeds;

    /**
     * How many candidates to print
     */
    uint64_t count;

    /**
     * Bounds on the number of mutations applied per candidate
     */
    int32_t min_mutations;
    int32_t max_mutations;

    /**
     * Which operator registry to use: generic, sql, or combined
     */
    std::string mode;

    /**
     * Seed for the random source.
     *
     * 0 indicates a nondeterministic seed
     */
    uint64_t rng_seed;

    /**
     * When true, print candidates without escaping
     */
    bool raw;

    /**
     * Parses command-line arguments
     */
    static ParsedArguments Parse(int argc, char **argv);
};


} // end namespace sqlmut
