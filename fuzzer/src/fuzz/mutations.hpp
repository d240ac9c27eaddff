// mutations.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Character-level string mutations, oblivious to any structure
// in the input.
//

#pragma once

#include <cstdint>
#include <string>

#include "random-source.hpp"

namespace sqlmut
{
namespace fuzz
{

// Inclusive range of characters which may be inserted
const int PRINTABLE_MIN = 32;
const int PRINTABLE_MAX = 126;

// Inclusive range of bit positions which may be flipped
const int FLIP_BIT_MIN = 0;
const int FLIP_BIT_MAX = 6;

/**
 * Remove one character at a random position.
 *
 * Returns the input unchanged when it is empty.
 */
std::string delete_random_character(const std::string &s, RandomSource &random);

/**
 * Insert one printable ASCII character at a random position,
 * including either end.
 */
std::string insert_random_character(const std::string &s, RandomSource &random);

/**
 * Flip one random bit (0 to 6) of one random character.
 *
 * Returns the input unchanged when it is empty. The result may
 * contain control characters.
 */
std::string flip_random_character(const std::string &s, RandomSource &random);

}
}
