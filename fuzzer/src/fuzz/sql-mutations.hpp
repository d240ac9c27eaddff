// sql-mutations.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Token-level mutations for SQL-like inputs. These operate on the
// output of Tokenize() and never touch whitespace tokens.
//

#pragma once

#include <string>
#include <vector>

#include "random-source.hpp"
#include "tokenizer.hpp"

namespace sqlmut
{
namespace fuzz
{

// Character appended to string literals to stretch them
const char LITERAL_FILLER = 'A';

// Inclusive bounds on the number of filler characters appended
const int LITERAL_FILLER_MIN = 1;
const int LITERAL_FILLER_MAX = 30;

/**
 * Signed 32-bit and 64-bit integer boundaries and their neighbors
 */
const std::vector<std::string> &BoundaryIntegers();

/**
 * Suffixes appended to identifiers and other tokens
 */
const std::vector<std::string> &IdentifierSuffixes();

/**
 * Perturb a single content token in place, according to its kind:
 *
 *  - Keyword: swapped for a different keyword, keeping uppercase
 *    if the original was all uppercase and lowercase otherwise.
 *  - Integer: replaced by a boundary integer.
 *  - StringLiteral: the inner content is either stretched with filler,
 *    or has its first 'a' replaced with '@' (or '!' appended).
 *  - anything else: either a short suffix is appended or its case
 *    is inverted.
 *
 * The kind is updated to match the new text.
 */
void mutate_sql_token(Token &token, RandomSource &random);

/**
 * Pick a random content token and perturb it with mutate_sql_token().
 *
 * Returns the input unchanged when it has no content tokens.
 */
std::string replace_sql_token(const std::string &s, RandomSource &random);

/**
 * Pick a random keyword token and insert a copy of it, with one
 * trailing space, at a random position of the token sequence.
 *
 * Returns the input unchanged when it has no keywords.
 */
std::string duplicate_sql_clause(const std::string &s, RandomSource &random);

/**
 * Select a random contiguous span of at least two content tokens
 * and permute them among their own slots.
 *
 * Returns the input unchanged when it has fewer than two content tokens.
 */
std::string shuffle_sql_tokens(const std::string &s, RandomSource &random);

/**
 * Permute the content tokens with content indices in the inclusive
 * range [start, end]. Whitespace between them stays in place.
 *
 * Returns the input unchanged when the span is out of range or
 * covers fewer than two tokens.
 */
std::string shuffle_sql_token_span(
    const std::string &s,
    size_t start,
    size_t end,
    RandomSource &random);

}
}
