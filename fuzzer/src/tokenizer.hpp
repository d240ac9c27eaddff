// tokenizer.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Splits SQL-like text into classified lexical fragments and
// reassembles them. Reassembly is the exact inverse of splitting.
//

#pragma once

#include <string>
#include <vector>

namespace sqlmut
{

enum class TokenKind
{
    Keyword,
    Integer,
    StringLiteral,
    Identifier,
    Whitespace,
    Other,
};

/**
 * A single lexical fragment. Whitespace is kept verbatim so
 * that Untokenize() can reproduce the input exactly.
 */
struct Token
{
    TokenKind kind;
    std::string text;

    /**
     * True for every kind except Whitespace
     */
    inline bool IsContent() const
    {
        return this->kind != TokenKind::Whitespace;
    };
};

/**
 * The fixed set of recognized SQL keywords, in uppercase.
 */
const std::vector<std::string> &SqlKeywords();

/**
 * Returns true if `text` is a keyword, ignoring case
 */
bool IsKeyword(const std::string &text);

/**
 * Classify one non-whitespace fragment.
 */
TokenKind Classify(const std::string &word);

/**
 * Split `s` into whitespace runs, quoted string literals, and words.
 *
 * A string literal ('...') is always a single token, even when it
 * contains whitespace. A doubled quote inside the literal does not
 * terminate it. A quote which is never closed is kept together with
 * the non-whitespace run following it, and scanning resumes after that.
 */
std::vector<Token> Tokenize(const std::string &s);

/**
 * Concatenate the token texts, in order.
 */
std::string Untokenize(const std::vector<Token> &tokens);

const char *TokenKindName(TokenKind kind);

}
