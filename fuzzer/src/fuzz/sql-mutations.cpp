#include "sql-mutations.hpp"

#include <algorithm>
#include <cctype>

namespace sqlmut
{
namespace fuzz
{

static const std::vector<std::string> boundary_integers = {
    "0",
    "-1",
    "1",
    "2147483647",
    "-2147483648",
    "9223372036854775807",
    "-9223372036854775808",
};

static const std::vector<std::string> identifier_suffixes = {
    "_x",
    "__",
    "0",
};

const std::vector<std::string> &BoundaryIntegers()
{
    return boundary_integers;
}

const std::vector<std::string> &IdentifierSuffixes()
{
    return identifier_suffixes;
}

/**
 * True when `s` has at least one cased character and all of
 * its cased characters are uppercase (resp. lowercase).
 */
static bool all_cased(const std::string &s, bool upper)
{
    bool any_cased = false;
    for (unsigned char c : s)
    {
        if (std::isupper(c))
        {
            if (!upper)
            {
                return false;
            }
            any_cased = true;
        }
        else if (std::islower(c))
        {
            if (upper)
            {
                return false;
            }
            any_cased = true;
        }
    }
    return any_cased;
}

static std::string to_case(const std::string &s, bool upper)
{
    std::string ret(s);
    for (char &c : ret)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        c = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
    }
    return ret;
}

static std::vector<size_t> content_positions(const std::vector<Token> &tokens)
{
    std::vector<size_t> ret;
    for (size_t i = 0; i < tokens.size(); i++)
    {
        if (tokens[i].IsContent())
        {
            ret.push_back(i);
        }
    }
    return ret;
}

static void swap_keyword(Token &token, RandomSource &random)
{
    const std::vector<std::string> &keywords = SqlKeywords();

    // pick among the other n-1 keywords
    size_t self = keywords.size();
    for (size_t i = 0; i < keywords.size(); i++)
    {
        if (keywords[i] == to_case(token.text, true))
        {
            self = i;
            break;
        }
    }

    size_t pick;
    if (self == keywords.size())
    {
        pick = random.Index(keywords.size());
    }
    else
    {
        pick = random.Index(keywords.size() - 1);
        if (pick >= self)
        {
            pick++;
        }
    }

    bool upper = all_cased(token.text, true);
    token.text = upper ? keywords[pick] : to_case(keywords[pick], false);
}

static void perturb_literal(Token &token, RandomSource &random)
{
    std::string inner = token.text.substr(1, token.text.size() - 2);

    if (random.Chance(0.5))
    {
        int n = static_cast<int>(random.Between(LITERAL_FILLER_MIN, LITERAL_FILLER_MAX));
        inner.append(static_cast<size_t>(n), LITERAL_FILLER);
    }
    else
    {
        size_t a = inner.find('a');
        if (a != std::string::npos)
        {
            inner[a] = '@';
        }
        else
        {
            inner += "!";
        }
    }

    token.text = "'" + inner + "'";
}

void mutate_sql_token(Token &token, RandomSource &random)
{
    switch (token.kind)
    {
    case TokenKind::Whitespace:
        return;
    case TokenKind::Keyword:
        swap_keyword(token, random);
        break;
    case TokenKind::Integer:
        token.text = random.Pick(boundary_integers);
        break;
    case TokenKind::StringLiteral:
        perturb_literal(token, random);
        break;
    case TokenKind::Identifier:
    case TokenKind::Other:
        if (random.Chance(0.5))
        {
            token.text += random.Pick(identifier_suffixes);
        }
        else
        {
            token.text = to_case(token.text, all_cased(token.text, false));
        }
        break;
    }

    token.kind = Classify(token.text);
}

std::string replace_sql_token(const std::string &s, RandomSource &random)
{
    std::vector<Token> tokens = Tokenize(s);
    std::vector<size_t> idx = content_positions(tokens);
    if (idx.empty())
    {
        return s;
    }

    mutate_sql_token(tokens[random.Pick(idx)], random);
    return Untokenize(tokens);
}

std::string duplicate_sql_clause(const std::string &s, RandomSource &random)
{
    std::vector<Token> tokens = Tokenize(s);
    std::vector<size_t> idx;
    for (size_t i = 0; i < tokens.size(); i++)
    {
        if (tokens[i].kind == TokenKind::Keyword)
        {
            idx.push_back(i);
        }
    }

    if (idx.empty())
    {
        return s;
    }

    Token dup = tokens[random.Pick(idx)];
    dup.text += " ";

    size_t insert_pos = static_cast<size_t>(random.Between(0, static_cast<int64_t>(tokens.size())));
    tokens.insert(tokens.begin() + insert_pos, dup);
    return Untokenize(tokens);
}

std::string shuffle_sql_tokens(const std::string &s, RandomSource &random)
{
    std::vector<Token> tokens = Tokenize(s);
    size_t n = content_positions(tokens).size();
    if (n < 2)
    {
        return s;
    }

    size_t start = static_cast<size_t>(random.Between(0, static_cast<int64_t>(n) - 2));
    size_t end = static_cast<size_t>(random.Between(static_cast<int64_t>(start) + 1, static_cast<int64_t>(n) - 1));
    return shuffle_sql_token_span(s, start, end, random);
}

std::string shuffle_sql_token_span(
    const std::string &s,
    size_t start,
    size_t end,
    RandomSource &random)
{
    std::vector<Token> tokens = Tokenize(s);
    std::vector<size_t> idx = content_positions(tokens);
    if (end <= start || end >= idx.size())
    {
        return s;
    }

    std::vector<Token> segment;
    for (size_t j = start; j <= end; j++)
    {
        segment.push_back(tokens[idx[j]]);
    }

    random.Shuffle(segment.begin(), segment.end());

    for (size_t j = start; j <= end; j++)
    {
        tokens[idx[j]] = segment[j - start];
    }

    return Untokenize(tokens);
}

}
}
