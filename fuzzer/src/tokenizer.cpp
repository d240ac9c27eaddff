#include "tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace sqlmut
{

// NOTE: FROM is not a keyword here; it classifies as an Identifier
static const std::vector<std::string> sql_keywords = {
    "SELECT", "INSERT", "UPDATE", "DELETE", "DROP", "CREATE", "ALTER",
    "TABLE", "INTO", "VALUES", "SET", "WHERE", "JOIN", "INNER", "LEFT",
    "RIGHT", "OUTER", "ON", "UNION", "ALL", "DISTINCT", "ORDER", "GROUP",
    "BY", "HAVING", "LIMIT", "OFFSET", "AND", "OR", "NOT", "NULL", "IS",
    "IN", "LIKE", "BETWEEN", "EXISTS", "AS", "CASE", "WHEN", "THEN",
    "ELSE", "END",
};

static inline bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static inline std::string to_upper(const std::string &s)
{
    std::string ret(s);
    std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return ret;
}

const std::vector<std::string> &SqlKeywords()
{
    return sql_keywords;
}

bool IsKeyword(const std::string &text)
{
    static const std::unordered_set<std::string> lookup(
        sql_keywords.begin(), sql_keywords.end());
    return lookup.count(to_upper(text)) > 0;
}

TokenKind Classify(const std::string &word)
{
    if (word.empty())
    {
        return TokenKind::Other;
    }

    if (std::all_of(word.begin(), word.end(), is_space))
    {
        return TokenKind::Whitespace;
    }

    if (word[0] == '\'')
    {
        if (word.size() >= 2 && word.back() == '\'')
        {
            return TokenKind::StringLiteral;
        }
        return TokenKind::Other;
    }

    if (IsKeyword(word))
    {
        return TokenKind::Keyword;
    }

    if (std::all_of(word.begin(), word.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
    {
        return TokenKind::Integer;
    }

    unsigned char first = static_cast<unsigned char>(word[0]);
    if ((std::isalpha(first) || first == '_') &&
        std::all_of(word.begin(), word.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; }))
    {
        return TokenKind::Identifier;
    }

    return TokenKind::Other;
}

std::vector<Token> Tokenize(const std::string &s)
{
    std::vector<Token> ret;
    size_t i = 0;

    while (i < s.size())
    {
        size_t start = i;

        if (is_space(s[i]))
        {
            while (i < s.size() && is_space(s[i]))
            {
                i++;
            }
        }
        else if (s[i] == '\'')
        {
            // consume through the closing quote, skipping '' escapes
            bool closed = false;
            i++;
            while (i < s.size())
            {
                if (s[i] == '\'')
                {
                    if (i + 1 < s.size() && s[i + 1] == '\'')
                    {
                        i += 2;
                        continue;
                    }
                    i++;
                    closed = true;
                    break;
                }
                i++;
            }

            // a stray quote only takes the word right after it
            if (!closed)
            {
                i = start + 1;
                while (i < s.size() && !is_space(s[i]) && s[i] != '\'')
                {
                    i++;
                }
            }
        }
        else
        {
            while (i < s.size() && !is_space(s[i]) && s[i] != '\'')
            {
                i++;
            }
        }

        std::string text = s.substr(start, i - start);
        TokenKind kind = Classify(text);
        ret.push_back(Token{kind, std::move(text)});
    }

    return ret;
}

std::string Untokenize(const std::vector<Token> &tokens)
{
    std::string ret;
    for (const Token &t : tokens)
    {
        ret += t.text;
    }
    return ret;
}

const char *TokenKindName(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Keyword:
        return "Keyword";
    case TokenKind::Integer:
        return "Integer";
    case TokenKind::StringLiteral:
        return "StringLiteral";
    case TokenKind::Identifier:
        return "Identifier";
    case TokenKind::Whitespace:
        return "Whitespace";
    case TokenKind::Other:
        return "Other";
    }
    return "Unknown";
}

}
