#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "fuzz/sql-mutations.hpp"
#include "tokenizer.hpp"

#include "catch2/catch.hpp"

namespace f = sqlmut::fuzz;
using sqlmut::Token;
using sqlmut::TokenKind;

static std::string upper(const std::string &s)
{
    std::string ret(s);
    for (char &c : ret)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return ret;
}

static size_t count_occurrences(const std::string &haystack, const std::string &needle)
{
    size_t n = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos)
    {
        n++;
        pos = haystack.find(needle, pos + 1);
    }
    return n;
}

static bool is_boundary(const std::string &s)
{
    const std::vector<std::string> &b = f::BoundaryIntegers();
    return std::find(b.begin(), b.end(), s) != b.end();
}

TEST_CASE( "SQL mutators leave whitespace-only input alone" )
{
    f::RandomSource random(10);
    const char *inputs[] = { "", " ", " \t\n " };

    for (const char *input : inputs)
    {
        REQUIRE( f::replace_sql_token(input, random) == input );
        REQUIRE( f::duplicate_sql_clause(input, random) == input );
        REQUIRE( f::shuffle_sql_tokens(input, random) == input );
    }
}

TEST_CASE( "Duplicate is a no-op without keywords, replace is not" )
{
    f::RandomSource random(11);
    const std::string s = "tbl = 42";
    bool replace_changed = false;

    for (size_t i = 0; i < 50; i++)
    {
        REQUIRE( f::duplicate_sql_clause(s, random) == s );
        replace_changed |= (f::replace_sql_token(s, random) != s);
    }

    REQUIRE( replace_changed );
}

TEST_CASE( "Shuffle needs two content tokens" )
{
    f::RandomSource random(12);
    REQUIRE( f::shuffle_sql_tokens("  lonely  ", random) == "  lonely  " );
}

TEST_CASE( "Keyword swap picks a different keyword in the same case" )
{
    f::RandomSource random(13);

    for (size_t i = 0; i < 200; i++)
    {
        Token up{TokenKind::Keyword, "SELECT"};
        f::mutate_sql_token(up, random);
        REQUIRE( up.text != "SELECT" );
        REQUIRE( sqlmut::IsKeyword(up.text) );
        REQUIRE( up.text == upper(up.text) );
        REQUIRE( up.kind == TokenKind::Keyword );

        Token low{TokenKind::Keyword, "where"};
        f::mutate_sql_token(low, random);
        REQUIRE( upper(low.text) != "WHERE" );
        REQUIRE( sqlmut::IsKeyword(low.text) );
        for (char c : low.text)
        {
            REQUIRE( std::islower(static_cast<unsigned char>(c)) );
        }

        // mixed case is treated as not-uppercase
        Token mixed{TokenKind::Keyword, "Union"};
        f::mutate_sql_token(mixed, random);
        REQUIRE( sqlmut::IsKeyword(mixed.text) );
        REQUIRE_FALSE( mixed.text == upper(mixed.text) );
    }
}

TEST_CASE( "Integers become boundary values" )
{
    f::RandomSource random(14);

    for (size_t i = 0; i < 50; i++)
    {
        Token t{TokenKind::Integer, "100"};
        f::mutate_sql_token(t, random);
        REQUIRE( is_boundary(t.text) );
    }
}

TEST_CASE( "String literal perturbation" )
{
    f::RandomSource random(15);
    bool saw_filler = false;
    bool saw_at = false;
    bool saw_bang = false;

    for (size_t i = 0; i < 200; i++)
    {
        Token t{TokenKind::StringLiteral, "'banana'"};
        f::mutate_sql_token(t, random);
        REQUIRE( t.kind == TokenKind::StringLiteral );

        if (t.text == "'b@nana'")
        {
            saw_at = true;
        }
        else
        {
            std::string inner = t.text.substr(1, t.text.size() - 2);
            REQUIRE( inner.substr(0, 6) == "banana" );
            size_t n_filler = inner.size() - 6;
            REQUIRE( n_filler >= 1 );
            REQUIRE( n_filler <= 30 );
            REQUIRE( inner.substr(6) == std::string(n_filler, 'A') );
            saw_filler = true;
        }

        Token no_a{TokenKind::StringLiteral, "'xyz'"};
        f::mutate_sql_token(no_a, random);
        if (no_a.text == "'xyz!'")
        {
            saw_bang = true;
        }
    }

    REQUIRE( saw_filler );
    REQUIRE( saw_at );
    REQUIRE( saw_bang );
}

TEST_CASE( "Identifiers get a suffix or inverted case" )
{
    f::RandomSource random(16);

    for (size_t i = 0; i < 100; i++)
    {
        Token t{TokenKind::Identifier, "tbl"};
        f::mutate_sql_token(t, random);
        bool ok = t.text == "TBL";
        for (const std::string &suffix : f::IdentifierSuffixes())
        {
            ok |= t.text == "tbl" + suffix;
        }
        REQUIRE( ok );

        Token u{TokenKind::Identifier, "Tbl"};
        f::mutate_sql_token(u, random);
        ok = u.text == "tbl" || u.text == "Tbl_x" || u.text == "Tbl__" || u.text == "Tbl0";
        REQUIRE( ok );
    }
}

TEST_CASE( "Replace on a numeric token only touches that token" )
{
    f::RandomSource random(17);
    bool hit_number = false;

    for (size_t i = 0; i < 200; i++)
    {
        std::string out = f::replace_sql_token("x = 100", random);
        std::vector<Token> tokens = sqlmut::Tokenize(out);

        // whitespace is never mutated, so the string still has three words
        REQUIRE( tokens.size() == 5 );
        REQUIRE( tokens[1].text == " " );
        REQUIRE( tokens[3].text == " " );

        if (tokens[4].text != "100")
        {
            hit_number = true;
            REQUIRE( is_boundary(tokens[4].text) );
            REQUIRE( tokens[0].text == "x" );
            REQUIRE( tokens[2].text == "=" );
        }
    }

    REQUIRE( hit_number );
}

TEST_CASE( "Duplicating in SELECT * FROM t yields two SELECTs" )
{
    f::RandomSource random(18);

    for (size_t i = 0; i < 100; i++)
    {
        std::string out = f::duplicate_sql_clause("SELECT * FROM t", random);
        REQUIRE( count_occurrences(upper(out), "SELECT") == 2 );
        REQUIRE( out.size() == std::string("SELECT * FROM t").size() + 7 );
    }
}

TEST_CASE( "Duplicated keyword carries a trailing space" )
{
    f::RandomSource random(19);
    bool saw_double_space = false;

    for (size_t i = 0; i < 100; i++)
    {
        std::string out = f::duplicate_sql_clause("a AND b", random);
        REQUIRE( count_occurrences(out, "AND") == 2 );
        saw_double_space |= out.find("AND  ") != std::string::npos;
    }

    REQUIRE( saw_double_space );
}

TEST_CASE( "Duplicate can insert before the first and after the last token" )
{
    f::RandomSource random(23);
    bool inserted_at_front = false;
    bool inserted_at_back = false;

    for (size_t i = 0; i < 500; i++)
    {
        std::string out = f::duplicate_sql_clause("a OR b", random);
        REQUIRE( count_occurrences(out, "OR") == 2 );
        inserted_at_front |= out == "OR a OR b";
        inserted_at_back |= out == "a OR bOR ";
    }

    REQUIRE( inserted_at_front );
    REQUIRE( inserted_at_back );
}

TEST_CASE( "Stray quote does not hide later keywords" )
{
    f::RandomSource random(24);
    bool duplicated = false;

    for (size_t i = 0; i < 100; i++)
    {
        std::string out = f::duplicate_sql_clause("x 'y AND z", random);
        REQUIRE( count_occurrences(out, "AND") == 2 );
        duplicated |= out != "x 'y AND z";
    }

    REQUIRE( duplicated );
}

TEST_CASE( "Replace after a stray quote never crosses whitespace" )
{
    f::RandomSource random(25);
    const std::string s = "name = O'Reilly AND x = 1";
    std::vector<Token> before = sqlmut::Tokenize(s);

    for (size_t i = 0; i < 200; i++)
    {
        std::vector<Token> after = sqlmut::Tokenize(f::replace_sql_token(s, random));
        REQUIRE( after.size() == before.size() );

        size_t n_changed = 0;
        for (size_t j = 0; j < before.size(); j++)
        {
            if (!before[j].IsContent())
            {
                REQUIRE( after[j].text == before[j].text );
            }
            else if (after[j].text != before[j].text)
            {
                n_changed++;
            }
        }
        REQUIRE( n_changed <= 1 );
    }
}

TEST_CASE( "Span shuffle keeps tokens outside the span in place" )
{
    f::RandomSource random(20);
    bool moved = false;

    for (size_t i = 0; i < 100; i++)
    {
        std::string out = f::shuffle_sql_token_span("A B C D", 1, 3, random);
        REQUIRE( out.size() == 7 );
        REQUIRE( out[0] == 'A' );
        REQUIRE( out[1] == ' ' );
        REQUIRE( out[3] == ' ' );
        REQUIRE( out[5] == ' ' );

        std::string tail = {out[2], out[4], out[6]};
        std::string sorted = tail;
        std::sort(sorted.begin(), sorted.end());
        REQUIRE( sorted == "BCD" );
        moved |= tail != "BCD";
    }

    REQUIRE( moved );
}

TEST_CASE( "Span shuffle rejects degenerate spans" )
{
    f::RandomSource random(21);
    REQUIRE( f::shuffle_sql_token_span("A B C D", 2, 2, random) == "A B C D" );
    REQUIRE( f::shuffle_sql_token_span("A B C D", 3, 1, random) == "A B C D" );
    REQUIRE( f::shuffle_sql_token_span("A B C D", 1, 4, random) == "A B C D" );
}

TEST_CASE( "Shuffle permutes content tokens and keeps whitespace" )
{
    f::RandomSource random(22);
    const std::string s = "SELECT  a ,\tb FROM t";
    std::vector<Token> before = sqlmut::Tokenize(s);

    for (size_t i = 0; i < 100; i++)
    {
        std::vector<Token> after = sqlmut::Tokenize(f::shuffle_sql_tokens(s, random));
        REQUIRE( after.size() == before.size() );

        std::vector<std::string> content_before;
        std::vector<std::string> content_after;
        for (size_t j = 0; j < before.size(); j++)
        {
            if (before[j].IsContent())
            {
                content_before.push_back(before[j].text);
                content_after.push_back(after[j].text);
            }
            else
            {
                REQUIRE( after[j].text == before[j].text );
            }
        }

        std::sort(content_before.begin(), content_before.end());
        std::sort(content_after.begin(), content_after.end());
        REQUIRE( content_before == content_after );
    }
}
