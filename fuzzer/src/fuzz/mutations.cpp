#include "mutations.hpp"

#include <cstdint>
#include <string>

namespace sqlmut
{
namespace fuzz
{

std::string delete_random_character(const std::string &s, RandomSource &random)
{
    if (s.empty())
    {
        return s;
    }

    size_t pos = random.Index(s.size());
    std::string ret(s);
    ret.erase(pos, 1);
    return ret;
}

std::string insert_random_character(const std::string &s, RandomSource &random)
{
    // pos may equal s.size(), which appends
    size_t pos = static_cast<size_t>(random.Between(0, static_cast<int64_t>(s.size())));
    char c = static_cast<char>(random.Between(PRINTABLE_MIN, PRINTABLE_MAX));

    std::string ret(s);
    ret.insert(ret.begin() + pos, c);
    return ret;
}

std::string flip_random_character(const std::string &s, RandomSource &random)
{
    if (s.empty())
    {
        return s;
    }

    size_t pos = random.Index(s.size());
    uint8_t bit = static_cast<uint8_t>(1u << random.Between(FLIP_BIT_MIN, FLIP_BIT_MAX));

    std::string ret(s);
    ret[pos] = static_cast<char>(static_cast<uint8_t>(ret[pos]) ^ bit);
    return ret;
}

}
}
