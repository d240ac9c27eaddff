#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>
#include "util.hpp"

namespace sqlmut
{
    std::string escape_for_display(const std::string &s)
    {
        std::ostringstream out;
        for (unsigned char c : s)
        {
            if ('\\' == c)
            {
                out << "\\\\";
            }
            else if (' ' <= c && c <= '~')
            {
                out << static_cast<char>(c);
            }
            else if (c == '\n')
            {
                out << "\\n";
            }
            else if (c == '\t')
            {
                out << "\\t";
            }
            else if (c == '\r')
            {
                out << "\\r";
            }
            else
            {
                out << "\\x" << std::setw(2) << std::setfill('0') << std::hex
                    << static_cast<uint32_t>(c);
                out << std::dec << std::setw(0) << std::setfill(' ');
            }
        }
        return out.str();
    }

    std::vector<std::string> split_on(const std::string &s, const std::string &sep)
    {
        std::vector<std::string> ret;
        if (s.empty())
        {
            return ret;
        }

        if (sep.empty())
        {
            ret.push_back(s);
            return ret;
        }

        size_t last_idx = 0;
        while (true)
        {
            size_t next_sep = s.find(sep, last_idx);
            if (next_sep == std::string::npos)
            {
                ret.push_back(s.substr(last_idx));
                break;
            }

            ret.push_back(s.substr(last_idx, next_sep - last_idx));
            last_idx = next_sep + sep.size();
        }
        return ret;
    }
}
