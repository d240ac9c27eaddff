#pragma once

#include <string>
#include <vector>

namespace sqlmut
{
    /**
     * Render `s` on a single printable line: backslash, newline, tab and
     * carriage return are escaped, other non-printable bytes become \xNN.
     */
    std::string escape_for_display(const std::string &s);

    /**
     * Split `s` on every occurrence of `sep`. An empty `s` yields no parts.
     */
    std::vector<std::string> split_on(const std::string &s, const std::string &sep);
}
