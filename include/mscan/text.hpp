#pragma once
#include <string>

namespace mscan
{
    // Strips spaces, tabs and line breaks from both ends.
    inline std::string trim(const std::string &s)
    {
        const auto sp = [](unsigned char c)
        { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        std::size_t a = 0;
        while (a < s.size() && sp((unsigned char)s[a]))
            ++a;
        std::size_t b = s.size();
        while (b > a && sp((unsigned char)s[b - 1]))
            --b;
        return s.substr(a, b - a);
    }
}
