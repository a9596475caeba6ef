#include "parse.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

bool parseInteger(std::string_view s, long long& out) {
    if (s.empty())
        return false;

    const char* first = s.data();
    const char* last = s.data() + s.size();

    // from_chars does not accept a leading '+'
    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last;
}

bool parseUnsigned(std::string_view s, uint64_t& out) {
    if (s.empty() || s[0] == '-')
        return false;

    const char* first = s.data();
    const char* last = s.data() + s.size();

    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last;
}

bool parseTimeoutSeconds(std::string_view s, double& out) {
    if (s.empty())
        return false;

    for (char c : s) {
        bool ok = (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' ||
                  c == 'e' || c == 'E';
        if (!ok)
            return false;
    }

    std::string tmp(s);
    char* end = nullptr;
    double value = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size())
        return false;

    if (!std::isfinite(value))
        return false;

    out = value;
    return true;
}
