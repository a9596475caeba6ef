#include "RESPParser.hpp"

#include <cstdio>

namespace {

// Error texts end up inside a "-ERR ...\r\n" line, so control bytes
// are printed as hex.
std::string describeByte(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u > 0x20 && u < 0x7f)
        return std::string("'") + c + "'";

    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", u);
    return std::string("byte ") + buf;
}

}  // namespace

RESPParser::ParseStatus RESPParser::parseInteger(std::string_view s,
                                                 std::size_t& pos,
                                                 long long& value,
                                                 std::string& err)
{
    std::size_t p = pos;
    bool negative = false;

    if (p < s.size() && s[p] == '-') {
        negative = true;
        ++p;
    }

    std::size_t digits_start = p;
    long long num = 0;

    while (p < s.size() && s[p] != '\r') {
        char c = s[p];
        if (c < '0' || c > '9') {
            err = "invalid length";
            return ParseStatus::ERROR;
        }
        if (num > MAX_BULK_LEN) {
            err = "invalid length";
            return ParseStatus::ERROR;
        }
        num = num * 10 + (c - '0');
        ++p;
    }

    // Need "\r\n" after the digits
    if (p + 1 >= s.size())
        return ParseStatus::INCOMPLETE;

    if (p == digits_start || s[p + 1] != '\n') {
        err = "invalid length";
        return ParseStatus::ERROR;
    }

    value = negative ? -num : num;
    pos = p + 2;
    return ParseStatus::COMPLETE;
}

RESPParser::ParseStatus RESPParser::parseCommand(std::string_view buffer,
                                                 std::vector<std::string>& out,
                                                 std::size_t& consumed,
                                                 std::string& err)
{
    out.clear();
    consumed = 0;

    if (buffer.empty())
        return ParseStatus::INCOMPLETE;

    if (buffer[0] != '*') {
        err = "expected '*', got " + describeByte(buffer[0]);
        return ParseStatus::ERROR;
    }

    std::size_t pos = 1;
    long long count = 0;

    ParseStatus st = parseInteger(buffer, pos, count, err);
    if (st != ParseStatus::COMPLETE)
        return st;

    if (count < 0 || count > MAX_ARRAY_LEN) {
        err = "invalid multibulk length";
        return ParseStatus::ERROR;
    }

    std::vector<std::string> args;
    args.reserve(static_cast<std::size_t>(count));

    for (long long i = 0; i < count; ++i) {
        if (pos >= buffer.size())
            return ParseStatus::INCOMPLETE;

        if (buffer[pos] != '$') {
            err = "expected '$', got " + describeByte(buffer[pos]);
            return ParseStatus::ERROR;
        }
        ++pos;

        long long len = 0;
        st = parseInteger(buffer, pos, len, err);
        if (st != ParseStatus::COMPLETE)
            return st;

        if (len < 0 || len > MAX_BULK_LEN) {
            err = "invalid bulk length";
            return ParseStatus::ERROR;
        }

        std::size_t need = pos + static_cast<std::size_t>(len) + 2;
        if (need > buffer.size())
            return ParseStatus::INCOMPLETE;

        if (buffer[need - 2] != '\r' || buffer[need - 1] != '\n') {
            err = "bulk string not terminated by CRLF";
            return ParseStatus::ERROR;
        }

        args.emplace_back(buffer.substr(pos, static_cast<std::size_t>(len)));
        pos = need;
    }

    out = std::move(args);
    consumed = pos;
    return ParseStatus::COMPLETE;
}

std::vector<std::string> RESPParser::parse(const std::string& data) {
    std::vector<std::string> values;
    std::size_t consumed = 0;
    std::string err;

    if (parseCommand(data, values, consumed, err) != ParseStatus::COMPLETE)
        return {};

    return values;
}
