#include "RESPEncoder.hpp"

std::string RESPEncoder::simpleString(const std::string& s) {
    return "+" + s + "\r\n";
}

std::string RESPEncoder::error(const std::string& message) {
    return "-" + message + "\r\n";
}

std::string RESPEncoder::integer(long long n) {
    return ":" + std::to_string(n) + "\r\n";
}

/**
 * Optimized with `reserve()` to avoid reallocations:
 *   bulkString("foo") → "$3\r\nfoo\r\n"
 */
std::string RESPEncoder::bulkString(const std::string& value) {
    size_t size = value.size();
    std::string len = std::to_string(size);

    std::string reply;
    reply.reserve(1 + len.size() + 2 + size + 2);

    reply += '$';
    reply += len;
    reply += "\r\n";
    reply += value;
    reply += "\r\n";

    return reply;
}

std::string RESPEncoder::nullBulk() {
    return "$-1\r\n";
}

std::string RESPEncoder::array(const std::vector<std::string>& values) {
    std::string out;
    out += "*" + std::to_string(values.size()) + "\r\n";

    for (const auto& v : values) {
        out += bulkString(v);
    }

    return out;
}

std::string RESPEncoder::encodeCommand(const std::vector<std::string>& args) {
    return array(args);
}
