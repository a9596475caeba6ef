#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/**
 * RESPParser
 * ----------
 * Decodes client requests of the form
 *
 *     *<n>\r\n
 *     $<len>\r\n<len bytes>\r\n      (n times)
 *
 * The parser is stateless: the connection keeps appending socket
 * reads to one buffer and calls parseCommand() on it. A frame that
 * is split across reads reports INCOMPLETE until the remaining bytes
 * arrive; pipelined frames are taken one at a time via `consumed`.
 */
class RESPParser {
public:
    enum class ParseStatus {
        COMPLETE,
        INCOMPLETE,
        ERROR
    };

    // Upper bounds accepted from the wire, same as Redis defaults.
    static constexpr long long MAX_ARRAY_LEN = 1024 * 1024;
    static constexpr long long MAX_BULK_LEN = 512LL * 1024 * 1024;

    /**
     * Parses one request frame from the front of `buffer`.
     *
     * COMPLETE   → `out` holds the arguments, `consumed` the frame size.
     * INCOMPLETE → nothing is consumed, call again with more data.
     * ERROR      → malformed framing; `err` describes it. The
     *              connection must be closed.
     */
    static ParseStatus parseCommand(std::string_view buffer,
                                    std::vector<std::string>& out,
                                    std::size_t& consumed,
                                    std::string& err);

    /**
     * Convenience wrapper for a buffer expected to hold exactly one
     * complete array of bulk strings (tests, replies).
     * Returns an empty vector if the frame is incomplete or malformed.
     */
    static std::vector<std::string> parse(const std::string& data);

private:
    // Reads "<digits>\r\n" starting at pos (optionally with a leading '-').
    static ParseStatus parseInteger(std::string_view s, std::size_t& pos,
                                    long long& value, std::string& err);
};
