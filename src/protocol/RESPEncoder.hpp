#pragma once
#include <string>
#include <vector>

/**
 * RESPEncoder
 * -----------
 * Builds RESP2 wire replies. Every function is total: any input
 * string (including binary data and CRLF inside bulk payloads)
 * yields a well-formed frame.
 */
class RESPEncoder {
public:
    /** +OK\r\n style. `s` must not contain CR or LF. */
    static std::string simpleString(const std::string& s);

    /** -ERR message\r\n. `message` is passed without the leading '-'. */
    static std::string error(const std::string& message);

    /** :123\r\n */
    static std::string integer(long long n);

    /** $len\r\nvalue\r\n */
    static std::string bulkString(const std::string& value);

    /** $-1\r\n */
    static std::string nullBulk();


    /** *N\r\n followed by N bulk strings */
    static std::string array(const std::vector<std::string>& values);

    /** Client-side request encoding: identical layout to array(). */
    static std::string encodeCommand(const std::vector<std::string>& args);
};
