#include "CommandHandler.hpp"

#include <algorithm>
#include <cctype>

#include "../protocol/RESPEncoder.hpp"
#include "../utils/parse.hpp"

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

}  // namespace

/**
 * ----------------------------------------------------
 * handlePING
 * ----------------------------------------------------
 * RESP command: PING [message]
 *
 * Behavior:
 *   Responds with "+PONG\r\n", or echoes the optional
 *   message back as a bulk string.
 */
ExecResult CommandHandler::handlePING(const std::vector<std::string_view>& args) {
    if (args.size() > 2)
        return wrongArgs("ping");

    if (args.size() == 2)
        return reply(RESPEncoder::bulkString(std::string(args[1])));

    return reply(RESPEncoder::simpleString("PONG"));
}

/**
 * ----------------------------------------------------
 * handleECHO
 * ----------------------------------------------------
 * RESP command: ECHO <message>
 *
 * Example:
 *   > ECHO hello
 *   < $5\r\nhello\r\n
 */
ExecResult CommandHandler::handleECHO(const std::vector<std::string_view>& args) {
    if (args.size() != 2)
        return wrongArgs("echo");

    return reply(RESPEncoder::bulkString(std::string(args[1])));
}

/**
 * ----------------------------------------------------
 * handleSET
 * ----------------------------------------------------
 * RESP command:
 *    SET <key> <value>
 *    SET <key> <value> PX <ttl_ms>
 *    SET <key> <value> EX <ttl_seconds>
 *
 * Behavior:
 *   Always overwrites (last writer wins). A TTL schedules an
 *   expiry timer and replaces the previous one; a plain SET
 *   removes any previous TTL.
 */
ExecResult CommandHandler::handleSET(const std::vector<std::string_view>& args) {
    if (args.size() < 3)
        return wrongArgs("set");

    std::string key = std::string(args[1]);
    std::string val = std::string(args[2]);

    if (args.size() == 3) {
        store.setString(key, val);
        return reply(RESPEncoder::simpleString("OK"));
    }

    if (args.size() != 5)
        return error("ERR syntax error");

    bool millis = equalsIgnoreCase(args[3], "PX");
    bool seconds = equalsIgnoreCase(args[3], "EX");
    if (!millis && !seconds)
        return error("ERR syntax error");

    long long ttl;
    if (!parseInteger(args[4], ttl))
        return error("ERR value is not an integer or out of range");

    if (ttl <= 0 || (seconds && ttl > (1LL << 62) / 1000))
        return error("ERR invalid expire time in 'set' command");

    uint64_t ttl_ms = static_cast<uint64_t>(seconds ? ttl * 1000 : ttl);
    store.setString(key, val, ttl_ms);
    return reply(RESPEncoder::simpleString("OK"));
}

/**
 * ----------------------------------------------------
 * handleGET
 * ----------------------------------------------------
 * RESP command: GET <key>
 *
 * Return Values:
 *   - live key    → bulk string
 *   - missing key → "$-1\r\n"
 *   - expired key → evicted, "$-1\r\n"
 */
ExecResult CommandHandler::handleGET(const std::vector<std::string_view>& args) {
    if (args.size() != 2)
        return wrongArgs("get");

    std::string value;
    if (!store.getString(std::string(args[1]), value))
        return reply(RESPEncoder::nullBulk());

    return reply(RESPEncoder::bulkString(value));
}

ExecResult CommandHandler::handleTYPE(const std::vector<std::string_view>& args) {
    if (args.size() != 2)
        return wrongArgs("type");

    RedisType type = store.typeOf(std::string(args[1]));
    return reply(RESPEncoder::simpleString(typeName(type)));
}
