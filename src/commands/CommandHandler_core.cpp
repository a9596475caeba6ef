#include "CommandHandler.hpp"

#include <algorithm>
#include <cctype>

#include "../protocol/RESPEncoder.hpp"

/**
 * ----------------------------------------------------
 * Constructor
 * ----------------------------------------------------
 * Initializes the command dispatch table by mapping
 * uppercase RESP command names to their handler methods.
 *
 * All commands are normalized to uppercase before lookup,
 * ensuring case-insensitivity (e.g. "PING", "ping", "PiNg").
*/
CommandHandler::CommandHandler(RedisStore& str, ReplySink& s)
    : client_fd(-1),
      store(str),
      sink(s)
{
    commandMap = {
        {"PING",  &CommandHandler::handlePING},
        {"ECHO",  &CommandHandler::handleECHO},
        {"SET",   &CommandHandler::handleSET},
        {"GET",   &CommandHandler::handleGET},
        {"TYPE",  &CommandHandler::handleTYPE},
        {"RPUSH", &CommandHandler::handleRPUSH},
        {"LPUSH", &CommandHandler::handleLPUSH},
        {"LRANGE",&CommandHandler::handleLRANGE},
        {"LLEN",  &CommandHandler::handleLLEN},
        {"LPOP",  &CommandHandler::handleLPOP},
        {"BLPOP", &CommandHandler::handleBLPOP},
        {"BRPOP", &CommandHandler::handleBRPOP},
        {"XADD",  &CommandHandler::handleXADD}
    };
}

ExecResult CommandHandler::reply(std::string payload) {
    return ExecResult(std::move(payload), false);
}

ExecResult CommandHandler::error(const std::string& message) {
    return ExecResult(RESPEncoder::error(message), false);
}

ExecResult CommandHandler::wrongArgs(const char* command) {
    return error(std::string("ERR wrong number of arguments for '") + command + "' command");
}

/**
 * ----------------------------------------------------
 * execute()
 * ----------------------------------------------------
 * Routes a parsed RESP command to the correct handler.
 *
 * Steps:
 *   1. Store calling client's file descriptor.
 *   2. Convert command name to uppercase.
 *   3. Lookup handler in dispatch table.
 *   4. Invoke member function pointer.
 *
 * Unknown commands get an error reply; the connection stays usable.
 */
ExecResult CommandHandler::execute(const std::vector<std::string_view>& args,
                                   int client_fd)
{
    this->client_fd = client_fd;

    if (args.empty())
        return error("ERR empty command");

    std::string cmd(args[0]);
    for (char& c : cmd) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto it = commandMap.find(cmd);
    if (it == commandMap.end())
        return error("ERR unknown command '" + std::string(args[0]) + "'");

    return (this->*(it->second))(args);
}

ExecResult CommandHandler::execute(const std::vector<std::string>& args, int client_fd)
{
    std::vector<std::string_view> views(args.begin(), args.end());
    return execute(views, client_fd);
}

/**
 * ----------------------------------------------------
 * processTimers()
 * ----------------------------------------------------
 * Drains the timer registry up to `now_ms`. Timers come out
 * earliest-deadline first and are already removed from the
 * registry, so none of them can fire a second time.
 */
std::size_t CommandHandler::processTimers(uint64_t now_ms)
{
    std::vector<PendingTimer> due = store.timers.popDue(now_ms);

    for (const PendingTimer& t : due) {
        switch (t.kind) {
            case TimerKind::EXPIRE_STRING_KEY:
                store.expireIfDue(t.key, now_ms);
                break;
            case TimerKind::RESOLVE_WAITER:
                expireWaiter(t.waiter_id);
                break;
        }
    }

    return due.size();
}

std::optional<uint64_t> CommandHandler::millisUntilNextTimer(uint64_t now_ms) const
{
    return store.timers.millisUntilNext(now_ms);
}

bool CommandHandler::isBlocked(int fd) const
{
    return waiterByClient.count(fd) > 0;
}

std::size_t CommandHandler::blockedCount() const
{
    return blockedClients.size();
}
