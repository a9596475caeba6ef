#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../db/RedisStore.hpp"
#include "../types/BlockedClient.hpp"
#include "../types/ExecResult.hpp"
#include "../types/ReplySink.hpp"

/**
 * CommandHandler
 * ---------------
 * Central dispatcher responsible for:
 *   • Validating argument shape and numeric arguments
 *   • Routing commands to the appropriate handler
 *   • Executing string, list and stream operations on the RedisStore
 *   • Managing blocking list operations (BLPOP / BRPOP) and the
 *     deadlines attached to them
 *
 * This class does NOT perform any I/O by itself. Immediate replies are
 * returned in ExecResult; replies for parked clients go to the ReplySink.
 *
 * Everything here runs on the event-loop thread, so the store, the timer
 * registry and the blocked-client table need no locking.
 */
class CommandHandler
{
public:
    CommandHandler(RedisStore& str, ReplySink& sink);

    /**
     * Executes a parsed RESP command.
     * @param args      Parsed RESP tokens (command + arguments).
     * @param client_fd Calling client's file descriptor.
     * @return          Reply payload, or blocked=true with an empty reply.
    */
    ExecResult execute(const std::vector<std::string_view>& args, int client_fd);
    ExecResult execute(const std::vector<std::string>& args, int client_fd);

    /**
     * Fires every timer whose deadline is <= now_ms:
     *   • expired SET ... PX keys are evicted
     *   • timed out BLPOP/BRPOP clients receive a null array
     * Returns the number of timers fired.
     */
    std::size_t processTimers(uint64_t now_ms);

    // Delay until the next timer is due, or nullopt if there is none.
    std::optional<uint64_t> millisUntilNextTimer(uint64_t now_ms) const;

    // Forgets a disconnected client: its pending waiter (if any) is
    // removed together with its timeout timer.
    void dropClient(int client_fd);

    bool isBlocked(int client_fd) const;
    std::size_t blockedCount() const;

private:
    // File descriptor of the currently executing client.
    int client_fd{};

    RedisStore& store;
    ReplySink& sink;

    /**
     * Command function pointer type.
     * Each command handler accepts a vector of arguments and returns an ExecResult.
    */
    using CmdFn = ExecResult (CommandHandler::*)(const std::vector<std::string_view>&);

    /**
     * Command dispatch table.
     * Maps uppercase RESP command names to their handler functions.
    */
    std::unordered_map<std::string, CmdFn> commandMap;

    /**
     * Blocked client table used by BLPOP/BRPOP.
     *   waiter id → record
     *   client fd → waiter id (a parked connection has at most one)
     * FIFO order per list lives in List::waiters.
    */
    std::unordered_map<uint64_t, BlockedClient> blockedClients;
    std::unordered_map<int, uint64_t> waiterByClient;
    uint64_t next_waiter_id = 1;

    // --------------------------------------------------------------------
    // Reply helpers
    // --------------------------------------------------------------------
    ExecResult reply(std::string payload);
    ExecResult error(const std::string& message);
    ExecResult wrongArgs(const char* command);

    // --------------------------------------------------------------------
    // Connection / String Handlers
    // --------------------------------------------------------------------
    ExecResult handlePING(const std::vector<std::string_view>& args);
    ExecResult handleECHO(const std::vector<std::string_view>& args);
    ExecResult handleSET (const std::vector<std::string_view>& args);
    ExecResult handleGET (const std::vector<std::string_view>& args);
    ExecResult handleTYPE(const std::vector<std::string_view>& args);

    // --------------------------------------------------------------------
    // List Handlers
    // --------------------------------------------------------------------
    ExecResult handleRPUSH (const std::vector<std::string_view>& args);
    ExecResult handleLPUSH (const std::vector<std::string_view>& args);
    ExecResult handleLRANGE(const std::vector<std::string_view>& args);
    ExecResult handleLLEN  (const std::vector<std::string_view>& args);
    ExecResult handleLPOP  (const std::vector<std::string_view>& args);

    /**
     * Blocking pops (BLPOP / BRPOP key timeout).
     *
     *   • list non-empty → pop immediately, reply [key, element]
     *   • list empty     → register a waiter and park the client until
     *                      a push serves it or the timeout passes
     *                      (timeout 0 = forever)
     */
    ExecResult handleBLPOP(const std::vector<std::string_view>& args);
    ExecResult handleBRPOP(const std::vector<std::string_view>& args);
    ExecResult blockingPop(const std::vector<std::string_view>& args,
                           const char* command, bool pop_back);

    // --------------------------------------------------------------------
    // Stream Handlers
    // --------------------------------------------------------------------
    ExecResult handleXADD(const std::vector<std::string_view>& args);

    /**
     * Serves waiters of `list_name` in FIFO order after a push.
     * One element per waiter; each served waiter's timeout timer is
     * cancelled before its reply is delivered.
     */
    void maybeWakeBlockedClients(const std::string& list_name);

    // Timer callback for a blocking timeout. No-op if the waiter was
    // already served.
    void expireWaiter(uint64_t waiter_id);

    // Removes a waiter record and its timer; returns the record.
    std::optional<BlockedClient> takeWaiter(uint64_t waiter_id);
};
