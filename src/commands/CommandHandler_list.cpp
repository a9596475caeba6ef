#include "CommandHandler.hpp"

#include <cmath>

#include "../protocol/RESPEncoder.hpp"
#include "../utils/Logger.hpp"
#include "../utils/parse.hpp"
#include "../utils/time.hpp"

/**
 * ----------------------------------------------------
 * handleRPUSH
 * ----------------------------------------------------
 * RESP command: RPUSH <list> <value> [value ...]
 *
 * Behavior:
 *   Appends the elements to the tail in argument order.
 *   The list is created automatically.
 *
 * Return:
 *   RESP Integer → length right after the push (before any
 *   blocked client takes an element).
*/
ExecResult CommandHandler::handleRPUSH(const std::vector<std::string_view>& args) {
    if (args.size() < 3)
        return wrongArgs("rpush");

    std::string list_name = std::string(args[1]);
    List& list = store.getOrCreateList(list_name);

    for (size_t i = 2; i < args.size(); ++i) {
        list.PushBack(std::string(args[i]));
    }

    int reply_len = list.Len();

    maybeWakeBlockedClients(list_name);

    return reply(RESPEncoder::integer(reply_len));
}

/**
 * ----------------------------------------------------
 * handleLPUSH
 * ----------------------------------------------------
 * RESP command: LPUSH <list> <value> [value ...]
 *
 * Behavior:
 *   Prepends the elements in reverse argument order, so the
 *   first argument ends up at the head:
 *
 *     LPUSH l a b c  →  [a, b, c, ...previous elements]
*/
ExecResult CommandHandler::handleLPUSH(const std::vector<std::string_view>& args) {
    if (args.size() < 3)
        return wrongArgs("lpush");

    std::string list_name = std::string(args[1]);
    List& list = store.getOrCreateList(list_name);

    for (size_t i = args.size() - 1; i >= 2; --i) {
        list.PushFront(std::string(args[i]));
    }

    int reply_len = list.Len();

    maybeWakeBlockedClients(list_name);

    return reply(RESPEncoder::integer(reply_len));
}

/**
 * ----------------------------------------------------
 * handleLRANGE
 * ----------------------------------------------------
 * RESP command: LRANGE <list> <start> <end>
 *
 * Inclusive range, negative indices count from the tail.
 * Missing list → empty array.
*/
ExecResult CommandHandler::handleLRANGE(const std::vector<std::string_view>& args) {
    if (args.size() != 4)
        return wrongArgs("lrange");

    long long start, end;
    if (!parseInteger(args[2], start) || !parseInteger(args[3], end))
        return error("ERR value is not an integer or out of range");

    List* list = store.findList(std::string(args[1]));
    if (!list)
        return reply(RESPEncoder::array({}));

    return reply(RESPEncoder::array(list->GetElementsInRange(start, end)));
}

ExecResult CommandHandler::handleLLEN(const std::vector<std::string_view>& args) {
    if (args.size() != 2)
        return wrongArgs("llen");

    List* list = store.findList(std::string(args[1]));
    return reply(RESPEncoder::integer(list ? list->Len() : 0));
}

/**
 * ----------------------------------------------------
 * handleLPOP
 * ----------------------------------------------------
 * RESP command: LPOP <list> [count]
 *
 *   LPOP key        → bulk string, or "$-1\r\n" if empty/missing
 *   LPOP key count  → array of up to `count` elements,
 *                     empty array if empty/missing
*/
ExecResult CommandHandler::handleLPOP(const std::vector<std::string_view>& args) {
    if (args.size() != 2 && args.size() != 3)
        return wrongArgs("lpop");

    List* list = store.findList(std::string(args[1]));

    // LPOP key
    if (args.size() == 2) {
        std::string removed_element;
        if (!list || !list->PopFront(removed_element))
            return reply(RESPEncoder::nullBulk());

        return reply(RESPEncoder::bulkString(removed_element));
    }

    // LPOP key count
    long long pop_size;
    if (!parseInteger(args[2], pop_size))
        return error("ERR value is not an integer or out of range");
    if (pop_size < 0)
        return error("ERR value is out of range, must be positive");

    std::vector<std::string> removed_elements;
    std::string removed_element;

    while (list && static_cast<long long>(removed_elements.size()) < pop_size &&
           list->PopFront(removed_element)) {
        removed_elements.push_back(std::move(removed_element));
    }

    return reply(RESPEncoder::array(removed_elements));
}

ExecResult CommandHandler::handleBLPOP(const std::vector<std::string_view>& args) {
    return blockingPop(args, "blpop", false);
}

ExecResult CommandHandler::handleBRPOP(const std::vector<std::string_view>& args) {
    return blockingPop(args, "brpop", true);
}

/**
 * ----------------------------------------------------
 * blockingPop  (BLPOP / BRPOP)
 * ----------------------------------------------------
 * RESP command: BLPOP <list> <timeout_seconds>
 *
 * Timeout:
 *   Decimal seconds ("0.1" allowed). 0 blocks indefinitely.
 *
 * Return Format:
 *   Immediately, or later through the ReplySink:
 *      1) list name
 *      2) popped element
 *   "$-1\r\n" once the timeout has passed.
*/
ExecResult CommandHandler::blockingPop(const std::vector<std::string_view>& args,
                                       const char* command, bool pop_back) {
    if (args.size() != 3)
        return wrongArgs(command);

    double timeout_sec;
    if (!parseTimeoutSeconds(args[2], timeout_sec))
        return error("ERR timeout is not a float or out of range");
    if (timeout_sec < 0.0)
        return error("ERR timeout is negative");

    double timeout_ms = std::ceil(timeout_sec * 1000.0);
    if (timeout_ms > 1e15)
        return error("ERR timeout is out of range");

    std::string list_name = std::string(args[1]);

    List* existing = store.findList(list_name);
    if (existing && !existing->Empty()) {
        std::string value;
        if (pop_back)
            existing->PopBack(value);
        else
            existing->PopFront(value);
        return reply(RESPEncoder::array({ list_name, value }));
    }

    if (isBlocked(client_fd))
        return error("ERR client is already blocked");

    // Empty or missing list → park this client
    uint64_t waiter_id = next_waiter_id++;
    TimerId timer = 0;

    if (timeout_ms > 0.0) {
        uint64_t deadline = current_time_ms() + static_cast<uint64_t>(timeout_ms);
        timer = store.timers.scheduleWaiterTimeout(deadline, waiter_id);
    }

    store.getOrCreateList(list_name).AddWaiter(waiter_id);
    blockedClients.emplace(waiter_id,
                           BlockedClient{ waiter_id, client_fd, list_name, pop_back, timer });
    waiterByClient[client_fd] = waiter_id;

    Logger::debug("client fd=" + std::to_string(client_fd) + " blocked on '" + list_name + "'");

    // No response now; it comes from maybeWakeBlockedClients or expireWaiter.
    return ExecResult("", true);
}

/**
 * ----------------------------------------------------
 * maybeWakeBlockedClients
 * ----------------------------------------------------
 * Called after RPUSH/LPUSH. Serves waiters in FIFO order, one
 * element each, until the list or the queue runs out. Remaining
 * waiters stay parked.
*/
void CommandHandler::maybeWakeBlockedClients(const std::string& list_name) {
    List* list = store.findList(list_name);
    if (!list)
        return;

    while (list->HasWaiters() && !list->Empty()) {
        uint64_t waiter_id = list->FrontWaiter();
        list->PopWaiter();

        std::optional<BlockedClient> waiter = takeWaiter(waiter_id);
        if (!waiter)
            continue;

        std::string value;
        if (waiter->pop_back)
            list->PopBack(value);
        else
            list->PopFront(value);

        Logger::debug("waking client fd=" + std::to_string(waiter->fd) + " on '" + list_name + "'");
        sink.deliver(waiter->fd, RESPEncoder::array({ list_name, value }));
    }
}

std::optional<BlockedClient> CommandHandler::takeWaiter(uint64_t waiter_id) {
    auto it = blockedClients.find(waiter_id);
    if (it == blockedClients.end())
        return std::nullopt;

    BlockedClient waiter = std::move(it->second);
    blockedClients.erase(it);

    if (waiter.timer != 0)
        store.timers.cancel(waiter.timer);

    auto by_fd = waiterByClient.find(waiter.fd);
    if (by_fd != waiterByClient.end() && by_fd->second == waiter_id)
        waiterByClient.erase(by_fd);

    return waiter;
}

void CommandHandler::expireWaiter(uint64_t waiter_id) {
    std::optional<BlockedClient> waiter = takeWaiter(waiter_id);
    if (!waiter)
        return;

    if (List* list = store.findList(waiter->list_name))
        list->RemoveWaiter(waiter_id);

    Logger::debug("client fd=" + std::to_string(waiter->fd) + " timed out on '" +
                  waiter->list_name + "'");
    sink.deliver(waiter->fd, RESPEncoder::nullBulk());
}

void CommandHandler::dropClient(int fd) {
    auto it = waiterByClient.find(fd);
    if (it == waiterByClient.end())
        return;

    uint64_t waiter_id = it->second;
    std::optional<BlockedClient> waiter = takeWaiter(waiter_id);
    if (!waiter)
        return;

    if (List* list = store.findList(waiter->list_name))
        list->RemoveWaiter(waiter_id);
}
