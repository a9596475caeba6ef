#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using TimerId = uint64_t;

enum class TimerKind {
    EXPIRE_STRING_KEY,   // active expiry of a SET ... PX key
    RESOLVE_WAITER       // BLPOP/BRPOP timeout
};

/*
 * What to do when a deadline passes. Only one of `key` / `waiter_id`
 * is meaningful, depending on `kind`.
 */
struct PendingTimer {
    TimerId id = 0;
    uint64_t deadline_ms = 0;
    TimerKind kind = TimerKind::EXPIRE_STRING_KEY;
    std::string key;
    uint64_t waiter_id = 0;
};

/*
------------------------------------------------------------------------------
  TIMER REGISTRY
------------------------------------------------------------------------------

  All deadlines of the server (key expiry + blocking timeouts) in one
  structure ordered by (deadline, id). The id breaks ties so two timers
  with the same deadline fire in scheduling order.

      schedule()      O(log n)
      cancel(id)      O(log n)
      popDue(now)     O(k log n) for k due timers
      nextDeadline()  O(1)

  Cancelled timers are removed immediately; a timer handed out by
  popDue() is no longer in the registry, so it can never fire twice.
------------------------------------------------------------------------------
*/
class TimerRegistry {
public:
    TimerId scheduleExpiry(uint64_t deadline_ms, const std::string& key);
    TimerId scheduleWaiterTimeout(uint64_t deadline_ms, uint64_t waiter_id);

    // Returns false if the timer already fired or was never scheduled.
    bool cancel(TimerId id);

    // Removes and returns every timer whose deadline is <= now_ms, earliest first.
    std::vector<PendingTimer> popDue(uint64_t now_ms);

    std::optional<uint64_t> nextDeadline() const;

    // Milliseconds until the next deadline (0 if already due), or nullopt if none.
    std::optional<uint64_t> millisUntilNext(uint64_t now_ms) const;

    bool contains(TimerId id) const;
    std::size_t size() const;
    bool empty() const;

private:
    using Slot = std::pair<uint64_t, TimerId>;   // (deadline, id)

    TimerId schedule(PendingTimer timer);

    TimerId next_id = 1;
    std::map<Slot, PendingTimer> timers;
    std::unordered_map<TimerId, uint64_t> deadlines;   // id → deadline, for cancel
};
