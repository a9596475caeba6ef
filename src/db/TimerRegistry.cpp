#include "TimerRegistry.hpp"

TimerId TimerRegistry::schedule(PendingTimer timer) {
    timer.id = next_id++;

    TimerId id = timer.id;
    uint64_t deadline = timer.deadline_ms;

    timers.emplace(Slot{deadline, id}, std::move(timer));
    deadlines[id] = deadline;
    return id;
}

TimerId TimerRegistry::scheduleExpiry(uint64_t deadline_ms, const std::string& key) {
    PendingTimer t;
    t.deadline_ms = deadline_ms;
    t.kind = TimerKind::EXPIRE_STRING_KEY;
    t.key = key;
    return schedule(std::move(t));
}

TimerId TimerRegistry::scheduleWaiterTimeout(uint64_t deadline_ms, uint64_t waiter_id) {
    PendingTimer t;
    t.deadline_ms = deadline_ms;
    t.kind = TimerKind::RESOLVE_WAITER;
    t.waiter_id = waiter_id;
    return schedule(std::move(t));
}

bool TimerRegistry::cancel(TimerId id) {
    auto it = deadlines.find(id);
    if (it == deadlines.end())
        return false;

    timers.erase(Slot{it->second, id});
    deadlines.erase(it);
    return true;
}

std::vector<PendingTimer> TimerRegistry::popDue(uint64_t now_ms) {
    std::vector<PendingTimer> due;

    while (!timers.empty()) {
        auto it = timers.begin();
        if (it->first.first > now_ms)
            break;

        deadlines.erase(it->second.id);
        due.push_back(std::move(it->second));
        timers.erase(it);
    }

    return due;
}

std::optional<uint64_t> TimerRegistry::nextDeadline() const {
    if (timers.empty())
        return std::nullopt;
    return timers.begin()->first.first;
}

std::optional<uint64_t> TimerRegistry::millisUntilNext(uint64_t now_ms) const {
    auto next = nextDeadline();
    if (!next)
        return std::nullopt;
    if (*next <= now_ms)
        return 0;
    return *next - now_ms;
}

bool TimerRegistry::contains(TimerId id) const {
    return deadlines.count(id) > 0;
}

std::size_t TimerRegistry::size() const {
    return timers.size();
}

bool TimerRegistry::empty() const {
    return timers.empty();
}
