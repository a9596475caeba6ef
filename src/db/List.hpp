#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

/*
 * A list value plus the FIFO of blocked clients waiting on it.
 *
 * `waiters` only stores waiter handles (see CommandHandler's blocked
 * client table); it is never inspected for data. The oldest handle is
 * at the front and is served first when elements arrive.
 */
class List {
private:
    std::deque<std::string> list;
    std::deque<uint64_t> waiters;

public:
    bool Empty() const;
    int Len() const;

    int PushBack(std::string element);
    int PushFront(std::string element);

    // Return false (and leave `out` untouched) on an empty list.
    bool PopFront(std::string& out);
    bool PopBack(std::string& out);

    /**
     * Inclusive slice [start, end]:
     *   - negative indices count from the tail (-1 = last)
     *   - bounds are clamped into [0, len-1]
     *   - empty list, or start > end after clamping → empty
     */
    std::vector<std::string> GetElementsInRange(long long start, long long end) const;

    // --- blocked client queue ---
    void AddWaiter(uint64_t waiter_id);
    bool HasWaiters() const;
    uint64_t FrontWaiter() const;
    void PopWaiter();
    bool RemoveWaiter(uint64_t waiter_id);
    std::size_t WaiterCount() const;
};
