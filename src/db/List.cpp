#include "List.hpp"

#include <algorithm>

bool List::Empty() const {
    return list.empty();
}

int List::Len() const {
    return static_cast<int>(list.size());
}

int List::PushFront(std::string element) {
    list.push_front(std::move(element));
    return Len();
}

int List::PushBack(std::string element) {
    list.push_back(std::move(element));
    return Len();
}

bool List::PopFront(std::string& out) {
    if (list.empty())
        return false;

    out = std::move(list.front());
    list.pop_front();
    return true;
}

bool List::PopBack(std::string& out) {
    if (list.empty())
        return false;

    out = std::move(list.back());
    list.pop_back();
    return true;
}

std::vector<std::string> List::GetElementsInRange(long long start, long long end) const {
    long long len = static_cast<long long>(list.size());
    if (len == 0) return {};

    if (start < 0) start = len + start;
    if (end < 0) end = len + end;

    if (start < 0) start = 0;
    if (end < 0) end = 0;

    if (start >= len) start = len - 1;
    if (end >= len) end = len - 1;

    if (start > end) return {};

    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(end - start + 1));

    for (long long i = start; i <= end; i++) {
        result.push_back(list[static_cast<size_t>(i)]);
    }

    return result;
}

void List::AddWaiter(uint64_t waiter_id) {
    waiters.push_back(waiter_id);
}

bool List::HasWaiters() const {
    return !waiters.empty();
}

uint64_t List::FrontWaiter() const {
    return waiters.front();
}

void List::PopWaiter() {
    waiters.pop_front();
}

bool List::RemoveWaiter(uint64_t waiter_id) {
    auto it = std::find(waiters.begin(), waiters.end(), waiter_id);
    if (it == waiters.end())
        return false;

    waiters.erase(it);
    return true;
}

std::size_t List::WaiterCount() const {
    return waiters.size();
}
