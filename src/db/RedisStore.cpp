#include "RedisStore.hpp"
#include "../utils/time.hpp"

// ----------------------------------------------------
// Internal: replace the value at key, cancelling the previous
// expiry timer and scheduling a new one when a deadline is given.
// ----------------------------------------------------
void RedisStore::storeString(const std::string& key,
                             const std::string& value,
                             std::optional<uint64_t> deadline_ms) {
    StringEntry& entry = strings[key];

    if (entry.expiry_timer != 0) {
        timers.cancel(entry.expiry_timer);
        entry.expiry_timer = 0;
    }

    entry.value = value;
    entry.deadline_ms = deadline_ms;

    if (deadline_ms)
        entry.expiry_timer = timers.scheduleExpiry(*deadline_ms, key);
}

// ----------------------------------------------------
// Internal: check TTL and delete key if expired.
// ----------------------------------------------------
bool RedisStore::ensureNotExpired(const std::string& key, uint64_t now_ms) {
    auto it = strings.find(key);
    if (it == strings.end())
        return false;

    const StringEntry& entry = it->second;
    if (!entry.deadline_ms || now_ms < *entry.deadline_ms)
        return true;

    // expired → remove value and its pending timer together
    if (entry.expiry_timer != 0)
        timers.cancel(entry.expiry_timer);
    strings.erase(it);
    return false;
}

// ----------------------------------------------------
// STRING: SET key value
// ----------------------------------------------------
void RedisStore::setString(const std::string& key, const std::string& value) {
    storeString(key, value, std::nullopt);
}

// ----------------------------------------------------
// STRING: SET key value PX ttl_ms
// ----------------------------------------------------
void RedisStore::setString(const std::string& key,
                           const std::string& value,
                           uint64_t ttl_ms) {
    storeString(key, value, current_time_ms() + ttl_ms);
}

// ----------------------------------------------------
// STRING: GET key
// ----------------------------------------------------
bool RedisStore::getString(const std::string& key, std::string& out) {
    return getString(key, out, current_time_ms());
}

bool RedisStore::getString(const std::string& key, std::string& out, uint64_t now_ms) {
    if (!ensureNotExpired(key, now_ms))
        return false;

    out = strings.find(key)->second.value;
    return true;
}

bool RedisStore::expireIfDue(const std::string& key, uint64_t now_ms) {
    auto it = strings.find(key);
    if (it == strings.end())
        return false;

    const StringEntry& entry = it->second;
    if (!entry.deadline_ms || now_ms < *entry.deadline_ms)
        return false;

    // The timer that called us has already left the registry; cancel
    // is a no-op for it but keeps things tidy if called directly.
    if (entry.expiry_timer != 0)
        timers.cancel(entry.expiry_timer);
    strings.erase(it);
    return true;
}

// ----------------------------------------------------
// LIST
// ----------------------------------------------------
List& RedisStore::getOrCreateList(const std::string& key) {
    return lists[key];
}

List* RedisStore::findList(const std::string& key) {
    auto it = lists.find(key);
    if (it == lists.end())
        return nullptr;
    return &it->second;
}

// ----------------------------------------------------
// STREAM
// ----------------------------------------------------
Stream& RedisStore::getOrCreateStream(const std::string& key) {
    return streams[key];
}

Stream* RedisStore::findStream(const std::string& key) {
    auto it = streams.find(key);
    if (it == streams.end())
        return nullptr;
    return &it->second;
}

// ----------------------------------------------------
// TYPE: list → string → stream → none
// ----------------------------------------------------
RedisType RedisStore::typeOf(const std::string& key) {
    return typeOf(key, current_time_ms());
}

RedisType RedisStore::typeOf(const std::string& key, uint64_t now_ms) {
    List* list = findList(key);
    if (list && !list->Empty())
        return RedisType::LIST;

    if (ensureNotExpired(key, now_ms))
        return RedisType::STRING;

    Stream* stream = findStream(key);
    if (stream && !stream->empty())
        return RedisType::STREAM;

    return RedisType::NONE;
}
