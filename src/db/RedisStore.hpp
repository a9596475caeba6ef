#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "List.hpp"
#include "Stream.hpp"
#include "TimerRegistry.hpp"
#include "../types/RedisType.hpp"

// A string value and, for SET ... PX/EX, its absolute deadline
// (steady clock ms) plus the timer that will actively evict it.
struct StringEntry {
    std::string value;
    std::optional<uint64_t> deadline_ms;
    TimerId expiry_timer = 0;
};

// Central in-memory storage: three independent keyspaces plus the
// registry of every pending deadline (key expiry and blocking timeouts).
//
// A key name may exist in several keyspaces at once; typeOf() reports
// the first match in the order list → string → stream.
class RedisStore {
public:
    std::unordered_map<std::string, StringEntry> strings;
    std::unordered_map<std::string, List> lists;
    std::unordered_map<std::string, Stream> streams;

    TimerRegistry timers;

    // --- STRING API ---

    // SET key value  (drops any previous deadline)
    void setString(const std::string& key, const std::string& value);

    // SET key value PX ttl_ms
    void setString(const std::string& key,
                   const std::string& value,
                   uint64_t ttl_ms);

    // GET key
    // Returns true if a non-expired string exists. An expired entry is
    // evicted as part of the same call.
    bool getString(const std::string& key, std::string& out);
    bool getString(const std::string& key, std::string& out, uint64_t now_ms);

    // Called when an EXPIRE_STRING_KEY timer fires. Evicts the key only
    // if its current deadline has passed; returns true if it was evicted.
    bool expireIfDue(const std::string& key, uint64_t now_ms);

    // --- LIST API ---

    // Returns the list at "key", creating an empty one if necessary.
    List& getOrCreateList(const std::string& key);

    // nullptr if no list exists at "key".
    List* findList(const std::string& key);

    // --- STREAM API ---
    Stream& getOrCreateStream(const std::string& key);
    Stream* findStream(const std::string& key);

    // TYPE key. Empty lists (kept alive for their waiters) count as absent.
    RedisType typeOf(const std::string& key);
    RedisType typeOf(const std::string& key, uint64_t now_ms);

private:
    void storeString(const std::string& key,
                     const std::string& value,
                     std::optional<uint64_t> deadline_ms);

    // Lazy expiry. Returns true if the key is present and still valid.
    bool ensureNotExpired(const std::string& key, uint64_t now_ms);
};
