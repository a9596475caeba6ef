#pragma once
#include <cstdint>
#include <string>

#include "../db/TimerRegistry.hpp"

// A BLPOP/BRPOP call parked until data arrives or its deadline passes.
struct BlockedClient {
    uint64_t id;
    int fd;
    std::string list_name;
    bool pop_back;        // BRPOP takes from the tail
    TimerId timer;        // 0 when blocking indefinitely
};
