#pragma once

#include <string>

// Result of a TYPE lookup across the three keyspaces.
enum class RedisType {NONE, STRING, LIST, STREAM};

inline std::string typeName(RedisType type) {
    switch (type) {
        case RedisType::STRING: return "string";
        case RedisType::LIST:   return "list";
        case RedisType::STREAM: return "stream";
        case RedisType::NONE:   break;
    }
    return "none";
}
