#pragma once
#include <string>
#include <utility>

// Outcome of one command. When `blocked` is true the reply is empty
// and will be delivered later through the ReplySink.
struct ExecResult {
    std::string reply;
    bool blocked;

    ExecResult(std::string r, bool b)
        : reply(std::move(r)), blocked(b) {}
};
