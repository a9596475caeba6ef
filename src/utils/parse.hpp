#pragma once
#include <cstdint>
#include <string_view>

// Non-throwing parsers for client-supplied numeric arguments.
// All of them reject empty input, surrounding whitespace and trailing garbage.

bool parseInteger(std::string_view s, long long& out);

bool parseUnsigned(std::string_view s, uint64_t& out);

// Seconds as a decimal number ("0", "1.5", ".1"). Rejects nan/inf.
bool parseTimeoutSeconds(std::string_view s, double& out);
