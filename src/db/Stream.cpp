#include "./Stream.hpp"

#include <algorithm>
#include <limits>

#include "../utils/parse.hpp"

std::string StreamEntryId::toString() const {
    return std::to_string(ms) + "-" + std::to_string(seq);
}

/*
===============================================================================
  parseIdRequest()
-------------------------------------------------------------------------------
  "*"          → AUTO_GENERATED
  "<ms>-*"     → AUTO_SEQUENCE   (ms parsed)
  "<ms>-<seq>" → EXPLICIT        (both parsed)
  otherwise    → INVALID
===============================================================================
*/
StreamIdRequest Stream::parseIdRequest(std::string_view id)
{
    StreamIdRequest req;

    if (id == "*") {
        req.type = StreamIdType::AUTO_GENERATED;
        return req;
    }

    size_t pos = id.find('-');
    if (pos == std::string_view::npos)
        return req;

    std::string_view left = id.substr(0, pos);
    std::string_view right = id.substr(pos + 1);

    uint64_t ms;
    if (!parseUnsigned(left, ms))
        return req;

    if (right == "*") {
        req.type = StreamIdType::AUTO_SEQUENCE;
        req.ms = ms;
        return req;
    }

    uint64_t seq;
    if (!parseUnsigned(right, seq))
        return req;

    req.type = StreamIdType::EXPLICIT;
    req.ms = ms;
    req.seq = seq;
    return req;
}

StreamIdType Stream::returnStreamType(std::string_view id)
{
    return parseIdRequest(id).type;
}

/*
===============================================================================
  generateEntryId()
-------------------------------------------------------------------------------
  Pure function of (last, requested ms, requested seq). Keeps the stream
  strictly increasing and never hands out 0-0. An explicit 0-0 only
  reaches the "must be greater than 0-0" error when last.ms is 0;
  otherwise it is simply smaller than the top item.
===============================================================================
*/
bool Stream::generateEntryId(const StreamEntryId& last,
                             uint64_t ms,
                             std::optional<uint64_t> seq,
                             StreamEntryId& out,
                             std::string& err)
{
    if (ms < last.ms) {
        err = ERR_EQUAL_OR_SMALLER;
        return false;
    }

    if (ms == last.ms) {
        if (!seq) {
            if (last.seq == std::numeric_limits<uint64_t>::max()) {
                err = ERR_EQUAL_OR_SMALLER;
                return false;
            }
            out = StreamEntryId{ms, last.seq + 1};
            return true;
        }

        if (ms == 0 && *seq == 0) {
            err = ERR_ZERO_ID;
            return false;
        }

        if (*seq <= last.seq) {
            err = ERR_EQUAL_OR_SMALLER;
            return false;
        }

        out = StreamEntryId{ms, *seq};
        return true;
    }

    out = StreamEntryId{ms, seq.value_or(0)};
    return true;
}

StreamEntryId Stream::lastId() const
{
    if (entries.empty())
        return StreamEntryId{0, 0};
    return entries.back().id;
}

/*
===============================================================================
  resolveId()
-------------------------------------------------------------------------------
  AUTO_GENERATED never goes below the last entry's timestamp, so a wall
  clock that moved backwards still produces increasing ids
  (<last_ms>-<last_seq + 1>).
===============================================================================
*/
bool Stream::resolveId(const StreamIdRequest& req, uint64_t now_unix_ms,
                       StreamEntryId& out, std::string& err) const
{
    StreamEntryId last = lastId();

    switch (req.type) {
        case StreamIdType::EXPLICIT:
            return generateEntryId(last, *req.ms, req.seq, out, err);

        case StreamIdType::AUTO_SEQUENCE:
            return generateEntryId(last, *req.ms, std::nullopt, out, err);

        case StreamIdType::AUTO_GENERATED:
            return generateEntryId(last, std::max(now_unix_ms, last.ms),
                                   std::nullopt, out, err);

        case StreamIdType::INVALID:
            break;
    }

    err = ERR_INVALID_ID;
    return false;
}

void Stream::append(const StreamEntryId& id,
                    std::vector<std::pair<std::string, std::string>> fields)
{
    StreamEntry entry;
    entry.id = id;
    entry.fields = std::move(fields);
    entries.push_back(std::move(entry));
}

const StreamEntry* Stream::getById(const StreamEntryId& id) const
{
    auto it = std::lower_bound(entries.begin(), entries.end(), id,
                               [](const StreamEntry& e, const StreamEntryId& target) {
                                   return e.id < target;
                               });
    if (it == entries.end() || it->id != id)
        return nullptr;
    return &*it;
}

std::size_t Stream::size() const
{
    return entries.size();
}

bool Stream::empty() const
{
    return entries.empty();
}
