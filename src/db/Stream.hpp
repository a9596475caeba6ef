#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
------------------------------------------------------------------------------
  STREAM ID TYPES (as accepted by XADD)
------------------------------------------------------------------------------

1) EXPLICIT        "1526919030474-0"
     Both parts given. Must be strictly greater than the last entry.

2) AUTO_SEQUENCE   "1526919030474-*"
     Timestamp fixed, sequence chosen by the server:
        - same ms as last entry → last_seq + 1
        - larger ms             → 0

3) AUTO_GENERATED  "*"
     Timestamp = current Unix ms (never below the last entry's ms),
     sequence chosen as in AUTO_SEQUENCE.

4) INVALID
     Anything else, including numbers that do not fit in 64 bits.
------------------------------------------------------------------------------
*/
enum class StreamIdType {
    EXPLICIT,
    AUTO_SEQUENCE,
    AUTO_GENERATED,
    INVALID
};

struct StreamEntryId {
    uint64_t ms = 0;
    uint64_t seq = 0;

    std::string toString() const;

    bool operator<(const StreamEntryId& o) const {
        return ms < o.ms || (ms == o.ms && seq < o.seq);
    }
    bool operator==(const StreamEntryId& o) const {
        return ms == o.ms && seq == o.seq;
    }
    bool operator!=(const StreamEntryId& o) const { return !(*this == o); }
    bool operator<=(const StreamEntryId& o) const { return !(o < *this); }
    bool operator>(const StreamEntryId& o) const { return o < *this; }
};

/*
 * A user-supplied id after syntax checking. `seq` is empty for
 * "<ms>-*"; `ms` is empty for "*".
 */
struct StreamIdRequest {
    StreamIdType type = StreamIdType::INVALID;
    std::optional<uint64_t> ms;
    std::optional<uint64_t> seq;
};

struct StreamEntry {
    StreamEntryId id;
    std::vector<std::pair<std::string, std::string>> fields;
};

/*
------------------------------------------------------------------------------
  STREAM
------------------------------------------------------------------------------

  Append-only sequence of entries with strictly increasing ids.
  Entries are never modified once appended.

  The empty stream behaves as if its last id were 0-0, so the first
  real entry has to be greater than 0-0.
------------------------------------------------------------------------------
*/
class Stream {
private:
    std::vector<StreamEntry> entries;

public:
    static constexpr const char* ERR_EQUAL_OR_SMALLER =
        "ERR The ID specified in XADD is equal or smaller than the target stream top item";
    static constexpr const char* ERR_ZERO_ID =
        "ERR The ID specified in XADD must be greater than 0-0";
    static constexpr const char* ERR_INVALID_ID =
        "ERR Invalid stream ID specified as stream command argument";

    // Classifies and parses an XADD id argument.
    static StreamIdRequest parseIdRequest(std::string_view id);

    // Convenience wrapper around parseIdRequest().type
    static StreamIdType returnStreamType(std::string_view id);

    /**
     * Computes the id of a new entry following `last`.
     *
     *   ms <  last.ms           → reject (ERR_EQUAL_OR_SMALLER)
     *   ms == last.ms, no seq   → last.seq + 1
     *   ms == last.ms, 0-0      → reject (ERR_ZERO_ID)
     *   ms == last.ms, seq      → accept if seq > last.seq, else reject
     *   ms >  last.ms           → accept, seq defaults to 0
     *
     * On rejection returns false and puts the error text (without
     * the leading '-') in `err`.
     */
    static bool generateEntryId(const StreamEntryId& last,
                                uint64_t ms,
                                std::optional<uint64_t> seq,
                                StreamEntryId& out,
                                std::string& err);

    // Id of the newest entry, or 0-0 for an empty stream.
    StreamEntryId lastId() const;

    /**
     * Resolves a parsed request against this stream's last id.
     * AUTO_GENERATED uses `now_unix_ms` as the timestamp.
     */
    bool resolveId(const StreamIdRequest& req, uint64_t now_unix_ms,
                   StreamEntryId& out, std::string& err) const;

    // Appends an entry whose id was produced by resolveId().
    void append(const StreamEntryId& id,
                std::vector<std::pair<std::string, std::string>> fields);

    const StreamEntry* getById(const StreamEntryId& id) const;

    std::size_t size() const;
    bool empty() const;
};
