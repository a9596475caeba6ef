#include "./CommandHandler.hpp"

#include "../protocol/RESPEncoder.hpp"
#include "../utils/time.hpp"

/**
 * ----------------------------------------------------
 * handleXADD
 * ----------------------------------------------------
 * RESP command: XADD <stream> <id> <field> <value> [field value ...]
 *
 * <id> is "ms-seq", "ms-*" or "*". The id is resolved against the
 * stream's last entry before anything is written, so a rejected id
 * leaves the keyspace untouched (no empty stream is created).
 *
 * Return:
 *   Bulk string with the id actually used, or an error.
 */
ExecResult CommandHandler::handleXADD(const std::vector<std::string_view>& args) {
    if (args.size() < 5 || ((args.size() - 3) % 2) != 0)
        return wrongArgs("xadd");

    std::string stream_name = std::string(args[1]);

    StreamIdRequest req = Stream::parseIdRequest(args[2]);
    if (req.type == StreamIdType::INVALID)
        return error(Stream::ERR_INVALID_ID);

    Stream* existing = store.findStream(stream_name);
    Stream empty_stream;
    const Stream& current = existing ? *existing : empty_stream;

    StreamEntryId id;
    std::string err;
    if (!current.resolveId(req, unix_time_ms(), id, err))
        return error(err);

    std::vector<std::pair<std::string, std::string>> fields;
    fields.reserve((args.size() - 3) / 2);

    for (size_t i = 3; i < args.size(); i += 2) {
        fields.emplace_back(std::string(args[i]), std::string(args[i + 1]));
    }

    store.getOrCreateStream(stream_name).append(id, std::move(fields));

    return reply(RESPEncoder::bulkString(id.toString()));
}
