#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "../src/db/Stream.hpp"

namespace {

std::vector<std::pair<std::string, std::string>> fields(const std::string& v) {
    return {{"f", v}};
}

}  // namespace

TEST(StreamTest, ClassifiesStreamIdFormats) {
    EXPECT_EQ(StreamIdType::AUTO_GENERATED, Stream::returnStreamType("*"));
    EXPECT_EQ(StreamIdType::EXPLICIT, Stream::returnStreamType("1-0"));
    EXPECT_EQ(StreamIdType::AUTO_SEQUENCE, Stream::returnStreamType("1-*"));
    EXPECT_EQ(StreamIdType::INVALID, Stream::returnStreamType("abc"));
    EXPECT_EQ(StreamIdType::INVALID, Stream::returnStreamType("1"));
    EXPECT_EQ(StreamIdType::INVALID, Stream::returnStreamType("-1-0"));
    EXPECT_EQ(StreamIdType::INVALID, Stream::returnStreamType("*-1"));
    EXPECT_EQ(StreamIdType::INVALID, Stream::returnStreamType("99999999999999999999-0"));
}

TEST(StreamTest, GenerateEntryIdFollowsOrderingRules) {
    StreamEntryId out;
    std::string err;
    StreamEntryId last{5, 1};

    // smaller ms
    EXPECT_FALSE(Stream::generateEntryId(last, 4, 9, out, err));
    EXPECT_EQ(Stream::ERR_EQUAL_OR_SMALLER, err);

    // same ms, auto sequence
    ASSERT_TRUE(Stream::generateEntryId(last, 5, std::nullopt, out, err));
    EXPECT_EQ((StreamEntryId{5, 2}), out);

    // same ms, explicit bigger / equal / smaller
    ASSERT_TRUE(Stream::generateEntryId(last, 5, 7, out, err));
    EXPECT_EQ((StreamEntryId{5, 7}), out);
    EXPECT_FALSE(Stream::generateEntryId(last, 5, 1, out, err));
    EXPECT_FALSE(Stream::generateEntryId(last, 5, 0, out, err));

    // bigger ms, sequence defaults to 0
    ASSERT_TRUE(Stream::generateEntryId(last, 6, std::nullopt, out, err));
    EXPECT_EQ((StreamEntryId{6, 0}), out);
}

TEST(StreamTest, ZeroZeroIsReserved) {
    StreamEntryId out;
    std::string err;

    EXPECT_FALSE(Stream::generateEntryId(StreamEntryId{0, 0}, 0, 0, out, err));
    EXPECT_EQ(Stream::ERR_ZERO_ID, err);

    // top item still in millisecond 0
    EXPECT_FALSE(Stream::generateEntryId(StreamEntryId{0, 3}, 0, 0, out, err));
    EXPECT_EQ(Stream::ERR_ZERO_ID, err);

    // empty stream, "0-*" picks 0-1
    ASSERT_TRUE(Stream::generateEntryId(StreamEntryId{0, 0}, 0, std::nullopt, out, err));
    EXPECT_EQ((StreamEntryId{0, 1}), out);
}

TEST(StreamTest, ZeroZeroBelowTopItemIsEqualOrSmaller) {
    StreamEntryId out;
    std::string err;

    EXPECT_FALSE(Stream::generateEntryId(StreamEntryId{5, 1}, 0, 0, out, err));
    EXPECT_EQ(Stream::ERR_EQUAL_OR_SMALLER, err);
}

TEST(StreamTest, RejectsNonIncreasingIds) {
    Stream stream;
    StreamEntryId id;
    std::string err;

    ASSERT_TRUE(stream.resolveId(Stream::parseIdRequest("1-0"), 0, id, err));
    stream.append(id, fields("1"));

    EXPECT_FALSE(stream.resolveId(Stream::parseIdRequest("1-0"), 0, id, err));
    EXPECT_EQ(Stream::ERR_EQUAL_OR_SMALLER, err);
    EXPECT_EQ(1u, stream.size());
}

TEST(StreamTest, AutoSequenceFillsMissingSequence) {
    Stream stream;
    stream.append(StreamEntryId{5, 0}, fields("a"));

    StreamEntryId id;
    std::string err;
    ASSERT_TRUE(stream.resolveId(Stream::parseIdRequest("5-*"), 0, id, err));
    EXPECT_EQ("5-1", id.toString());
}

TEST(StreamTest, AutoGeneratedIdUsesClockButStaysMonotonic) {
    Stream stream;
    StreamEntryId id;
    std::string err;

    ASSERT_TRUE(stream.resolveId(Stream::parseIdRequest("*"), 1000, id, err));
    EXPECT_EQ((StreamEntryId{1000, 0}), id);
    stream.append(id, fields("x"));

    // same millisecond
    ASSERT_TRUE(stream.resolveId(Stream::parseIdRequest("*"), 1000, id, err));
    EXPECT_EQ((StreamEntryId{1000, 1}), id);
    stream.append(id, fields("y"));

    // clock moved backwards
    ASSERT_TRUE(stream.resolveId(Stream::parseIdRequest("*"), 900, id, err));
    EXPECT_EQ((StreamEntryId{1000, 2}), id);
}

TEST(StreamTest, LastIdAndLookup) {
    Stream stream;
    EXPECT_EQ((StreamEntryId{0, 0}), stream.lastId());

    stream.append(StreamEntryId{1, 0}, fields("a"));
    stream.append(StreamEntryId{2, 5}, fields("b"));
    stream.append(StreamEntryId{3, 0}, fields("c"));

    EXPECT_EQ((StreamEntryId{3, 0}), stream.lastId());

    const StreamEntry* entry = stream.getById(StreamEntryId{2, 5});
    ASSERT_NE(nullptr, entry);
    EXPECT_EQ("b", entry->fields[0].second);
    EXPECT_EQ(nullptr, stream.getById(StreamEntryId{2, 0}));
}
