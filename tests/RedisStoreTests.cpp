#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "../src/db/RedisStore.hpp"
#include "../src/utils/time.hpp"

TEST(RedisStoreTest, SetAndGetStringValue) {
    RedisStore store;
    store.setString("foo", "bar");

    std::string out;
    EXPECT_TRUE(store.getString("foo", out));
    EXPECT_EQ("bar", out);
}

TEST(RedisStoreTest, SetWithTtlExpiresLazily) {
    RedisStore store;
    store.setString("temp", "value", 5);

    std::this_thread::sleep_for(std::chrono::milliseconds(15));

    std::string out;
    EXPECT_FALSE(store.getString("temp", out));
    EXPECT_EQ(0u, store.strings.count("temp"));
    // eviction also drops the pending expiry timer
    EXPECT_TRUE(store.timers.empty());
}

TEST(RedisStoreTest, SetOverwritesAndReplacesDeadline) {
    RedisStore store;
    store.setString("k", "first", 10);
    ASSERT_EQ(1u, store.timers.size());

    store.setString("k", "second");
    EXPECT_TRUE(store.timers.empty());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    std::string out;
    EXPECT_TRUE(store.getString("k", out));
    EXPECT_EQ("second", out);
}

TEST(RedisStoreTest, NewTtlCancelsPreviousTimer) {
    RedisStore store;
    store.setString("k", "a", 100000);
    TimerId first = store.strings["k"].expiry_timer;

    store.setString("k", "b", 200000);
    TimerId second = store.strings["k"].expiry_timer;

    EXPECT_NE(first, second);
    EXPECT_FALSE(store.timers.contains(first));
    EXPECT_TRUE(store.timers.contains(second));
    EXPECT_EQ(1u, store.timers.size());
}

TEST(RedisStoreTest, ExpireIfDueOnlyEvictsPastDeadline) {
    RedisStore store;
    store.setString("k", "v", 1000);
    uint64_t deadline = *store.strings["k"].deadline_ms;

    EXPECT_FALSE(store.expireIfDue("k", deadline - 1));
    EXPECT_TRUE(store.expireIfDue("k", deadline));
    EXPECT_EQ(0u, store.strings.count("k"));

    store.setString("plain", "v");
    EXPECT_FALSE(store.expireIfDue("plain", deadline + 1000000));
    EXPECT_FALSE(store.expireIfDue("missing", deadline));
}

TEST(RedisStoreTest, TypePrecedenceIsListStringStream) {
    RedisStore store;
    EXPECT_EQ(RedisType::NONE, store.typeOf("k"));

    store.getOrCreateStream("k").append(StreamEntryId{1, 1}, {{"f", "v"}});
    EXPECT_EQ(RedisType::STREAM, store.typeOf("k"));

    store.setString("k", "v");
    EXPECT_EQ(RedisType::STRING, store.typeOf("k"));

    store.getOrCreateList("k").PushBack("x");
    EXPECT_EQ(RedisType::LIST, store.typeOf("k"));
}

TEST(RedisStoreTest, EmptyListsAndExpiredStringsAreNone) {
    RedisStore store;
    store.getOrCreateList("waiting");
    EXPECT_EQ(RedisType::NONE, store.typeOf("waiting"));

    store.setString("s", "v", 1000);
    uint64_t deadline = *store.strings["s"].deadline_ms;
    EXPECT_EQ(RedisType::STRING, store.typeOf("s", deadline - 1));
    EXPECT_EQ(RedisType::NONE, store.typeOf("s", deadline));
}
