#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../src/db/List.hpp"

namespace {

List makeList(std::initializer_list<const char*> items) {
    List list;
    for (auto item : items)
        list.PushBack(item);
    return list;
}

}  // namespace

TEST(ListTest, PushBackAndRange) {
    List list = makeList({"one", "two", "three"});

    auto elements = list.GetElementsInRange(0, 2);
    ASSERT_EQ(3u, elements.size());
    EXPECT_EQ("one", elements[0]);
    EXPECT_EQ("two", elements[1]);
    EXPECT_EQ("three", elements[2]);
}

TEST(ListTest, SupportsNegativeIndices) {
    List list = makeList({"a", "b", "c", "d"});

    auto elements = list.GetElementsInRange(-3, -1);
    ASSERT_EQ(3u, elements.size());
    EXPECT_EQ("b", elements[0]);
    EXPECT_EQ("c", elements[1]);
    EXPECT_EQ("d", elements[2]);
}

TEST(ListTest, ClampsOutOfRangeBounds) {
    List list = makeList({"a", "b", "c"});

    EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), list.GetElementsInRange(-100, -1));
    EXPECT_EQ((std::vector<std::string>{"b", "c"}), list.GetElementsInRange(1, 100));
    EXPECT_EQ((std::vector<std::string>{"c"}), list.GetElementsInRange(3, 10));
    EXPECT_EQ((std::vector<std::string>{"c"}), list.GetElementsInRange(100, -1));
    EXPECT_TRUE(list.GetElementsInRange(2, 1).empty());
    EXPECT_TRUE(List().GetElementsInRange(0, -1).empty());
}

TEST(ListTest, PopOperationsHandleEmptyList) {
    List list;
    std::string out = "untouched";
    EXPECT_FALSE(list.PopFront(out));
    EXPECT_FALSE(list.PopBack(out));
    EXPECT_EQ("untouched", out);

    list.PushFront("front");
    list.PushBack("back");

    EXPECT_TRUE(list.PopFront(out));
    EXPECT_EQ("front", out);
    EXPECT_TRUE(list.PopBack(out));
    EXPECT_EQ("back", out);
    EXPECT_TRUE(list.Empty());
}

TEST(ListTest, EmptyStringIsARealElement) {
    List list;
    list.PushBack("");

    std::string out = "x";
    EXPECT_TRUE(list.PopFront(out));
    EXPECT_EQ("", out);
    EXPECT_TRUE(list.Empty());
}

TEST(ListTest, WaitersAreKeptInFifoOrder) {
    List list;
    list.AddWaiter(7);
    list.AddWaiter(3);
    list.AddWaiter(9);

    EXPECT_EQ(3u, list.WaiterCount());
    EXPECT_EQ(7u, list.FrontWaiter());

    EXPECT_TRUE(list.RemoveWaiter(3));
    EXPECT_FALSE(list.RemoveWaiter(3));

    list.PopWaiter();
    EXPECT_EQ(9u, list.FrontWaiter());
    list.PopWaiter();
    EXPECT_FALSE(list.HasWaiters());
    // waiters never count as data
    EXPECT_TRUE(list.Empty());
}
