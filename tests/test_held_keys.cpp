#include <gtest/gtest.h>
#include <thread>
#include <locks/held_keys.hpp>

TEST(HeldKeys, PerThread) {
    HeldKeys held;
    auto entry = held.insert("key");
    EXPECT_TRUE(held.contains("key"));
    EXPECT_EQ(held.count_current(), 1u);

    bool seen_by_other = true;
    std::thread other([&] { seen_by_other = held.contains("key"); });
    other.join();
    EXPECT_FALSE(seen_by_other);

    held.erase(entry);
    EXPECT_FALSE(held.contains("key"));
    EXPECT_EQ(held.count_current(), 0u);
}

TEST(HeldKeys, EraseFromOtherThreadRemovesInsertersEntry) {
    HeldKeys held;
    auto entry = held.insert("key");
    EXPECT_EQ(std::get<0>(entry), std::this_thread::get_id());
    EXPECT_EQ(std::get<2>(entry), "key");

    std::thread other([&] { held.erase(entry); });
    other.join();
    EXPECT_FALSE(held.contains("key"));
}
