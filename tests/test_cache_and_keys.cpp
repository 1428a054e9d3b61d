#include <gtest/gtest.h>
#include <thread>
#include "KeyManager.hpp"
#include "cache_manager.hpp"

using namespace code_agent;

TEST(LRUCacheTest, EvictsTheLeastRecentlyUsedEntry) {
    LRUCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    ASSERT_TRUE(cache.get("a").has_value());   // "b" is now the oldest
    cache.set("c", 3);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(cache.get("a").value_or(-1), 1);
    EXPECT_EQ(cache.get("c").value_or(-1), 3);
}

TEST(LRUCacheTest, ExpiredEntriesAreMisses) {
    LRUCache<std::string, int> cache(4, std::chrono::seconds(0));
    cache.set("a", 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(LRUCacheTest, ZeroCapacityDisablesCaching) {
    LRUCache<std::string, int> cache(0);
    cache.set("a", 1);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("a").has_value());
}

TEST(LRUCacheTest, ContentKeySeparatesLanguageFromSource) {
    EXPECT_NE(content_key("c", "pp"), content_key("cp", "p"));
    EXPECT_EQ(content_key("python", "print(1)"), content_key("python", "print(1)"));
}

TEST(KeyManagerTest, RateLimitsRotateThenDecommission) {
    KeyManager km({"k1", "k2"}, "llama-3.1-70b-versatile");
    EXPECT_EQ(km.get_current_key(), "k1");
    EXPECT_EQ(km.get_current_model(), "llama-3.1-70b-versatile");

    km.report_rate_limit();   // k1: 1
    EXPECT_EQ(km.get_current_key(), "k2");

    km.report_rate_limit();   // k2: 1
    km.report_rate_limit();   // k1: 2
    km.report_rate_limit();   // k2: 2
    km.report_rate_limit();   // k1: 3, decommissioned
    EXPECT_EQ(km.get_active_key_count(), 1u);
    EXPECT_EQ(km.get_current_key(), "k2");
}

TEST(KeyManagerTest, EmptyPoolYieldsNoKey) {
    KeyManager km({"", ""}, "m");
    EXPECT_EQ(km.get_active_key_count(), 0u);
    EXPECT_EQ(km.get_current_key(), "");
    km.report_rate_limit();
    EXPECT_EQ(km.get_current_key(), "");
}
