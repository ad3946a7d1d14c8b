#include <stdexcept>
#include <gtest/gtest.h>
#include "route_store.hpp"

static boost::asio::ip::address_v6 a6(const char *s)
{
    return boost::asio::ip::address_v6::from_string(s);
}

static const route_key key1(a6("fd00:1234:5678::"), 64, a6("fe80::1"));

TEST(RouteStore, UnseenKey)
{
    RouteStore store;
    EXPECT_FALSE(store.lookup(key1));
    EXPECT_EQ(store.size(), 0u);
}

TEST(RouteStore, PendingThenConfigured)
{
    RouteStore store;
    store.record_pending(key1);
    ASSERT_TRUE(store.lookup(key1));
    EXPECT_EQ(*store.lookup(key1), route_state::pending);

    store.mark_configured(key1);
    EXPECT_EQ(*store.lookup(key1), route_state::configured);

    // Recording again never moves a configured route back to pending.
    store.record_pending(key1);
    EXPECT_EQ(*store.lookup(key1), route_state::configured);
    EXPECT_EQ(store.size(), 1u);
}

TEST(RouteStore, MarkUnknownKeyThrows)
{
    RouteStore store;
    EXPECT_THROW(store.mark_configured(key1), std::out_of_range);
}

TEST(RouteStore, KeysDifferByRouterAndLength)
{
    RouteStore store;
    route_key other_router(a6("fd00:1234:5678::"), 64, a6("fe80::2"));
    route_key other_length(a6("fd00:1234:5678::"), 48, a6("fe80::1"));
    store.record_pending(key1);
    store.mark_configured(key1);
    EXPECT_FALSE(store.lookup(other_router));
    EXPECT_FALSE(store.lookup(other_length));
    EXPECT_NE(key1, other_router);
    EXPECT_EQ(key1, route_key(a6("fd00:1234:5678::"), 64, a6("fe80::1")));
}

TEST(RouteStore, ConfiguredRouterFollowsLatestSuccess)
{
    RouteStore store;
    EXPECT_FALSE(store.configured_router(key1.prefix, key1.prefix_length));
    store.record_pending(key1);
    EXPECT_FALSE(store.configured_router(key1.prefix, key1.prefix_length));
    store.mark_configured(key1);
    EXPECT_EQ(*store.configured_router(key1.prefix, 64), a6("fe80::1"));

    route_key moved(key1.prefix, 64, a6("fe80::2"));
    store.record_pending(moved);
    store.mark_configured(moved);
    EXPECT_EQ(*store.configured_router(key1.prefix, 64), a6("fe80::2"));
}

TEST(RouteKey, Text)
{
    EXPECT_EQ(key1.prefix_string(), "fd00:1234:5678::/64");
    EXPECT_EQ(key1.to_string(), "fd00:1234:5678::/64 via fe80::1");
}
