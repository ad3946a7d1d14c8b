#include <gtest/gtest.h>
#include "prefix6.hpp"

static boost::asio::ip::address_v6 a6(const char *s)
{
    return boost::asio::ip::address_v6::from_string(s);
}

TEST(Prefix6, MaskPrefix)
{
    EXPECT_EQ(mask_prefix(a6("fd00:1234:5678:9abc::1"), 64), a6("fd00:1234:5678:9abc::"));
    EXPECT_EQ(mask_prefix(a6("fd00:1234:5678:9abc::1"), 48), a6("fd00:1234:5678::"));
    EXPECT_EQ(mask_prefix(a6("fd00:1234:ffff::"), 36), a6("fd00:1234:f000::"));
    EXPECT_EQ(mask_prefix(a6("fdff::"), 7), a6("fc00::"));
    EXPECT_EQ(mask_prefix(a6("fd00::1"), 0), a6("::"));
    EXPECT_EQ(mask_prefix(a6("fd00::1"), 128), a6("fd00::1"));
}

TEST(Prefix6, UlaIsFdOnly)
{
    EXPECT_TRUE(is_ula_prefix(a6("fd00:1234:5678::"), 64));
    EXPECT_TRUE(is_ula_prefix(a6("fdde:ad00:beef::"), 48));
    EXPECT_TRUE(is_ula_prefix(a6("fd00::"), 8));
    EXPECT_FALSE(is_ula_prefix(a6("fc00:1234::"), 64));
    EXPECT_FALSE(is_ula_prefix(a6("fc00::"), 7));
    EXPECT_FALSE(is_ula_prefix(a6("fd00::"), 7));
    EXPECT_FALSE(is_ula_prefix(a6("2001:db8::"), 64));
    EXPECT_FALSE(is_ula_prefix(a6("fe80::"), 64));
    EXPECT_FALSE(is_ula_prefix(a6("::"), 0));
}

TEST(Prefix6, FormatPrefix)
{
    EXPECT_EQ(format_prefix(a6("fd00:1234:5678::"), 64), "fd00:1234:5678::/64");
    EXPECT_EQ(format_prefix(a6("::"), 0), "::/0");
}
