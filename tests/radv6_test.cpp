#include <gtest/gtest.h>
#include "ra6_packet.hpp"

using test::a6;
using test::decode;
using test::ra6_packet;

TEST(DecodeRa6, HeaderFields)
{
    auto r = decode(ra6_packet().str());
    ASSERT_EQ(r.error, ra6_error::none);
    EXPECT_TRUE(r.have_advert());
    EXPECT_EQ(r.advert.source, a6("fe80::1"));
    EXPECT_EQ(r.advert.hoplimit, 64);
    EXPECT_EQ(r.advert.router_lifetime, 1800);
    EXPECT_EQ(r.advert.reachable_time, 30000u);
    EXPECT_EQ(r.advert.retransmit_timer, 1000u);
    EXPECT_TRUE(r.advert.options.empty());
}

TEST(DecodeRa6, PrefixInformation)
{
    auto r = decode(ra6_packet().prefix_info("fd00:1234:5678::", 64).str());
    ASSERT_EQ(r.error, ra6_error::none);
    ASSERT_EQ(r.advert.options.size(), 1u);
    auto pi = boost::get<ra6_prefix_info>(&r.advert.options[0]);
    ASSERT_NE(pi, nullptr);
    EXPECT_EQ(pi->prefix, a6("fd00:1234:5678::"));
    EXPECT_EQ(pi->prefix_length, 64);
    EXPECT_TRUE(pi->on_link);
    EXPECT_TRUE(pi->autonomous);
    EXPECT_EQ(pi->valid_lifetime, 2592000u);
    EXPECT_EQ(pi->preferred_lifetime, 604800u);
}

TEST(DecodeRa6, PrefixTrailingBitsAreMasked)
{
    auto r = decode(ra6_packet().prefix_info("fd00:1234:5678:ffff::1", 48).str());
    ASSERT_EQ(r.advert.options.size(), 1u);
    auto pi = boost::get<ra6_prefix_info>(&r.advert.options[0]);
    ASSERT_NE(pi, nullptr);
    EXPECT_EQ(pi->prefix, a6("fd00:1234:5678::"));
}

TEST(DecodeRa6, RouteInformationNarrowPrefixes)
{
    auto r = decode(ra6_packet()
                    .route_info("fd11:2233:4455:6677::", 64, 8)
                    .route_info("fd11:2233:4455:6677:8899::", 80, 16)
                    .route_info("::", 0, 0)
                    .str());
    ASSERT_EQ(r.error, ra6_error::none);
    ASSERT_EQ(r.advert.options.size(), 3u);

    auto ri = boost::get<ra6_route_info>(&r.advert.options[0]);
    ASSERT_NE(ri, nullptr);
    EXPECT_EQ(ri->prefix, a6("fd11:2233:4455:6677::"));
    EXPECT_EQ(ri->prefix_length, 64);
    EXPECT_EQ(ri->preference, ra6_route_pref::high);
    EXPECT_EQ(ri->route_lifetime, 1800u);

    ri = boost::get<ra6_route_info>(&r.advert.options[1]);
    ASSERT_NE(ri, nullptr);
    EXPECT_EQ(ri->prefix, a6("fd11:2233:4455:6677:8899::"));
    EXPECT_EQ(ri->prefix_length, 80);

    ri = boost::get<ra6_route_info>(&r.advert.options[2]);
    ASSERT_NE(ri, nullptr);
    EXPECT_EQ(ri->prefix, a6("::"));
    EXPECT_EQ(ri->prefix_length, 0);
}

TEST(DecodeRa6, UnknownOptionsAreSkipped)
{
    auto r = decode(ra6_packet()
                    .raw_option(1, 1)  // source link-layer address
                    .raw_option(25, 3) // RDNSS
                    .prefix_info("fd00:1::", 64)
                    .str());
    ASSERT_EQ(r.error, ra6_error::none);
    ASSERT_EQ(r.advert.options.size(), 3u);
    auto oo = boost::get<ra6_other_opt>(&r.advert.options[1]);
    ASSERT_NE(oo, nullptr);
    EXPECT_EQ(oo->type, 25);
    EXPECT_EQ(oo->length, 3);
    EXPECT_NE(boost::get<ra6_prefix_info>(&r.advert.options[2]), nullptr);
}

TEST(DecodeRa6, NotRouterAdvertisement)
{
    auto pkt = ra6_packet().prefix_info("fd00:1::", 64).str();
    pkt[0] = static_cast<char>(icmp6_type_router_solicit);
    auto r = decode(pkt);
    EXPECT_EQ(r.error, ra6_error::not_router_advert);
    EXPECT_FALSE(r.have_advert());
    EXPECT_TRUE(r.advert.options.empty());
}

TEST(DecodeRa6, NonZeroCodeIsDiscarded)
{
    auto pkt = ra6_packet().prefix_info("fd00:1::", 64).str();
    pkt[1] = 1;
    std::istringstream is(pkt + "next");
    auto r = decode_ra6(is, pkt.size(), a6("fe80::1"));
    EXPECT_EQ(r.error, ra6_error::bad_icmp_code);
    EXPECT_EQ(r.error_offset, 1u);
    EXPECT_FALSE(r.have_advert());
    EXPECT_TRUE(r.advert.options.empty());
    std::string rest;
    is >> rest;
    EXPECT_EQ(rest, "next");
}

TEST(DecodeRa6, TruncatedHeader)
{
    auto pkt = ra6_packet().str().substr(0, 10);
    auto r = decode(pkt);
    EXPECT_EQ(r.error, ra6_error::truncated_header);
    EXPECT_FALSE(r.have_advert());

    EXPECT_EQ(decode(std::string()).error, ra6_error::truncated_header);
}

TEST(DecodeRa6, ZeroLengthOptionKeepsEarlierOptions)
{
    auto r = decode(ra6_packet()
                    .prefix_info("fd00:1::", 64)
                    .raw_option(3, 0, 6)
                    .prefix_info("fd00:2::", 64)
                    .str());
    EXPECT_EQ(r.error, ra6_error::truncated_option);
    EXPECT_TRUE(r.have_advert());
    EXPECT_EQ(r.error_offset, 16u + 32u);
    ASSERT_EQ(r.advert.options.size(), 1u);
    auto pi = boost::get<ra6_prefix_info>(&r.advert.options[0]);
    ASSERT_NE(pi, nullptr);
    EXPECT_EQ(pi->prefix, a6("fd00:1::"));
}

TEST(DecodeRa6, OptionLongerThanPacket)
{
    auto pkt = ra6_packet()
        .route_info("fd00:1::", 64)
        .prefix_info("fd00:2::", 64)
        .str();
    pkt.resize(pkt.size() - 8);
    auto r = decode(pkt);
    EXPECT_EQ(r.error, ra6_error::truncated_option);
    EXPECT_EQ(r.error_offset, 16u + 24u);
    ASSERT_EQ(r.advert.options.size(), 1u);
    EXPECT_NE(boost::get<ra6_route_info>(&r.advert.options[0]), nullptr);
}

TEST(DecodeRa6, DanglingOptionByte)
{
    auto r = decode(ra6_packet().prefix_info("fd00:1::", 64).raw_bytes(std::string(1, '\x03')).str());
    EXPECT_EQ(r.error, ra6_error::truncated_option);
    EXPECT_EQ(r.advert.options.size(), 1u);
}

TEST(DecodeRa6, ShortPrefixInformationIsMalformed)
{
    auto r = decode(ra6_packet()
                    .route_info("fd00:1::", 64)
                    .raw_option(ra6_opt_type_prefix_info, 2)
                    .prefix_info("fd00:2::", 64)
                    .str());
    EXPECT_EQ(r.error, ra6_error::malformed_option);
    EXPECT_EQ(r.advert.options.size(), 1u);
}

TEST(DecodeRa6, PrefixLengthOver128IsMalformed)
{
    auto r = decode(ra6_packet().prefix_info("fd00:1::", 129).str());
    EXPECT_EQ(r.error, ra6_error::malformed_option);
    EXPECT_TRUE(r.advert.options.empty());
}

TEST(DecodeRa6, ConsumesWholePacketOnError)
{
    auto pkt = ra6_packet()
        .prefix_info("fd00:1::", 64)
        .raw_option(3, 0, 30)
        .str();
    std::istringstream is(pkt + "next");
    auto r = decode_ra6(is, pkt.size(), a6("fe80::1"));
    EXPECT_EQ(r.error, ra6_error::truncated_option);
    std::string rest;
    is >> rest;
    EXPECT_EQ(rest, "next");
}
