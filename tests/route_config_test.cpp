#include <memory>
#include <stdlib.h>
#include <gtest/gtest.h>
#include "route_config.hpp"
#include "nlsocket.hpp"
#include "ra6_packet.hpp"

using test::a6;

static route_key sample_key()
{
    return route_key(a6("fd00:1234:5678::"), 64, a6("fe80::1"));
}

TEST(CommandRouteConfigurator, PassesParametersInEnvironment)
{
    CommandRouteConfigurator c({ "/bin/sh", "-c", "echo \"$PREFIX $ROUTER $IFACE\"" });
    auto r = c.configure(sample_key(), "wpan0");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.exit_status, 0);
    EXPECT_EQ(r.output, "fd00:1234:5678::/64 fe80::1 wpan0\n");
}

TEST(CommandRouteConfigurator, InheritedParametersAreReplaced)
{
    setenv("PREFIX", "2001:db8::/32", 1);
    CommandRouteConfigurator c({ "/bin/sh", "-c", "echo \"$PREFIX\"" });
    auto r = c.configure(sample_key(), "eth0");
    unsetenv("PREFIX");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, "fd00:1234:5678::/64\n");
}

TEST(CommandRouteConfigurator, NonZeroExitIsFailure)
{
    CommandRouteConfigurator c({ "/bin/sh", "-c", "echo 'no route' >&2; exit 3" });
    auto r = c.configure(sample_key(), "eth0");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.exit_status, 3);
    EXPECT_EQ(r.output, "no route\n");
}

TEST(CommandRouteConfigurator, MissingCommandIsFailure)
{
    CommandRouteConfigurator c({ "/nonexistent/ularoute-configure" });
    auto r = c.configure(sample_key(), "eth0");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.exit_status, 127);
    EXPECT_NE(r.output.find("/nonexistent/ularoute-configure"), std::string::npos);
}

TEST(CommandRouteConfigurator, EmptyCommandIsFailure)
{
    CommandRouteConfigurator c({});
    auto r = c.configure(sample_key(), "eth0");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.exit_status, -1);
}

TEST(CommandRouteConfigurator, NetlinkSocketIsNotInherited)
{
    boost::asio::io_service io_service;
    std::unique_ptr<NLSocket> nl;
    try {
        nl = std::make_unique<NLSocket>(io_service);
    } catch (const boost::system::system_error &e) {
        GTEST_SKIP() << "no rtnetlink: " << e.what();
    }
    CommandRouteConfigurator c({ "/bin/sh", "-c",
        "for f in /proc/$$/fd/*; do n=${f##*/}; "
        "if [ \"$n\" -gt 2 ]; then readlink \"$f\"; fi; done; true" });
    auto r = c.configure(sample_key(), "eth0");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output.find("socket:"), std::string::npos) << r.output;
}
