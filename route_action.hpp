#ifndef ULAROUTE_ROUTE_ACTION_HPP_
#define ULAROUTE_ROUTE_ACTION_HPP_

#include <array>
#include <string>
#include <vector>
#include <ostream>
#include <stdint.h>
#include <boost/asio/ip/address_v6.hpp>
#include "nlsocket.hpp"

static const uint8_t default_route_prefix_length(64);
// Lengths whose routes to the base prefix are removed before installing.
static const std::array<uint8_t, 4> sweep_prefix_lengths = {{ 64, 48, 32, 16 }};

struct route_request {
    boost::asio::ip::address_v6 base;
    boost::asio::ip::address_v6 router;
    std::string ifname;
    uint8_t prefix_length;
};

// PREFIX is "addr" or "addr/len"; a missing length means /64.
// Can throw std::invalid_argument
route_request parse_route_request(const std::string &prefix,
                                  const std::string &router,
                                  const std::string &ifname);

// Routes whose destination address is base, whatever their length.
std::vector<netroute6> stale_routes(const std::vector<netroute6> &routes,
                                    const boost::asio::ip::address_v6 &base);

// Removes old routes to rq.base and installs rq.base/len via rq.router.
// Progress is written to out.  Returns a process exit status.
int install_route(RouteTable &nl, const route_request &rq, std::ostream &out);

#endif

