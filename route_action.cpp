/* route_action.cpp - idempotent installation of a route via a router
 *
 * (c) 2026 The ularoute authors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * - Redistributions of source code must retain the above copyright notice,
 *   this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright notice,
 *   this list of conditions and the following disclaimer in the documentation
 *   and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <stdexcept>
#include <errno.h>
#include <string.h>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include "route_action.hpp"
#include "prefix6.hpp"

using baia6 = boost::asio::ip::address_v6;

route_request parse_route_request(const std::string &prefix,
                                  const std::string &router,
                                  const std::string &ifname)
{
    if (prefix.empty() || router.empty())
        throw std::invalid_argument("PREFIX and ROUTER must be provided");
    if (ifname.empty())
        throw std::invalid_argument("IFACE must not be empty");

    route_request rq;
    rq.ifname = ifname;
    rq.prefix_length = default_route_prefix_length;

    auto addr = prefix;
    auto slash = prefix.find('/');
    if (slash != std::string::npos) {
        addr = prefix.substr(0, slash);
        unsigned int pl;
        try {
            pl = boost::lexical_cast<unsigned int>(prefix.substr(slash + 1));
        } catch (const boost::bad_lexical_cast &) {
            throw std::invalid_argument(fmt::format("invalid prefix length in '{}'", prefix));
        }
        if (pl > 128)
            throw std::invalid_argument(fmt::format("invalid prefix length in '{}'", prefix));
        rq.prefix_length = static_cast<uint8_t>(pl);
    }

    boost::system::error_code ec;
    rq.base = baia6::from_string(addr, ec);
    if (ec)
        throw std::invalid_argument(fmt::format("invalid prefix address '{}'", addr));
    rq.router = baia6::from_string(router, ec);
    if (ec)
        throw std::invalid_argument(fmt::format("invalid router address '{}'", router));
    return rq;
}

std::vector<netroute6> stale_routes(const std::vector<netroute6> &routes,
                                    const baia6 &base)
{
    std::vector<netroute6> r;
    for (const auto &i: routes) {
        if (i.dst == base)
            r.push_back(i);
    }
    return r;
}

static bool no_such_route(int err)
{
    return err == ESRCH || err == ENOENT;
}

int install_route(RouteTable &nl, const route_request &rq, std::ostream &out)
{
    int ifindex;
    try {
        ifindex = nl.get_ifindex(rq.ifname);
    } catch (const std::out_of_range &) {
        fmt::print(out, "Error: interface {} does not exist\n", rq.ifname);
        return 1;
    }

    const auto dst = format_prefix(rq.base, rq.prefix_length);
    fmt::print(out, "Configuring route: {} via {} on interface {}\n",
               dst, rq.router.to_string(), rq.ifname);

    std::vector<netroute6> routes;
    try {
        routes = nl.get_routes6();
    } catch (const boost::system::system_error &e) {
        fmt::print(out, "Error: {}\n", e.what());
        return 1;
    }

    for (const auto &i: stale_routes(routes, rq.base)) {
        fmt::print(out, "Removing existing route {}\n", i.to_string());
        auto err = nl.del_route6(i);
        if (err && !no_such_route(err))
            fmt::print(out, "Warning: could not remove {}: {}\n",
                       i.to_string(), strerror(err));
    }

    for (auto pl: sweep_prefix_lengths) {
        netroute6 rt;
        rt.dst = mask_prefix(rq.base, pl);
        rt.dst_len = pl;
        auto err = nl.del_route6(rt);
        if (!err)
            fmt::print(out, "Removed route {}\n", rt.to_string());
        else if (!no_such_route(err))
            fmt::print(out, "Warning: could not remove {}: {}\n",
                       rt.to_string(), strerror(err));
    }

    netroute6 rt;
    rt.dst = mask_prefix(rq.base, rq.prefix_length);
    rt.dst_len = rq.prefix_length;
    rt.gateway = rq.router;
    rt.oif = ifindex;
    fmt::print(out, "Adding route to {} via {} on {}\n",
               dst, rq.router.to_string(), rq.ifname);
    auto err = nl.add_route6(rt);
    if (err) {
        fmt::print(out, "Error: failed to add route {}: {}\n",
                   rt.to_string(), strerror(err));
        return 1;
    }
    fmt::print(out, "Added route {}\n", rt.to_string());
    return 0;
}
