/* ularoute-configure.cpp - install one ipv6 route via a router
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

#define ULAROUTE_VERSION "0.1"

#include <iostream>
#include <stdexcept>
#include <stdlib.h>
#include <string.h>
#include <fmt/format.h>
#include "route_action.hpp"

static std::string env_or(const char *name, const char *dflt)
{
    auto v = getenv(name);
    return v ? std::string(v) : std::string(dflt);
}

static void usage(const char *prog)
{
    fmt::print("ularoute-configure " ULAROUTE_VERSION ", install an ipv6 route for a ULA prefix.\n"
               "Usage: PREFIX=<prefix>[/<len>] ROUTER=<router> [IFACE=<interface>] {}\n",
               prog);
}

int main(int ac, char *av[])
{
    if (ac > 1 && (!strcmp(av[1], "-h") || !strcmp(av[1], "--help"))) {
        usage(av[0]);
        return EXIT_SUCCESS;
    }

    route_request rq;
    try {
        rq = parse_route_request(env_or("PREFIX", ""), env_or("ROUTER", ""),
                                 env_or("IFACE", "eth0"));
    } catch (const std::invalid_argument &e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        usage(av[0]);
        return EXIT_FAILURE;
    }

    try {
        boost::asio::io_service io_service;
        NLSocket nl(io_service);
        return install_route(nl, rq, std::cout) ? EXIT_FAILURE : EXIT_SUCCESS;
    } catch (const boost::system::system_error &e) {
        fmt::print(stderr, "Error: netlink: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
