/* ra_handler.cpp - route configuration driven by router advertisements
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

#include <set>
#include <boost/algorithm/string/trim.hpp>
#include "ra_handler.hpp"
#include "prefix6.hpp"
#include "log.hpp"

namespace ba = boost::asio;

RouteHandler::RouteHandler(RouteStore &store, RouteConfigurator &configurator,
                           const std::string &ifname, bool log_ignored)
    : store_(store), configurator_(configurator), ifname_(ifname),
      log_ignored_(log_ignored)
{}

void RouteHandler::process_packet(std::istream &is, std::size_t len,
                                  const ba::ip::address_v6 &source)
{
    auto r = decode_ra6(is, len, source);
    if (!r.have_advert()) {
        log_warning("Dropping ICMPv6 packet (len={}) from {} on {}: {}",
                    len, source.to_string(), ifname_, ra6_error_str(r.error));
        return;
    }
    if (r.error != ra6_error::none) {
        log_warning("Router Advertisement from {} on {}: {} at offset {}; "
                    "ignoring the rest of the packet ({} options recovered)",
                    source.to_string(), ifname_, ra6_error_str(r.error),
                    r.error_offset, r.advert.options.size());
    }
    process_advert(r.advert);
}

void RouteHandler::process_advert(const ra6_advert &advert)
{
    log_line("Router Advertisement from {} on {}", advert.source.to_string(), ifname_);
    log_debug("  hoplimit={} managed={} other={} router_lifetime={} "
              "reachable_time={} retransmit_timer={}",
              advert.hoplimit, advert.managed_addresses, advert.other_stateful,
              advert.router_lifetime, advert.reachable_time,
              advert.retransmit_timer);

    // A router may announce the same prefix as both a PIO and a RIO.
    std::set<route_key> seen;
    for (const auto &opt: advert.options) {
        if (auto pi = boost::get<ra6_prefix_info>(&opt)) {
            log_line("  Prefix: {}", format_prefix(pi->prefix, pi->prefix_length));
            route_key key(pi->prefix, pi->prefix_length, advert.source);
            if (seen.insert(key).second)
                process_route(key, "prefix");
        } else if (auto ri = boost::get<ra6_route_info>(&opt)) {
            log_line("  Route: {}", format_prefix(ri->prefix, ri->prefix_length));
            route_key key(ri->prefix, ri->prefix_length, advert.source);
            if (seen.insert(key).second)
                process_route(key, "route");
        } else if (auto oo = boost::get<ra6_other_opt>(&opt)) {
            log_debug("  Skipping option type {} (len={})", oo->type, 8 * oo->length);
        }
    }
}

void RouteHandler::process_route(const route_key &key, const char *kind)
{
    if (!is_ula_prefix(key.prefix, key.prefix_length)) {
        if (log_ignored_)
            log_line("Ignoring non-ULA {} {} on {}", kind, key.to_string(), ifname_);
        return;
    }

    auto state = store_.lookup(key);
    if (state && *state == route_state::configured) {
        log_line("Route already configured: {} on {}", key.to_string(), ifname_);
        return;
    }
    if (!state) {
        store_.record_pending(key);
        auto prev = store_.configured_router(key.prefix, key.prefix_length);
        if (prev && *prev != key.router)
            log_line("Updating route: {} on {} (previous router: {})",
                     key.to_string(), ifname_, prev->to_string());
        else
            log_line("Configuring new route: {} on {}", key.to_string(), ifname_);
    } else {
        log_line("Retrying route configuration: {} on {}", key.to_string(), ifname_);
    }

    auto res = configurator_.configure(key, ifname_);
    auto output = boost::algorithm::trim_right_copy(res.output);
    if (res.success) {
        store_.mark_configured(key);
        log_line("Configured route {} on {}: {}", key.to_string(), ifname_, output);
    } else {
        log_error("Failed to configure route {} on {} (exit status {}): {}",
                  key.to_string(), ifname_, res.exit_status, output);
    }
}
