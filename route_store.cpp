/* route_store.cpp - record of routes handed to the configuration action
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
#include <fmt/format.h>
#include "route_store.hpp"
#include "prefix6.hpp"

using baia6 = boost::asio::ip::address_v6;

std::string route_key::prefix_string() const
{
    return format_prefix(prefix, prefix_length);
}

std::string route_key::to_string() const
{
    return fmt::format("{} via {}", prefix_string(), router.to_string());
}

boost::optional<route_state> RouteStore::lookup(const route_key &key) const
{
    auto f = records_.find(key);
    if (f == records_.end())
        return boost::none;
    return f->second;
}

void RouteStore::record_pending(const route_key &key)
{
    records_.emplace(key, route_state::pending);
}

void RouteStore::mark_configured(const route_key &key)
{
    auto f = records_.find(key);
    if (f == records_.end())
        throw std::out_of_range(fmt::format("no record for route {}", key.to_string()));
    f->second = route_state::configured;
    prefix_routers_[std::make_pair(key.prefix, key.prefix_length)] = key.router;
}

boost::optional<baia6> RouteStore::configured_router(const baia6 &prefix, uint8_t pl) const
{
    auto f = prefix_routers_.find(std::make_pair(prefix, pl));
    if (f == prefix_routers_.end())
        return boost::none;
    return f->second;
}
