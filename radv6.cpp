/* radv6.cpp - ipv6 router advertisement decoding and capture
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

#include <iterator>
#include <random>
#include <algorithm>

#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/icmp6.h>
#include <sys/socket.h>

#include <boost/random/uniform_int.hpp>
#include <fmt/format.h>

#include "radv6.hpp"
#include "prefix6.hpp"
#include "ra_handler.hpp"
#include "log.hpp"

namespace ba = boost::asio;

static auto mc6_allrouters = ba::ip::address_v6::from_string("ff02::2");

const char *ra6_error_str(ra6_error e)
{
    switch (e) {
    case ra6_error::none: return "no error";
    case ra6_error::not_router_advert: return "not a router advertisement";
    case ra6_error::bad_icmp_code: return "ICMPv6 code is not 0";
    case ra6_error::truncated_header: return "truncated router advertisement header";
    case ra6_error::truncated_option: return "truncated option";
    case ra6_error::malformed_option: return "malformed option";
    }
    return "unknown error";
}

ra6_decode_result decode_ra6(std::istream &is, std::size_t len,
                             const ba::ip::address_v6 &source)
{
    ra6_decode_result r;
    r.advert.source = source;
    r.advert.reachable_time = 0;
    r.advert.retransmit_timer = 0;
    r.advert.router_lifetime = 0;
    r.advert.hoplimit = 0;
    r.advert.managed_addresses = false;
    r.advert.other_stateful = false;
    r.error = ra6_error::none;
    r.error_offset = 0;

    std::size_t bytes_left = len;
    // Consumes the rest of the packet so the caller's stream stays aligned.
    auto fail = [&](ra6_error e, std::size_t offset) {
        r.error = e;
        r.error_offset = offset;
        is.ignore(bytes_left);
        return r;
    };

    if (len == 0)
        return fail(ra6_error::truncated_header, 0);
    if (is.peek() != icmp6_type_router_advert)
        return fail(ra6_error::not_router_advert, 0);
    if (len < icmp_header::size + ra6_advert_header::size)
        return fail(ra6_error::truncated_header, 0);

    icmp_header icmp_hdr;
    ra6_advert_header ra6adv_hdr;
    is >> icmp_hdr >> ra6adv_hdr;
    if (!is)
        return fail(ra6_error::truncated_header, 0);
    bytes_left -= icmp_header::size + ra6_advert_header::size;
    if (icmp_hdr.code() != 0)
        return fail(ra6_error::bad_icmp_code, 1);

    r.advert.hoplimit = ra6adv_hdr.hoplimit();
    r.advert.managed_addresses = ra6adv_hdr.managed_addresses();
    r.advert.other_stateful = ra6adv_hdr.other_stateful();
    r.advert.router_lifetime = ra6adv_hdr.router_lifetime();
    r.advert.reachable_time = ra6adv_hdr.reachable_time();
    r.advert.retransmit_timer = ra6adv_hdr.retransmit_timer();

    while (bytes_left > 0) {
        const auto opt_offset = len - bytes_left;
        if (bytes_left < ra6_opt_header::size)
            return fail(ra6_error::truncated_option, opt_offset);
        ra6_opt_header opt;
        is >> opt;
        // Discard if any included option has a length <= 0.
        if (!is || opt.length() == 0 || opt.length_bytes() > bytes_left) {
            bytes_left -= ra6_opt_header::size;
            return fail(ra6_error::truncated_option, opt_offset);
        }
        bytes_left -= ra6_opt_header::size;
        std::size_t body_left = opt.length_bytes() - ra6_opt_header::size;

        switch (opt.type()) {
        case ra6_opt_type_prefix_info: {
            if (body_left < ra6_prefix_info_opt::size)
                return fail(ra6_error::malformed_option, opt_offset);
            ra6_prefix_info_opt pio;
            is >> pio;
            bytes_left -= ra6_prefix_info_opt::size;
            body_left -= ra6_prefix_info_opt::size;
            if (pio.prefix_length() > 128)
                return fail(ra6_error::malformed_option, opt_offset);
            ra6_prefix_info pi;
            pi.prefix_length = pio.prefix_length();
            pi.prefix = mask_prefix(pio.prefix(), pi.prefix_length);
            pi.on_link = pio.on_link();
            pi.autonomous = pio.auto_addr_cfg();
            pi.valid_lifetime = pio.valid_lifetime();
            pi.preferred_lifetime = pio.preferred_lifetime();
            r.advert.options.emplace_back(pi);
            break;
        }
        case ra6_opt_type_route_info: {
            // An 8-octet option carries no prefix at all.
            ra6_route_info_opt rio(body_left - 6);
            is >> rio;
            bytes_left -= rio.size();
            body_left -= rio.size();
            if (rio.prefix_length() > 128)
                return fail(ra6_error::malformed_option, opt_offset);
            ra6_route_info ri;
            ri.prefix_length = rio.prefix_length();
            ri.prefix = mask_prefix(rio.prefix(), ri.prefix_length);
            ri.route_lifetime = rio.route_lifetime();
            ri.preference = rio.preference();
            r.advert.options.emplace_back(ri);
            break;
        }
        default: {
            ra6_other_opt oo;
            oo.type = opt.type();
            oo.length = opt.length();
            r.advert.options.emplace_back(oo);
            break;
        }
        }
        is.ignore(body_left);
        bytes_left -= body_left;
        if (!is)
            return fail(ra6_error::truncated_option, opt_offset);
    }
    return r;
}

RA6Listener::RA6Listener(ba::io_service &io_service, const std::string &ifname,
                         int ifindex, RouteHandler &handler)
    : timer_(io_service), socket_(io_service), ifname_(ifname),
      prng_(std::random_device()()), handler_(handler), solicit_s_(0),
      ifindex_(ifindex), state_(State::Idle)
{
    socket_.open(ba::ip::icmp::v6());
    int fd = socket_.native_handle();
    // Configuration commands run as children of this process.
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) < 0)
        throw boost::system::system_error(errno, boost::system::system_category(),
                                          "failed to set close-on-exec on socket");

    struct ifreq ifr;
    memset(&ifr, 0, sizeof (struct ifreq));
    if (ifname.size() >= sizeof ifr.ifr_name)
        throw boost::system::system_error(ENAMETOOLONG, boost::system::system_category(),
                                          "interface name too long");
    memcpy(ifr.ifr_name, ifname.c_str(), ifname.size());
    if (setsockopt(fd, SOL_SOCKET, SO_BINDTODEVICE, &ifr, sizeof ifr) < 0)
        throw boost::system::system_error(errno, boost::system::system_category(),
                                          "failed to bind socket to device");

    // Only router advertisements reach us.
    struct icmp6_filter filter;
    ICMP6_FILTER_SETBLOCKALL(&filter);
    ICMP6_FILTER_SETPASS(ND_ROUTER_ADVERT, &filter);
    if (setsockopt(fd, IPPROTO_ICMPV6, ICMP6_FILTER, &filter, sizeof filter) < 0)
        throw boost::system::system_error(errno, boost::system::system_category(),
                                          "failed to set ICMPv6 filter");

    if (setsockopt(fd, IPPROTO_IPV6, IPV6_MULTICAST_IF,
                   &ifindex, sizeof ifindex) < 0)
        throw boost::system::system_error(errno, boost::system::system_category(),
                                          "failed to set multicast interface for socket");
    int loopback(0);
    if (setsockopt(fd, IPPROTO_IPV6, IPV6_MULTICAST_LOOP,
                   &loopback, sizeof loopback) < 0)
        throw boost::system::system_error(errno, boost::system::system_category(),
                                          "failed to disable multicast loopback for socket");
    int hops(255);
    if (setsockopt(fd, IPPROTO_IPV6, IPV6_MULTICAST_HOPS,
                   &hops, sizeof hops) < 0)
        throw boost::system::system_error(errno, boost::system::system_category(),
                                          "failed to set multicast hops for socket");
}

void RA6Listener::start()
{
    if (state_ != State::Idle)
        return;
    state_ = State::Listening;
    log_line("Listening for Router Advertisements on interface '{}'", ifname_);
    if (solicit_s_) {
        send_solicit();
        start_periodic_solicit();
    }
    start_receive();
}

void RA6Listener::stop()
{
    if (state_ == State::Stopped)
        return;
    state_ = State::Stopped;
    boost::system::error_code ec;
    timer_.cancel(ec);
    socket_.close(ec);
    log_line("Stopped listening on interface '{}'", ifname_);
}

void RA6Listener::start_periodic_solicit()
{
    unsigned int min_s = std::max(solicit_s_ * 3 / 4, 1U);
    boost::random::uniform_int_distribution<unsigned int>
        dist(min_s, std::max(solicit_s_, min_s));
    auto solicit_s = dist(prng_);
    log_debug("Next Router Solicitation on {} in {}s", ifname_, solicit_s);
    timer_.expires_from_now(boost::posix_time::seconds(solicit_s));
    timer_.async_wait
        ([this](const boost::system::error_code &ec)
         {
             if (ec || state_ != State::Listening)
                return;
             send_solicit();
             start_periodic_solicit();
         });
}

void RA6Listener::send_solicit()
{
    icmp_header icmp_hdr;
    ra6_solicit_header ra6sol_hdr;

    // The kernel fills in the checksum for ICMPv6 raw sockets.
    icmp_hdr.type(icmp6_type_router_solicit);
    icmp_hdr.code(0);
    icmp_hdr.checksum(0);

    ba::streambuf send_buffer;
    std::ostream os(&send_buffer);
    os << icmp_hdr << ra6sol_hdr;

    auto dsta = mc6_allrouters;
    dsta.scope_id(ifindex_);
    ba::ip::icmp::endpoint dst(dsta, 0);
    boost::system::error_code ec;
    socket_.send_to(send_buffer.data(), dst, 0, ec);
    if (ec)
        log_warning("Failed to send Router Solicitation on {}: {}",
                    ifname_, ec.message());
    else
        log_debug("Sent Router Solicitation on {}", ifname_);
}

void RA6Listener::start_receive()
{
    recv_buffer_.consume(recv_buffer_.size());
    socket_.async_receive_from
        (recv_buffer_.prepare(8192), remote_endpoint_,
         [this](const boost::system::error_code &error,
                std::size_t bytes_xferred)
         {
             if (state_ != State::Listening
                 || error == ba::error::operation_aborted)
                 return;
             if (error) {
                 log_error("ICMPv6 receive on {} failed: {}",
                           ifname_, error.message());
                 start_receive();
                 return;
             }
             recv_buffer_.commit(bytes_xferred);

             // Drop the scope id so keys and PREFIX/ROUTER text stay plain.
             auto src = ba::ip::address_v6(remote_endpoint_.address().to_v6().to_bytes());

             if (g_verbose_logs) {
                 auto xy = static_cast<const uint8_t *>(recv_buffer_.data().data());
                 std::string dump;
                 for (size_t i = 0; i < bytes_xferred; ++i)
                     fmt::format_to(std::back_inserter(dump), " {:02x}", xy[i]);
                 log_debug("ICMP (len={}) from {}:{}", bytes_xferred,
                           src.to_string(), dump);
             }

             std::istream is(&recv_buffer_);
             handler_.process_packet(is, bytes_xferred, src);

             start_receive();
         });
}
