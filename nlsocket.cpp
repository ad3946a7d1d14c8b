/* nlsocket.cpp - rtnetlink link table and ipv6 route requests
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

#include <time.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <net/if.h>
#include <netinet/in.h>
#include <linux/rtnetlink.h>

#include <fmt/format.h>

#include "nlsocket.hpp"
#include "netbits.hpp"
#include "log.hpp"

namespace ba = boost::asio;

namespace {
struct link_request {
    struct nlmsghdr nlh;
    struct ifinfomsg ifi;
};

struct route_req {
    struct nlmsghdr nlh;
    struct rtmsg rtm;
    char attrbuf[128];
};
}

static void rtattr_add(struct nlmsghdr *nlh, std::size_t maxlen, int type,
                       const void *data, std::size_t alen)
{
    const std::size_t len = RTA_LENGTH(alen);
    if (NLMSG_ALIGN(nlh->nlmsg_len) + RTA_ALIGN(len) > maxlen)
        throw std::length_error("netlink request is too large");
    auto rta = reinterpret_cast<struct rtattr *>
        (reinterpret_cast<char *>(nlh) + NLMSG_ALIGN(nlh->nlmsg_len));
    rta->rta_type = type;
    rta->rta_len = len;
    memcpy(RTA_DATA(rta), data, alen);
    nlh->nlmsg_len = NLMSG_ALIGN(nlh->nlmsg_len) + RTA_ALIGN(len);
}

std::string netroute6::to_string() const
{
    auto s = fmt::format("{}/{}", dst.to_string(), dst_len);
    if (gateway)
        s += fmt::format(" via {}", gateway->to_string());
    if (oif) {
        char ifname[IF_NAMESIZE];
        if (if_indextoname(oif, ifname))
            s += fmt::format(" dev {}", ifname);
        else
            s += fmt::format(" dev #{}", oif);
    }
    return s;
}

int require_ifindex(const RouteTable &rt, const std::string &ifname)
{
    try {
        return rt.get_ifindex(ifname);
    } catch (const std::out_of_range &) {
        suicide("Interface '{}' does not exist", ifname);
    }
}

NLSocket::NLSocket(ba::io_service &io_service)
    : socket_(io_service), nlseq_(static_cast<uint32_t>(time(nullptr)))
{
    socket_.open(nl_protocol(NETLINK_ROUTE));
    if (fcntl(socket_.native_handle(), F_SETFD, FD_CLOEXEC) < 0)
        throw boost::system::system_error(errno, boost::system::system_category(),
                                          "failed to set close-on-exec on netlink socket");
    socket_.bind(nl_endpoint<nl_protocol>(0));
    request_links();
}

int NLSocket::get_ifindex(const std::string &name) const
{
    auto f = name_to_ifindex_.find(name);
    if (f == name_to_ifindex_.end())
        throw std::out_of_range(fmt::format("no interface named '{}'", name));
    return f->second;
}

void NLSocket::send_request(struct nlmsghdr *nlh)
{
    socket_.send_to(ba::buffer(nlh, nlh->nlmsg_len), nl_endpoint<nl_protocol>(0));
}

// Returns 0 when the reply ends with NLMSG_DONE or an ack, otherwise the
// errno carried by NLMSG_ERROR.
int NLSocket::receive_reply(uint32_t seq,
                            const std::function<void(const struct nlmsghdr *)> &fn)
{
    for (;;) {
        boost::system::error_code ec;
        auto bytes_xferred = socket_.receive(ba::buffer(recv_buffer_), 0, ec);
        if (ec == ba::error::interrupted)
            continue;
        if (ec)
            throw boost::system::system_error(ec, "netlink receive failed");

        int len = static_cast<int>(bytes_xferred);
        auto nlh = reinterpret_cast<const struct nlmsghdr *>(recv_buffer_.data());
        for (; NLMSG_OK(nlh, len); nlh = NLMSG_NEXT(nlh, len)) {
            if (nlh->nlmsg_seq != seq)
                continue;
            switch (nlh->nlmsg_type) {
            case NLMSG_DONE:
                return 0;
            case NLMSG_ERROR: {
                auto nle = reinterpret_cast<const struct nlmsgerr *>(NLMSG_DATA(nlh));
                return -nle->error;
            }
            case NLMSG_OVERRUN:
                log_warning("{}: Received a NLMSG_OVERRUN.", __func__);
                break;
            case NLMSG_NOOP:
                break;
            default:
                if (nlh->nlmsg_type >= NLMSG_MIN_TYPE && fn)
                    fn(nlh);
                break;
            }
        }
    }
}

void NLSocket::request_links()
{
    link_request req;
    memset(&req, 0, sizeof req);
    req.nlh.nlmsg_len = NLMSG_LENGTH(sizeof req.ifi);
    req.nlh.nlmsg_type = RTM_GETLINK;
    req.nlh.nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    req.nlh.nlmsg_seq = ++nlseq_;
    req.ifi.ifi_family = AF_UNSPEC;
    send_request(&req.nlh);
    auto err = receive_reply(req.nlh.nlmsg_seq, [this](const struct nlmsghdr *nlh) {
        if (nlh->nlmsg_type == RTM_NEWLINK)
            process_rt_link_msgs(nlh);
    });
    if (err)
        throw boost::system::system_error(err, boost::system::system_category(),
                                          "failed to get rtlink state");
}

void NLSocket::process_rt_link_msgs(const struct nlmsghdr *nlh)
{
    auto ifm = reinterpret_cast<const struct ifinfomsg *>(NLMSG_DATA(nlh));
    netif_info nii;
    nii.index = ifm->ifi_index;

    int alen = IFLA_PAYLOAD(nlh);
    for (auto rta = IFLA_RTA(ifm); RTA_OK(rta, alen); rta = RTA_NEXT(rta, alen)) {
        switch (rta->rta_type) {
        case IFLA_IFNAME: {
            auto v = reinterpret_cast<const char *>(RTA_DATA(rta));
            nii.name = std::string(v, strnlen(v, RTA_PAYLOAD(rta)));
            break;
        }
        default:
            break;
        }
    }
    if (nii.name.empty())
        return;
    name_to_ifindex_[nii.name] = nii.index;
    interfaces[nii.index] = nii;
}

std::vector<netroute6> NLSocket::get_routes6()
{
    route_req req;
    memset(&req, 0, sizeof req);
    req.nlh.nlmsg_len = NLMSG_LENGTH(sizeof req.rtm);
    req.nlh.nlmsg_type = RTM_GETROUTE;
    req.nlh.nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    req.nlh.nlmsg_seq = ++nlseq_;
    req.rtm.rtm_family = AF_INET6;
    send_request(&req.nlh);

    std::vector<netroute6> routes;
    auto err = receive_reply(req.nlh.nlmsg_seq, [&routes](const struct nlmsghdr *nlh) {
        if (nlh->nlmsg_type != RTM_NEWROUTE)
            return;
        auto rtm = reinterpret_cast<const struct rtmsg *>(NLMSG_DATA(nlh));
        if (rtm->rtm_family != AF_INET6 || rtm->rtm_type != RTN_UNICAST)
            return;
        uint32_t table = rtm->rtm_table;
        netroute6 rt;
        rt.dst_len = rtm->rtm_dst_len;
        int alen = RTM_PAYLOAD(nlh);
        for (auto rta = RTM_RTA(rtm); RTA_OK(rta, alen); rta = RTA_NEXT(rta, alen)) {
            switch (rta->rta_type) {
            case RTA_DST:
                if (RTA_PAYLOAD(rta) >= 16)
                    rt.dst = decode_addr6(static_cast<const uint8_t *>(RTA_DATA(rta)));
                break;
            case RTA_GATEWAY:
                if (RTA_PAYLOAD(rta) >= 16)
                    rt.gateway = decode_addr6(static_cast<const uint8_t *>(RTA_DATA(rta)));
                break;
            case RTA_OIF:
                memcpy(&rt.oif, RTA_DATA(rta), sizeof rt.oif);
                break;
            case RTA_TABLE:
                memcpy(&table, RTA_DATA(rta), sizeof table);
                break;
            default:
                break;
            }
        }
        if (table == RT_TABLE_MAIN)
            routes.emplace_back(std::move(rt));
    });
    if (err)
        throw boost::system::system_error(err, boost::system::system_category(),
                                          "failed to dump ipv6 routes");
    return routes;
}

int NLSocket::route_change(int type, int flags, const netroute6 &rt)
{
    route_req req;
    memset(&req, 0, sizeof req);
    req.nlh.nlmsg_len = NLMSG_LENGTH(sizeof req.rtm);
    req.nlh.nlmsg_type = type;
    req.nlh.nlmsg_flags = NLM_F_REQUEST | NLM_F_ACK | flags;
    req.nlh.nlmsg_seq = ++nlseq_;
    req.rtm.rtm_family = AF_INET6;
    req.rtm.rtm_dst_len = rt.dst_len;
    req.rtm.rtm_table = RT_TABLE_MAIN;
    if (type == RTM_NEWROUTE) {
        req.rtm.rtm_protocol = RTPROT_BOOT;
        req.rtm.rtm_scope = RT_SCOPE_UNIVERSE;
        req.rtm.rtm_type = RTN_UNICAST;
    } else {
        req.rtm.rtm_scope = RT_SCOPE_NOWHERE;
    }

    uint8_t a6[16];
    encode_addr6(rt.dst, a6);
    rtattr_add(&req.nlh, sizeof req, RTA_DST, a6, sizeof a6);
    if (rt.gateway) {
        encode_addr6(*rt.gateway, a6);
        rtattr_add(&req.nlh, sizeof req, RTA_GATEWAY, a6, sizeof a6);
    }
    if (rt.oif)
        rtattr_add(&req.nlh, sizeof req, RTA_OIF, &rt.oif, sizeof rt.oif);

    try {
        send_request(&req.nlh);
        return receive_reply(req.nlh.nlmsg_seq, nullptr);
    } catch (const boost::system::system_error &e) {
        return e.code().value() ? e.code().value() : EIO;
    }
}

int NLSocket::del_route6(const netroute6 &rt)
{
    return route_change(RTM_DELROUTE, 0, rt);
}

int NLSocket::add_route6(const netroute6 &rt)
{
    return route_change(RTM_NEWROUTE, NLM_F_CREATE | NLM_F_REPLACE, rt);
}
