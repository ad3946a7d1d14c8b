#ifndef ULAROUTE_NLSOCKET_HPP_
#define ULAROUTE_NLSOCKET_HPP_

#include <array>
#include <map>
#include <string>
#include <vector>
#include <functional>
#include <stdint.h>
#include <boost/asio.hpp>
#include <boost/optional.hpp>
#include "asio_netlink.hpp"

struct nlmsghdr;

struct netif_info
{
    netif_info() : index(0) {}
    std::string name;
    int index;
};

// A route in the main IPv6 table.
struct netroute6
{
    netroute6() : oif(0), dst_len(0) {}
    boost::asio::ip::address_v6 dst;
    boost::optional<boost::asio::ip::address_v6> gateway;
    int oif;
    uint8_t dst_len;
    std::string to_string() const;
};

// Interface lookup and the ipv6 route changes made by the configuration action.
class RouteTable
{
public:
    virtual ~RouteTable() {}
    // Can throw std::out_of_range
    virtual int get_ifindex(const std::string &name) const = 0;
    // Can throw boost::system::system_error
    virtual std::vector<netroute6> get_routes6() = 0;
    // These return 0 or the errno reported by the kernel.
    virtual int del_route6(const netroute6 &rt) = 0;
    virtual int add_route6(const netroute6 &rt) = 0;
};

// Exits the process if ifname is not in the link table.
int require_ifindex(const RouteTable &rt, const std::string &ifname);

// Synchronous rtnetlink requests: the link table and ipv6 routes.
class NLSocket : public RouteTable
{
public:
    // Can throw boost::system::system_error
    explicit NLSocket(boost::asio::io_service &io_service);
    NLSocket(const NLSocket &) = delete;
    NLSocket &operator=(const NLSocket &) = delete;

    int get_ifindex(const std::string &name) const override;
    std::vector<netroute6> get_routes6() override;
    int del_route6(const netroute6 &rt) override;
    int add_route6(const netroute6 &rt) override;

    std::map<int, netif_info> interfaces;
private:
    void request_links();
    void send_request(struct nlmsghdr *nlh);
    int receive_reply(uint32_t seq,
                      const std::function<void(const struct nlmsghdr *)> &fn);
    int route_change(int type, int flags, const netroute6 &rt);
    void process_rt_link_msgs(const struct nlmsghdr *nlh);
    nl_protocol::socket socket_;
    std::array<char, 32768> recv_buffer_;
    std::map<std::string, int> name_to_ifindex_;
    uint32_t nlseq_;
};

#endif

