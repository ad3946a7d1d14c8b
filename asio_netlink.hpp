#ifndef ULAROUTE_ASIO_NETLINK_HPP_
#define ULAROUTE_ASIO_NETLINK_HPP_

#include <string.h>
#include <unistd.h>
#include <asm/types.h>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <boost/asio.hpp>

template <typename Proto>
class nl_endpoint
{
public:
    typedef Proto protocol_type;
    typedef boost::asio::detail::socket_addr_type data_type;

    // pid 0 lets the kernel assign the port id.
    explicit nl_endpoint(int group, int pid = 0) {
        memset(&sockaddr_, 0, sizeof sockaddr_);
        sockaddr_.nl_family = PF_NETLINK;
        sockaddr_.nl_groups = group;
        sockaddr_.nl_pid = pid;
    }

    nl_endpoint() : nl_endpoint(0) {}

    protocol_type protocol() const { return protocol_type(); }
    data_type *data() {
        return reinterpret_cast<struct sockaddr *>(&sockaddr_);
    }
    const data_type *data() const {
        return reinterpret_cast<const struct sockaddr *>(&sockaddr_);
    }
    void resize(std::size_t) {}
    std::size_t size() const { return sizeof sockaddr_; }
    std::size_t capacity() const { return sizeof sockaddr_; }
private:
    sockaddr_nl sockaddr_;
};

class nl_protocol
{
public:
    nl_protocol() : proto_(0) {}
    explicit nl_protocol(int proto) : proto_(proto) {}
    int type() const { return SOCK_RAW; }
    int protocol() const { return proto_; }
    int family() const { return PF_NETLINK; }
    typedef nl_endpoint<nl_protocol> endpoint;
    typedef boost::asio::basic_raw_socket<nl_protocol> socket;
private:
    int proto_;
};

#endif

