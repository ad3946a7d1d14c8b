#ifndef ULAROUTE_ROUTE_STORE_HPP_
#define ULAROUTE_ROUTE_STORE_HPP_

#include <map>
#include <string>
#include <utility>
#include <stdint.h>
#include <boost/optional.hpp>
#include <boost/asio/ip/address_v6.hpp>

struct route_key {
    route_key(const boost::asio::ip::address_v6 &prefix_, uint8_t prefix_length_,
              const boost::asio::ip::address_v6 &router_)
        : prefix(prefix_), router(router_), prefix_length(prefix_length_) {}
    boost::asio::ip::address_v6 prefix;
    boost::asio::ip::address_v6 router;
    uint8_t prefix_length;

    // PREFIX parameter for the configuration action.
    std::string prefix_string() const;
    // "fd00:1234:5678::/64 via fe80::1"
    std::string to_string() const;

    friend bool operator==(const route_key &a, const route_key &b) {
        return a.prefix_length == b.prefix_length && a.prefix == b.prefix
            && a.router == b.router;
    }
    friend bool operator!=(const route_key &a, const route_key &b) {
        return !(a == b);
    }
    friend bool operator<(const route_key &a, const route_key &b) {
        if (a.prefix != b.prefix) return a.prefix < b.prefix;
        if (a.prefix_length != b.prefix_length)
            return a.prefix_length < b.prefix_length;
        return a.router < b.router;
    }
};

enum class route_state { pending, configured };

// Which routes have been handed to the configuration action, for the life of
// the process.  Not thread safe; the capture loop is the only user.
class RouteStore
{
public:
    boost::optional<route_state> lookup(const route_key &key) const;
    void record_pending(const route_key &key);
    // Can throw std::out_of_range
    void mark_configured(const route_key &key);
    // Router through which prefix/pl was most recently configured.
    boost::optional<boost::asio::ip::address_v6>
    configured_router(const boost::asio::ip::address_v6 &prefix, uint8_t pl) const;
    std::size_t size() const { return records_.size(); }
private:
    using prefix_id = std::pair<boost::asio::ip::address_v6, uint8_t>;
    std::map<route_key, route_state> records_;
    std::map<prefix_id, boost::asio::ip::address_v6> prefix_routers_;
};

#endif

