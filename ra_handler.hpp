#ifndef ULAROUTE_RA_HANDLER_HPP_
#define ULAROUTE_RA_HANDLER_HPP_

#include <string>
#include <istream>
#include <boost/asio/ip/address_v6.hpp>
#include "radv6.hpp"
#include "route_store.hpp"
#include "route_config.hpp"

// Turns decoded advertisements into configuration requests, at most once per
// route.  The store and configurator are owned by the caller.
class RouteHandler
{
public:
    RouteHandler(RouteStore &store, RouteConfigurator &configurator,
                 const std::string &ifname, bool log_ignored);
    void process_packet(std::istream &is, std::size_t len,
                        const boost::asio::ip::address_v6 &source);
    void process_advert(const ra6_advert &advert);
private:
    void process_route(const route_key &key, const char *kind);
    RouteStore &store_;
    RouteConfigurator &configurator_;
    std::string ifname_;
    bool log_ignored_;
};

#endif

