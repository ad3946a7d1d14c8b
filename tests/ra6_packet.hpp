#ifndef ULAROUTE_TESTS_RA6_PACKET_HPP_
#define ULAROUTE_TESTS_RA6_PACKET_HPP_

#include <sstream>
#include <string>
#include "radv6.hpp"

namespace test {

inline boost::asio::ip::address_v6 a6(const char *s)
{
    return boost::asio::ip::address_v6::from_string(s);
}

// Builds router advertisements the way a router would put them on the wire.
class ra6_packet
{
public:
    ra6_packet() {
        icmp_header icmp_hdr;
        icmp_hdr.type(icmp6_type_router_advert);
        ra6_advert_header ra6adv_hdr;
        ra6adv_hdr.hoplimit(64);
        ra6adv_hdr.router_lifetime(1800);
        ra6adv_hdr.reachable_time(30000);
        ra6adv_hdr.retransmit_timer(1000);
        os_ << icmp_hdr << ra6adv_hdr;
    }
    ra6_packet &prefix_info(const char *prefix, uint8_t pl) {
        ra6_prefix_info_opt pio;
        pio.prefix(a6(prefix), pl);
        pio.on_link(true);
        pio.auto_addr_cfg(true);
        pio.valid_lifetime(2592000);
        pio.preferred_lifetime(604800);
        os_ << pio;
        return *this;
    }
    ra6_packet &route_info(const char *prefix, uint8_t pl,
                           std::size_t prefix_bytes = 16) {
        ra6_route_info_opt rio(prefix_bytes);
        rio.prefix(a6(prefix), pl);
        rio.preference(ra6_route_pref::high);
        rio.route_lifetime(1800);
        os_ << rio;
        return *this;
    }
    // Appends len*8 bytes: the option header and zero padding.
    ra6_packet &raw_option(uint8_t type, uint8_t len, std::size_t body = 0) {
        os_ << ra6_opt_header(type, len);
        os_ << std::string(len ? 8 * len - 2 : body, '\0');
        return *this;
    }
    ra6_packet &raw_bytes(const std::string &b) {
        os_ << b;
        return *this;
    }
    std::string str() const { return os_.str(); }
private:
    std::ostringstream os_;
};

inline ra6_decode_result decode(const std::string &pkt, const char *src = "fe80::1")
{
    std::istringstream is(pkt);
    return decode_ra6(is, pkt.size(), a6(src));
}

}

#endif
