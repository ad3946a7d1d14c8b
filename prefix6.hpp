#ifndef ULAROUTE_PREFIX6_HPP_
#define ULAROUTE_PREFIX6_HPP_

#include <string>
#include <stdint.h>
#include <boost/asio/ip/address_v6.hpp>

// Only prefixes whose first octet is 0xfd count as ULA; fc00::/8 does not.
static const uint8_t ula_first_octet(0xfd);

// Clears every bit past the first pl bits.  pl > 128 leaves v unchanged.
boost::asio::ip::address_v6 mask_prefix(const boost::asio::ip::address_v6 &v,
                                        uint8_t pl);
bool is_ula_prefix(const boost::asio::ip::address_v6 &prefix, uint8_t pl);
// "fd00:1234:5678::/64"
std::string format_prefix(const boost::asio::ip::address_v6 &prefix,
                          uint8_t pl);

#endif

