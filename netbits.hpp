#ifndef ULAROUTE_NETBITS_HPP_
#define ULAROUTE_NETBITS_HPP_

#include <stdint.h>
#include <string.h>
#include <boost/asio/ip/address_v6.hpp>

static inline void encode32be(uint32_t v, uint8_t *dest)
{
    dest[0] = v >> 24;
    dest[1] = (v >> 16) & 0xff;
    dest[2] = (v >> 8) & 0xff;
    dest[3] = v & 0xff;
}

static inline void encode16be(uint16_t v, uint8_t *dest)
{
    dest[0] = v >> 8;
    dest[1] = v & 0xff;
}

static inline uint32_t decode32be(const uint8_t *src)
{
    return (static_cast<uint32_t>(src[0]) << 24)
         | ((static_cast<uint32_t>(src[1]) << 16) & 0xff0000)
         | ((static_cast<uint32_t>(src[2]) << 8) & 0xff00)
         | (static_cast<uint32_t>(src[3]) & 0xff);
}

static inline uint16_t decode16be(const uint8_t *src)
{
    return (static_cast<uint16_t>(src[0]) << 8)
         | (static_cast<uint16_t>(src[1]) & 0xff);
}

static inline void toggle_bit(bool v, uint8_t *data,
                              std::size_t arrayidx, uint32_t bitidx)
{
    if (v)
        data[arrayidx] |= bitidx;
    else
        data[arrayidx] &= ~bitidx;
}

// Copies up to 16 bytes of a (possibly narrowed) address; the rest is zero.
static inline boost::asio::ip::address_v6
decode_addr6(const uint8_t *src, std::size_t len = 16)
{
    boost::asio::ip::address_v6::bytes_type bytes;
    bytes.fill(0);
    memcpy(bytes.data(), src, len < bytes.size() ? len : bytes.size());
    return boost::asio::ip::address_v6(bytes);
}

static inline void encode_addr6(const boost::asio::ip::address_v6 &v,
                                uint8_t *dest, std::size_t len = 16)
{
    auto bytes = v.to_bytes();
    memcpy(dest, bytes.data(), len < bytes.size() ? len : bytes.size());
}

#endif

