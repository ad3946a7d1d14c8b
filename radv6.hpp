#ifndef ULAROUTE_RADV6_HPP_
#define ULAROUTE_RADV6_HPP_

#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include <algorithm>
#include <stdint.h>
#include <boost/asio.hpp>
#include <boost/variant.hpp>
#include <boost/random/mersenne_twister.hpp>
#include "netbits.hpp"

class RouteHandler;

static const uint8_t icmp6_type_router_solicit(133);
static const uint8_t icmp6_type_router_advert(134);
static const uint8_t ra6_opt_type_prefix_info(3);
static const uint8_t ra6_opt_type_route_info(24);

class icmp_header
{
public:
    icmp_header() { std::fill(data_, data_ + sizeof data_, 0); }
    uint8_t type() const { return data_[0]; }
    uint8_t code() const { return data_[1]; }
    uint16_t checksum() const { return decode16be(data_ + 2); }
    void type(uint8_t v) { data_[0] = v; }
    void code(uint8_t v) { data_[1] = v; }
    void checksum(uint16_t v) { encode16be(v, data_ + 2); }
    static const std::size_t size = 4;
    friend std::istream& operator>>(std::istream &is, icmp_header &header)
    {
        is.read(reinterpret_cast<char *>(header.data_), size);
        return is;
    }
    friend std::ostream& operator<<(std::ostream &os,
                                    const icmp_header &header)
    {
        return os.write(reinterpret_cast<const char *>(header.data_), size);
    }
private:
    uint8_t data_[4];
};

class ra6_solicit_header
{
public:
    ra6_solicit_header() { std::fill(data_, data_ + sizeof data_, 0); }
    // Just a reserved 32-bit field.
    static const std::size_t size = 4;
    friend std::ostream& operator<<(std::ostream &os,
                                    const ra6_solicit_header &header)
    {
        return os.write(reinterpret_cast<const char *>(header.data_), size);
    }
private:
    uint8_t data_[4];
};

enum class ra6_route_pref { medium = 0, high = 1, reserved = 2, low = 3 };

class ra6_advert_header
{
public:
    ra6_advert_header() { std::fill(data_, data_ + sizeof data_, 0); }
    uint8_t hoplimit() const { return data_[0]; }
    bool managed_addresses() const { return data_[1] & (1 << 7); }
    bool other_stateful() const { return data_[1] & (1 << 6); }
    uint16_t router_lifetime() const { return decode16be(data_ + 2); }
    uint32_t reachable_time() const { return decode32be(data_ + 4); }
    uint32_t retransmit_timer() const { return decode32be(data_ + 8); }
    void hoplimit(uint8_t v) { data_[0] = v; }
    void managed_addresses(bool v) { toggle_bit(v, data_, 1, 1 << 7); }
    void other_stateful(bool v) { toggle_bit(v, data_, 1, 1 << 6); }
    void router_lifetime(uint16_t v) { encode16be(v, data_ + 2); }
    void reachable_time(uint32_t v) { encode32be(v, data_ + 4); }
    void retransmit_timer(uint32_t v) { encode32be(v, data_ + 8); }
    // Follow with options.
    static const std::size_t size = 12;
    friend std::istream& operator>>(std::istream &is, ra6_advert_header &header)
    {
        is.read(reinterpret_cast<char *>(header.data_), size);
        return is;
    }
    friend std::ostream& operator<<(std::ostream &os,
                                    const ra6_advert_header &header)
    {
        return os.write(reinterpret_cast<const char *>(header.data_), size);
    }
private:
    uint8_t data_[12];
};

// Type and length of every RA option.  Length is in units of 8 octets and
// covers these two bytes.
class ra6_opt_header
{
public:
    ra6_opt_header() { std::fill(data_, data_ + sizeof data_, 0); }
    ra6_opt_header(uint8_t t, uint8_t l) { data_[0] = t; data_[1] = l; }
    uint8_t type() const { return data_[0]; }
    uint8_t length() const { return data_[1]; }
    std::size_t length_bytes() const { return 8 * data_[1]; }
    static const std::size_t size = 2;
    friend std::istream& operator>>(std::istream &is, ra6_opt_header &header)
    {
        is.read(reinterpret_cast<char *>(header.data_), size);
        return is;
    }
    friend std::ostream& operator<<(std::ostream &os,
                                    const ra6_opt_header &header)
    {
        return os.write(reinterpret_cast<const char *>(header.data_), size);
    }
private:
    uint8_t data_[2];
};

// Prefix Information option body; the option header is read separately.
class ra6_prefix_info_opt
{
public:
    ra6_prefix_info_opt() { std::fill(data_, data_ + sizeof data_, 0); }
    uint8_t prefix_length() const { return data_[0]; }
    bool on_link() const { return data_[1] & (1 << 7); }
    bool auto_addr_cfg() const { return data_[1] & (1 << 6); }
    uint32_t valid_lifetime() const { return decode32be(data_ + 2); }
    uint32_t preferred_lifetime() const { return decode32be(data_ + 6); }
    // Raw; bits past prefix_length() are whatever the sender put there.
    boost::asio::ip::address_v6 prefix() const { return decode_addr6(data_ + 14); }
    void on_link(bool v) { toggle_bit(v, data_, 1, 1 << 7); }
    void auto_addr_cfg(bool v) { toggle_bit(v, data_, 1, 1 << 6); }
    void valid_lifetime(uint32_t v) { encode32be(v, data_ + 2); }
    void preferred_lifetime(uint32_t v) { encode32be(v, data_ + 6); }
    void prefix(const boost::asio::ip::address_v6 &v, uint8_t pl) {
        data_[0] = pl;
        encode_addr6(v, data_ + 14);
    }
    static const std::size_t size = 30;
    friend std::istream& operator>>(std::istream &is, ra6_prefix_info_opt &opt)
    {
        is.read(reinterpret_cast<char *>(opt.data_), size);
        return is;
    }
    friend std::ostream& operator<<(std::ostream &os,
                                    const ra6_prefix_info_opt &opt)
    {
        os << ra6_opt_header(ra6_opt_type_prefix_info, 4);
        return os.write(reinterpret_cast<const char *>(opt.data_), size);
    }
private:
    uint8_t data_[30];
};

// Route Information option body (RFC4191).  The prefix field is 0, 8 or 16
// bytes long depending on the option length.
class ra6_route_info_opt
{
public:
    explicit ra6_route_info_opt(std::size_t prefix_bytes = 16)
        : prefix_bytes_(std::min<std::size_t>(prefix_bytes, 16)) {
        std::fill(data_, data_ + sizeof data_, 0);
    }
    uint8_t prefix_length() const { return data_[0]; }
    ra6_route_pref preference() const {
        return static_cast<ra6_route_pref>((data_[1] >> 3) & 0x3);
    }
    uint32_t route_lifetime() const { return decode32be(data_ + 2); }
    boost::asio::ip::address_v6 prefix() const {
        return decode_addr6(data_ + 6, prefix_bytes_);
    }
    void preference(ra6_route_pref v) {
        data_[1] = (data_[1] & ~0x18) | (static_cast<uint8_t>(v) << 3);
    }
    void route_lifetime(uint32_t v) { encode32be(v, data_ + 2); }
    void prefix(const boost::asio::ip::address_v6 &v, uint8_t pl) {
        data_[0] = pl;
        encode_addr6(v, data_ + 6, prefix_bytes_);
    }
    std::size_t size() const { return 6 + prefix_bytes_; }
    friend std::istream& operator>>(std::istream &is, ra6_route_info_opt &opt)
    {
        is.read(reinterpret_cast<char *>(opt.data_), opt.size());
        return is;
    }
    friend std::ostream& operator<<(std::ostream &os,
                                    const ra6_route_info_opt &opt)
    {
        os << ra6_opt_header(ra6_opt_type_route_info,
                             static_cast<uint8_t>(1 + opt.prefix_bytes_ / 8));
        return os.write(reinterpret_cast<const char *>(opt.data_), opt.size());
    }
private:
    uint8_t data_[22];
    std::size_t prefix_bytes_;
};

// Decoded options.  Prefixes are already masked to prefix_length.
struct ra6_prefix_info
{
    boost::asio::ip::address_v6 prefix;
    uint32_t valid_lifetime;
    uint32_t preferred_lifetime;
    uint8_t prefix_length;
    bool on_link;
    bool autonomous;
};

struct ra6_route_info
{
    boost::asio::ip::address_v6 prefix;
    uint32_t route_lifetime;
    uint8_t prefix_length;
    ra6_route_pref preference;
};

struct ra6_other_opt
{
    uint8_t type;
    uint8_t length; // 8-octet units
};

using ra6_option = boost::variant<ra6_prefix_info, ra6_route_info, ra6_other_opt>;

struct ra6_advert
{
    boost::asio::ip::address_v6 source;
    uint32_t reachable_time;
    uint32_t retransmit_timer;
    uint16_t router_lifetime;
    uint8_t hoplimit;
    bool managed_addresses;
    bool other_stateful;
    std::vector<ra6_option> options;
};

enum class ra6_error {
    none,
    not_router_advert,
    bad_icmp_code,
    truncated_header,
    truncated_option,
    malformed_option,
};
const char *ra6_error_str(ra6_error e);

struct ra6_decode_result
{
    ra6_advert advert;
    ra6_error error;
    std::size_t error_offset; // where decoding stopped, from the ICMP type byte
    // False if nothing past the fixed header could be trusted.
    bool have_advert() const {
        return error != ra6_error::not_router_advert
            && error != ra6_error::bad_icmp_code
            && error != ra6_error::truncated_header;
    }
};

// Consumes exactly len bytes of is, which must start at the ICMPv6 type.
ra6_decode_result decode_ra6(std::istream &is, std::size_t len,
                             const boost::asio::ip::address_v6 &source);

class RA6Listener
{
public:
    enum class State { Idle, Listening, Stopped };
    // Can throw boost::system::system_error
    RA6Listener(boost::asio::io_service &io_service,
                const std::string &ifname, int ifindex,
                RouteHandler &handler);
    // Solicitations go out every 3/4 to 1 times this many seconds; 0 is off.
    void set_solicit_interval(unsigned int v) { solicit_s_ = v; }
    void start();
    void stop();
private:
    void start_periodic_solicit();
    void send_solicit();
    void start_receive();
    boost::asio::deadline_timer timer_;
    boost::asio::ip::icmp::socket socket_;
    boost::asio::ip::icmp::endpoint remote_endpoint_;
    std::string ifname_;
    boost::asio::streambuf recv_buffer_;
    boost::random::mt19937 prng_;
    RouteHandler &handler_;
    unsigned int solicit_s_;
    int ifindex_;
    State state_;
};

#endif

