#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rack_scan {

struct Cidr {
    int family = 0;                 // AF_INET or AF_INET6
    std::array<uint8_t,16> network{}; // masked address, big-endian; first width() bytes used
    int prefix = 0;

    size_t width() const;           // 4 or 16
    int host_bits() const { return static_cast<int>(width() * 8) - prefix; }
    bool contains(const std::array<uint8_t,16>& addr, int addr_family) const;
    std::array<uint8_t,16> broadcast() const;
};

// "addr/prefix" with a numeric IPv4 or IPv6 address; host bits are masked off.
std::optional<Cidr> parse_cidr(const std::string& text);
bool parse_address(const std::string& text, std::array<uint8_t,16>& out, int& family);
std::string format_address(const std::array<uint8_t,16>& addr, int family);

// Candidate hosts of a subnet in ascending order. Blocks of 4+ addresses lose
// their network and broadcast address; /31 and /32 keep both endpoints.
// Throws InvalidSubnetError on a malformed CIDR and SubnetTooLargeError on more
// than max_hosts candidates.
std::vector<std::string> enumerate_hosts(const std::string& cidr, long max_hosts = 1L << 20);

// True if ip equals a literal entry or lies in a CIDR entry. Malformed entries never match.
bool is_excluded(const std::string& ip, const std::vector<std::string>& exclude);

}
