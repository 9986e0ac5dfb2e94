#include "IpRange.h"
#include "../core/Errors.h"
#include <arpa/inet.h>
#include <cstring>
#include <cstdlib>

namespace rack_scan {

size_t Cidr::width() const { return family == AF_INET6 ? 16 : 4; }

bool Cidr::contains(const std::array<uint8_t,16>& addr, int addr_family) const {
    if(addr_family != family) return false;
    int bits = prefix;
    for(size_t i=0; i<width() && bits > 0; ++i, bits -= 8){
        uint8_t mask = bits >= 8 ? 0xFF : static_cast<uint8_t>(0xFF << (8 - bits));
        if((addr[i] & mask) != network[i]) return false;
    }
    return true;
}

std::array<uint8_t,16> Cidr::broadcast() const {
    auto out = network;
    int bits = prefix;
    for(size_t i=0; i<width(); ++i, bits -= 8){
        uint8_t mask = bits >= 8 ? 0xFF : (bits <= 0 ? 0x00 : static_cast<uint8_t>(0xFF << (8 - bits)));
        out[i] = static_cast<uint8_t>(network[i] | static_cast<uint8_t>(~mask));
    }
    return out;
}

bool parse_address(const std::string& text, std::array<uint8_t,16>& out, int& family){
    out.fill(0);
    in_addr v4{};
    if(inet_pton(AF_INET, text.c_str(), &v4) == 1){
        std::memcpy(out.data(), &v4, 4);
        family = AF_INET;
        return true;
    }
    in6_addr v6{};
    if(inet_pton(AF_INET6, text.c_str(), &v6) == 1){
        std::memcpy(out.data(), &v6, 16);
        family = AF_INET6;
        return true;
    }
    return false;
}

std::string format_address(const std::array<uint8_t,16>& addr, int family){
    char buf[INET6_ADDRSTRLEN] = {0};
    if(!inet_ntop(family, addr.data(), buf, sizeof(buf))) return "";
    return buf;
}

std::optional<Cidr> parse_cidr(const std::string& text){
    auto slash = text.find('/');
    if(slash == std::string::npos || slash == 0 || slash + 1 >= text.size()) return std::nullopt;
    std::string addr_part = text.substr(0, slash);
    std::string len_part = text.substr(slash + 1);
    for(char c : len_part) if(c < '0' || c > '9') return std::nullopt;
    if(len_part.size() > 3) return std::nullopt;

    Cidr c;
    if(!parse_address(addr_part, c.network, c.family)) return std::nullopt;
    c.prefix = std::atoi(len_part.c_str());
    if(c.prefix > static_cast<int>(c.width() * 8)) return std::nullopt;

    int bits = c.prefix;
    for(size_t i=0; i<c.width(); ++i, bits -= 8){
        uint8_t mask = bits >= 8 ? 0xFF : (bits <= 0 ? 0x00 : static_cast<uint8_t>(0xFF << (8 - bits)));
        c.network[i] &= mask;
    }
    return c;
}

// Big-endian increment over the first width bytes; carries across byte boundaries.
static void increment(std::array<uint8_t,16>& addr, size_t width){
    for(size_t j = width; j-- > 0;){
        if(++addr[j] != 0) break;
    }
}

std::vector<std::string> enumerate_hosts(const std::string& cidr, long max_hosts){
    auto parsed = parse_cidr(cidr);
    if(!parsed) throw InvalidSubnetError("invalid CIDR address: " + cidr);
    const Cidr& net = *parsed;

    int host_bits = net.host_bits();
    bool skip_edges = host_bits >= 2; // network holds at least 4 addresses
    if(host_bits >= 62) throw SubnetTooLargeError("subnet too large to enumerate: " + cidr);
    long long block = 1LL << host_bits;
    long long candidates = skip_edges ? block - 2 : block;
    if(candidates > max_hosts)
        throw SubnetTooLargeError("subnet " + cidr + " has " + std::to_string(candidates) + " hosts, limit is " + std::to_string(max_hosts));

    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(candidates));
    auto bcast = net.broadcast();
    auto ip = net.network;
    for(long long i = 0; i < block; ++i, increment(ip, net.width())){
        if(skip_edges && (ip == net.network || ip == bcast)) continue;
        out.push_back(format_address(ip, net.family));
    }
    return out;
}

bool is_excluded(const std::string& ip, const std::vector<std::string>& exclude){
    std::array<uint8_t,16> addr{}; int family = 0;
    bool ip_ok = parse_address(ip, addr, family);
    for(const auto& entry : exclude){
        if(entry == ip) return true;
        if(!ip_ok) continue;
        if(entry.find('/') != std::string::npos){
            auto block = parse_cidr(entry);
            if(block && block->contains(addr, family)) return true;
        } else {
            // Literal written differently (e.g. expanded IPv6)
            std::array<uint8_t,16> other{}; int other_family = 0;
            if(parse_address(entry, other, other_family) && other_family == family && other == addr) return true;
        }
    }
    return false;
}

}
