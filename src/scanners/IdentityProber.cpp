#include "IdentityProber.h"
#include "../core/Socket.h"
#include "../core/Logging.h"
#include "../core/ScanContext.h"
#include <fstream>
#include <sstream>
#include <thread>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <netdb.h>
#include <netinet/in.h>

namespace rack_scan {

std::optional<std::string> IdentityProber::parse_arp_table(std::istream& in, const std::string& ip){
    std::string line;
    std::getline(in, line); // header
    while(std::getline(in, line)){
        std::istringstream ss(line);
        std::string addr, hw_type, flags, mac, mask, dev;
        if(!(ss >> addr >> hw_type >> flags >> mac >> mask >> dev)) continue;
        if(addr != ip) continue;
        unsigned long fl = std::strtoul(flags.c_str(), nullptr, 16);
        if(!(fl & 0x2) || mac == "00:00:00:00:00:00") return std::nullopt; // incomplete
        std::transform(mac.begin(), mac.end(), mac.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return mac;
    }
    return std::nullopt;
}

std::optional<std::string> IdentityProber::read_table(const std::string& ip) const {
    std::ifstream f(arp_table_path_);
    if(!f.is_open()) return std::nullopt;
    return parse_arp_table(f, ip);
}

// A datagram to the discard port makes the kernel resolve the neighbour.
void IdentityProber::solicit(const std::string& ip){
    sockaddr_storage addr{}; socklen_t len = 0;
    if(!make_sockaddr(ip, 9, addr, len) || addr.ss_family != AF_INET) return;
    try {
        Socket sock(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        char byte = 0;
        if(sendto(sock.handle(), &byte, 1, MSG_DONTWAIT, reinterpret_cast<sockaddr*>(&addr), len) < 0)
            Logger::instance().trace("ARP solicitation send failed for " + ip);
    } catch(const std::system_error& ex) {
        Logger::instance().debug("ARP solicitation socket failed", {{"ip", ip}, {"error", ex.what()}});
    }
}

std::optional<std::string> IdentityProber::lookup_mac(const std::string& ip, const ScanContext& context){
    if(auto mac = read_table(ip)) return mac;
    if(context.cancelled()) return std::nullopt;
    solicit(ip);
    std::this_thread::sleep_for(settle_);
    auto mac = read_table(ip);
    if(!mac) Logger::instance().debug("MAC lookup failed", {{"ip", ip}});
    return mac;
}

std::optional<std::string> IdentityProber::lookup_hostname(const std::string& ip, const ScanContext& context){
    if(context.cancelled()) return std::nullopt;
    sockaddr_storage addr{}; socklen_t len = 0;
    if(!make_sockaddr(ip, 0, addr, len)) return std::nullopt;
    char host[NI_MAXHOST] = {0};
    int rc = getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if(rc != 0) {
        Logger::instance().debug("Reverse lookup failed", {{"ip", ip}, {"error", gai_strerror(rc)}});
        return std::nullopt;
    }
    std::string name = host;
    if(!name.empty() && name.back() == '.') name.pop_back();
    if(name.empty()) return std::nullopt;
    return name;
}

}
