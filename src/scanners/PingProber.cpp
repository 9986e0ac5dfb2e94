#include "PingProber.h"
#include "../core/Socket.h"
#include "../core/Privilege.h"
#include "../core/Logging.h"
#include "../core/ScanContext.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace rack_scan {

PingProber::PingProber() : privileged_(has_net_raw_capability() || can_open_raw_icmp_socket()) {
    if(!privileged_) Logger::instance().warn("No raw socket privilege; ICMP reachability checks disabled, relying on port evidence");
}

uint16_t PingProber::checksum(const uint8_t* data, size_t len){
    uint32_t sum = 0;
    for(size_t i=0; i+1 < len; i += 2) sum += static_cast<uint32_t>((data[i] << 8) | data[i+1]);
    if(len & 1) sum += static_cast<uint32_t>(data[len-1] << 8);
    while(sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

std::optional<bool> PingProber::ping(const std::string& ip, std::chrono::milliseconds timeout, const ScanContext& context){
    if(!privileged_ || context.cancelled()) return std::nullopt;

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    if(inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
        Logger::instance().debug("ICMP echo skipped for non-IPv4 address", {{"ip", ip}});
        return std::nullopt;
    }

    try {
        Socket sock(AF_INET, SOCK_RAW, IPPROTO_ICMP);

        const uint16_t ident = static_cast<uint16_t>(getpid() & 0xFFFF);
        const uint16_t seq = sequence_.fetch_add(1);
        uint8_t packet[sizeof(icmphdr) + 32];
        std::memset(packet, 'R', sizeof(packet));
        auto* hdr = reinterpret_cast<icmphdr*>(packet);
        hdr->type = ICMP_ECHO;
        hdr->code = 0;
        hdr->un.echo.id = htons(ident);
        hdr->un.echo.sequence = htons(seq);
        hdr->checksum = 0;
        hdr->checksum = htons(checksum(packet, sizeof(packet)));

        if(sendto(sock.handle(), packet, sizeof(packet), 0, reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) <= 0) {
            Logger::instance().debug("ICMP sendto failed", {{"ip", ip}, {"error", std::strerror(errno)}});
            return std::nullopt;
        }

        // The raw socket sees every ICMP packet for this host; match source, id and sequence.
        using SteadyClock = std::chrono::steady_clock;
        auto deadline = SteadyClock::now() + timeout;
        uint8_t buf[1500];
        while(true) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
            if(left.count() <= 0) return false;
            pollfd pfd{sock.handle(), POLLIN, 0};
            int rc = ::poll(&pfd, 1, poll_timeout_ms(left));
            if(rc < 0 && errno == EINTR) continue;
            if(rc == 0) return false;
            if(rc < 0) return std::nullopt;

            sockaddr_in from{}; socklen_t from_len = sizeof(from);
            ssize_t n = recvfrom(sock.handle(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &from_len);
            if(n <= 0) continue;
            if(from.sin_addr.s_addr != dest.sin_addr.s_addr) continue;
            const auto* iph = reinterpret_cast<const iphdr*>(buf);
            size_t ip_len = static_cast<size_t>(iph->ihl) * 4;
            if(static_cast<size_t>(n) < ip_len + sizeof(icmphdr)) continue;
            const auto* reply = reinterpret_cast<const icmphdr*>(buf + ip_len);
            if(reply->type != ICMP_ECHOREPLY || reply->code != 0) continue;
            if(ntohs(reply->un.echo.id) != ident || ntohs(reply->un.echo.sequence) != seq) continue;
            return true;
        }
    } catch(const std::system_error& ex) {
        Logger::instance().debug("ICMP socket unavailable", {{"ip", ip}, {"error", ex.what()}});
        return std::nullopt;
    }
}

}
