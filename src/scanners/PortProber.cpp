#include "PortProber.h"
#include "../core/Socket.h"
#include "../core/Logging.h"
#include "../core/ScanContext.h"
#include <algorithm>
#include <cerrno>
#include <poll.h>
#include <system_error>

namespace rack_scan {

const std::vector<int>& PortProber::common_ports(){
    static const std::vector<int> ports = {
        21, 22, 23, 25, 53, 80, 110, 111, 135, 139,
        143, 443, 445, 993, 995, 1723, 3306, 3389, 5900, 8080,
    };
    return ports;
}

std::vector<int> PortProber::ports_to_scan(const DiscoveryRule& rule){
    if(!rule.scan_ports) return {};
    switch(rule.port_scan_type){
        case PortScanType::Custom:
            if(!rule.custom_ports.empty()) return std::vector<int>(rule.custom_ports.begin(), rule.custom_ports.end());
            return common_ports();
        case PortScanType::Full: // full range sweep is not supported; scan the common set
        case PortScanType::Common:
            break;
    }
    return common_ports();
}

void PortProber::scan_batch(const std::string& ip, const std::vector<int>& ports, std::chrono::milliseconds timeout, std::vector<int>& open){
    struct Attempt { int port; Socket sock; };
    std::vector<Attempt> attempts;
    std::vector<pollfd> pfds;
    attempts.reserve(ports.size());
    for(int port : ports){
        std::optional<Socket> sock;
        try {
            sock = start_connect(ip, port);
        } catch(const std::system_error& ex) {
            Logger::instance().debug("Port probe socket failed", {{"ip", ip}, {"port", std::to_string(port)}, {"error", ex.what()}});
            continue;
        }
        if(!sock) continue; // refused or unreachable right away
        pfds.push_back(pollfd{sock->handle(), POLLOUT, 0});
        attempts.push_back(Attempt{port, std::move(*sock)});
    }

    using SteadyClock = std::chrono::steady_clock;
    auto deadline = SteadyClock::now() + timeout;
    size_t pending = attempts.size();
    while(pending > 0){
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
        if(left.count() <= 0) break;
        int rc = ::poll(pfds.data(), pfds.size(), poll_timeout_ms(left));
        if(rc < 0 && errno == EINTR) continue;
        if(rc <= 0) break;
        for(size_t i=0; i<pfds.size(); ++i){
            if(pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            if(attempts[i].sock.pending_error() == 0 && (pfds[i].revents & POLLOUT)) open.push_back(attempts[i].port);
            attempts[i].sock.close();
            pfds[i].fd = -1; // poll ignores negative descriptors
            --pending;
        }
    }
    // Unfinished attempts are closed when attempts goes out of scope.
}

std::vector<int> PortProber::scan_ports(const std::string& ip, const DiscoveryRule& rule, const ScanContext& context){
    std::vector<int> open;
    auto ports = ports_to_scan(rule);
    for(size_t off = 0; off < ports.size(); off += kMaxInFlight){
        if(context.cancelled()) break;
        size_t end = std::min(ports.size(), off + kMaxInFlight);
        std::vector<int> batch(ports.begin() + static_cast<long>(off), ports.begin() + static_cast<long>(end));
        scan_batch(ip, batch, rule.timeout(), open);
    }
    std::sort(open.begin(), open.end());
    Logger::instance().trace("Port scan done for " + ip + ": " + std::to_string(open.size()) + " open of " + std::to_string(ports.size()));
    return open;
}

}
