#pragma once
#include "Probes.h"

namespace rack_scan {

// TCP connect scan: every candidate port is attempted at once with
// non-blocking connects, all bounded by the rule's timeout.
class PortProber : public PortProbe {
public:
    std::vector<int> scan_ports(const std::string& ip, const DiscoveryRule& rule, const ScanContext& context) override;

    static const std::vector<int>& common_ports();
    // common and full -> common list; custom -> custom list (common if empty)
    static std::vector<int> ports_to_scan(const DiscoveryRule& rule);

    // Upper bound on simultaneously open sockets per host.
    static constexpr size_t kMaxInFlight = 256;
private:
    static void scan_batch(const std::string& ip, const std::vector<int>& ports, std::chrono::milliseconds timeout, std::vector<int>& open);
};

}
