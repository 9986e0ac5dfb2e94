#pragma once
#include "../core/Discovery.h"
#include "OsHeuristic.h"
#include <optional>

namespace rack_scan {

// Accumulates one host's evidence across the pipeline stages; finalize()
// produces the immutable record exactly once.
class DeviceBuilder {
public:
    DeviceBuilder(std::string ip, std::string network_id, std::string scan_id);

    void mark_online() { device_.status = DeviceStatus::Online; }
    void set_mac(std::optional<std::string> mac);
    void set_hostname(std::optional<std::string> hostname);
    // Any open port promotes an unknown host to online.
    void set_open_ports(std::vector<int> ports);
    void set_services(std::vector<ServiceInfo> services);
    void set_os(const OsGuess& guess);

    DeviceStatus status() const { return device_.status; }
    const std::vector<int>& open_ports() const { return device_.open_ports; }
    const std::vector<ServiceInfo>& services() const { return device_.services; }

    DiscoveredDevice finalize();
private:
    DiscoveredDevice device_;
    bool finalized_ = false;
};

}
