#pragma once
#include "DiscoveryStorage.h"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace rack_scan {

// Process-local reference store used by the CLI and the tests.
class MemoryStore : public DiscoveryStorage {
public:
    void add_network(const Network& network);

    Network get_network(const std::string& id) override;
    void create_or_update_discovered_device(const DiscoveredDevice& device) override;
    void update_discovery_scan(const DiscoveryScan& scan) override;

    std::optional<DiscoveredDevice> find_discovered_device(const std::string& ip) const;
    std::vector<DiscoveredDevice> list_discovered_devices(const std::string& network_id = "") const;
    std::optional<DiscoveryScan> find_scan(const std::string& id) const;
    size_t scan_update_count() const;
private:
    mutable std::mutex mutex_;
    std::map<std::string, Network> networks_;
    std::map<std::string, DiscoveredDevice> devices_; // by ip
    std::map<std::string, DiscoveryScan> scans_;
    size_t scan_updates_ = 0;
};

}
