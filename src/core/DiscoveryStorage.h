#pragma once
#include "Discovery.h"

namespace rack_scan {

// Inventory store operations the scanner depends on. Implementations must be
// safe to call from several host tasks at once.
class DiscoveryStorage {
public:
    virtual ~DiscoveryStorage() = default;
    // Throws NotFoundError if no network has this id.
    virtual Network get_network(const std::string& id) = 0;
    // Upsert keyed by device.ip; last write wins. Throws StorageError on failure.
    virtual void create_or_update_discovered_device(const DiscoveredDevice& device) = 0;
    virtual void update_discovery_scan(const DiscoveryScan& scan) = 0;
};

}
