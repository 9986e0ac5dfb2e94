#pragma once
#include "Scanner.h"
#include <vector>

namespace rack_scan {

class DiscoveryStorage;

class ScannerRegistry {
public:
    void register_scanner(ScannerPtr scanner);
    void register_all_default(DiscoveryStorage& storage);
    Scanner* find(const std::string& name) const;
    std::vector<std::string> names() const;
    // Looks up name and runs it; throws ScanError if no such scanner is registered.
    DiscoveryScan run(const std::string& name, ScanContext& context, const std::string& network_id,
                      const DiscoveryRule& rule, const ScanUpdateFn& on_update);
private:
    std::vector<ScannerPtr> scanners_;
};

}
