#pragma once
#include "Discovery.h"
#include <functional>
#include <memory>
#include <string>

namespace rack_scan {

struct ScanContext; // fwd

// Invoked with the current scan record at each reporting point.
using ScanUpdateFn = std::function<void(const DiscoveryScan&)>;

class Scanner {
public:
    virtual ~Scanner() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    // Blocks until the scan is terminal and returns the final record.
    // Throws ScanError for fatal-to-run failures (after reporting them).
    virtual DiscoveryScan scan_network(ScanContext& context, const std::string& network_id,
                                       const DiscoveryRule& rule, const ScanUpdateFn& on_update) = 0;
};

using ScannerPtr = std::unique_ptr<Scanner>;

}
