#pragma once
#include "Config.h"
#include "Discovery.h"
#include <string>
#include <vector>

namespace rack_scan {

class JSONWriter {
public:
    // Document with meta, scan and devices; NDJSON emits one line per part
    // (meta, scan, then each device).
    std::string write(const DiscoveryScan& scan, const std::vector<DiscoveredDevice>& devices, const Config& cfg) const;
};

}
