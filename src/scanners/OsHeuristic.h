#pragma once
#include "../core/Discovery.h"
#include <string>
#include <vector>

namespace rack_scan {

struct OsGuess {
    std::string os = "Unknown";
    std::string family = "Unknown";

    bool known() const { return family != "Unknown"; }
};

// Passive guess from open ports and identified services only.
OsGuess guess_os(const std::vector<int>& open_ports, const std::vector<ServiceInfo>& services);

// 50 base, +20 MAC, +15 hostname, +10 any open port, +5 OS guess; capped at 100.
int calculate_confidence(const DiscoveredDevice& device);

}
