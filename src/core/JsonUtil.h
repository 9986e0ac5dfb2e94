#pragma once
#include "Discovery.h"
#include <nlohmann/json.hpp>
#include <string>

namespace rack_scan {

namespace jsonutil {
// ISO-8601 UTC with second precision, e.g. 2024-05-01T12:00:00Z
std::string time_to_iso(Clock::time_point tp);
}

// nlohmann ADL hooks
void to_json(nlohmann::json& j, const ServiceInfo& s);
void to_json(nlohmann::json& j, const DiscoveredDevice& d);
void to_json(nlohmann::json& j, const DiscoveryScan& s);
void to_json(nlohmann::json& j, const Network& n);

}
