#include "JsonUtil.h"
#include <ctime>

namespace rack_scan {

namespace jsonutil {
std::string time_to_iso(Clock::time_point tp){
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
}

void to_json(nlohmann::json& j, const ServiceInfo& s){
    j = nlohmann::json{{"port", s.port}, {"protocol", s.protocol}, {"banner", s.banner},
                       {"service", s.service}, {"version", s.version}};
}

void to_json(nlohmann::json& j, const DiscoveredDevice& d){
    j = nlohmann::json{
        {"id", d.id}, {"ip", d.ip}, {"mac_address", d.mac_address}, {"hostname", d.hostname},
        {"network_id", d.network_id}, {"status", to_string(d.status)}, {"confidence", d.confidence},
        {"os_guess", d.os_guess}, {"os_family", d.os_family}, {"open_ports", d.open_ports},
        {"services", d.services}, {"last_scan_id", d.last_scan_id},
        {"first_seen", jsonutil::time_to_iso(d.first_seen)}, {"last_seen", jsonutil::time_to_iso(d.last_seen)}
    };
}

void to_json(nlohmann::json& j, const DiscoveryScan& s){
    j = nlohmann::json{
        {"id", s.id}, {"network_id", s.network_id}, {"status", to_string(s.status)},
        {"scan_type", to_string(s.scan_type)}, {"scan_depth", s.scan_depth},
        {"total_hosts", s.total_hosts}, {"scanned_hosts", s.scanned_hosts}, {"found_hosts", s.found_hosts},
        {"progress_percent", s.progress_percent}, {"duration_seconds", s.duration_seconds}
    };
    j["started_at"] = s.started_at ? nlohmann::json(jsonutil::time_to_iso(*s.started_at)) : nlohmann::json(nullptr);
    j["completed_at"] = s.completed_at ? nlohmann::json(jsonutil::time_to_iso(*s.completed_at)) : nlohmann::json(nullptr);
    if(!s.error_message.empty()) j["error_message"] = s.error_message;
}

void to_json(nlohmann::json& j, const Network& n){
    j = nlohmann::json{{"id", n.id}, {"name", n.name}, {"subnet", n.subnet},
                       {"datacenter_id", n.datacenter_id}, {"description", n.description}};
}

}
