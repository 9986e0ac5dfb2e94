#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include <nlohmann/json.hpp>
#include <sys/utsname.h>

namespace rack_scan {

namespace {
nlohmann::json build_meta(const DiscoveryScan& scan, const Config& cfg){
    nlohmann::json meta;
    meta["tool"] = "rack-scan";
    meta["version"] = buildinfo::APP_VERSION;
    meta["json_schema_version"] = "1";
    struct utsname u{};
    if(uname(&u) == 0) meta["hostname"] = u.nodename;
    meta["generated_at"] = jsonutil::time_to_iso(Clock::now());
    meta["scanner"] = cfg.scanner_name;
    meta["subnet"] = cfg.subnet;
    meta["rule"] = {
        {"scan_type", cfg.scan_type}, {"scan_ports", cfg.scan_ports}, {"port_scan_type", cfg.port_scan_type},
        {"custom_ports", cfg.custom_ports}, {"service_detection", cfg.service_detection},
        {"os_detection", cfg.os_detection}, {"exclude_ips", cfg.exclude_ips}, {"timeout_seconds", cfg.timeout_seconds}
    };
    meta["scan_id"] = scan.id;
    return meta;
}
}

std::string JSONWriter::write(const DiscoveryScan& scan, const std::vector<DiscoveredDevice>& devices, const Config& cfg) const {
    nlohmann::json meta = build_meta(scan, cfg);
    if(cfg.ndjson){
        std::string out;
        out += nlohmann::json{{"type", "meta"}, {"meta", meta}}.dump() + "\n";
        out += nlohmann::json{{"type", "scan"}, {"scan", scan}}.dump() + "\n";
        for(const auto& d : devices) out += nlohmann::json{{"type", "device"}, {"device", d}}.dump() + "\n";
        return out;
    }
    nlohmann::json doc;
    doc["meta"] = meta;
    doc["scan"] = scan;
    doc["devices"] = nlohmann::json::array();
    for(const auto& d : devices) doc["devices"].push_back(d);
    doc["summary"] = {{"device_count", devices.size()}, {"found_hosts", scan.found_hosts}, {"total_hosts", scan.total_hosts}};
    int indent = (cfg.pretty && !cfg.compact) ? 2 : -1;
    return doc.dump(indent) + "\n";
}

}
