#include "ConfigValidator.h"
#include "Discovery.h"
#include <iostream>
#include <fstream>
#include <algorithm>

namespace rack_scan {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(cfg.subnet.empty()) {
        std::cerr << "--subnet is required\n";
        return false;
    }
    if(cfg.network_id.empty()) {
        std::cerr << "--network-id must not be empty\n";
        return false;
    }

    if(!parse_scan_type(cfg.scan_type)) {
        std::cerr << "Invalid --scan-type value: " << cfg.scan_type << "\n";
        return false;
    }
    if(!parse_port_scan_type(cfg.port_scan_type)) {
        std::cerr << "Invalid --port-scan-type value: " << cfg.port_scan_type << "\n";
        return false;
    }

    for(int p : cfg.custom_ports) {
        if(!valid_port(p)) {
            std::cerr << "Port out of range (1-65535): " << p << "\n";
            return false;
        }
    }
    // --ports implies a custom port set
    if(!cfg.custom_ports.empty() && cfg.port_scan_type == "common") {
        cfg.port_scan_type = "custom";
    }
    std::sort(cfg.custom_ports.begin(), cfg.custom_ports.end());
    cfg.custom_ports.erase(std::unique(cfg.custom_ports.begin(), cfg.custom_ports.end()), cfg.custom_ports.end());

    if(cfg.timeout_seconds <= 0) {
        std::cerr << "--timeout must be positive\n";
        return false;
    }
    if(cfg.timeout_seconds > kMaxTimeoutSeconds) {
        std::cerr << "--timeout must not exceed " << kMaxTimeoutSeconds << " seconds\n";
        return false;
    }
    if(cfg.max_concurrent_hosts <= 0) {
        std::cerr << "--concurrency must be positive\n";
        return false;
    }
    if(cfg.progress_interval <= 0) {
        std::cerr << "--progress-interval must be positive\n";
        return false;
    }
    if(cfg.max_hosts <= 0) {
        std::cerr << "--max-hosts must be positive\n";
        return false;
    }
    if(cfg.service_connect_timeout_ms <= 0 || cfg.banner_timeout_ms <= 0) {
        std::cerr << "Service probe timeouts must be positive\n";
        return false;
    }

    // Drop empty exclusion entries produced by sloppy CSV
    cfg.exclude_ips.erase(std::remove(cfg.exclude_ips.begin(), cfg.exclude_ips.end(), std::string()), cfg.exclude_ips.end());
    return true;
}

bool ConfigValidator::load_external_files(Config& cfg) {
    if(cfg.exclude_file.empty()) return true;
    return load_exclude_file(cfg);
}

bool ConfigValidator::load_exclude_file(Config& cfg) {
    std::ifstream ef(cfg.exclude_file);
    if(!ef) {
        std::cerr << "Failed to open exclude file: " << cfg.exclude_file << "\n";
        return false;
    }

    std::string line;
    while(std::getline(ef, line)) {
        size_t start = line.find_first_not_of(" \t");
        if(start == std::string::npos) continue;
        line = line.substr(start);
        size_t end = line.find_last_not_of(" \t\r");
        line = line.substr(0, end + 1);
        if(line[0] == '#') continue; // Skip comments
        cfg.exclude_ips.push_back(line);
    }
    return true;
}

} // namespace rack_scan
