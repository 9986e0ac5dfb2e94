#pragma once
#include <string>
#include <vector>
#include "Discovery.h"

namespace rack_scan {

struct Config {
    // Target network (seeded into the store by the CLI)
    std::string network_id = "cli";
    std::string network_name;
    std::string subnet; // CIDR, required
    // Discovery rule
    std::string scan_type = "full"; // quick | full | deep
    bool scan_ports = true;
    std::string port_scan_type = "common"; // common | full | custom
    std::vector<int> custom_ports;
    bool service_detection = true;
    bool os_detection = true;
    std::vector<std::string> exclude_ips; // literal IPs or CIDR blocks
    std::string exclude_file; // newline-delimited exclusions (comments starting with #)
    int timeout_seconds = 5;
    // Orchestration tuning
    int max_concurrent_hosts = 5; // kept low so store writes do not contend
    int progress_interval = 50; // report every N scanned hosts (and on the last)
    long max_hosts = 1L << 20; // refuse subnets that enumerate more candidates
    int service_connect_timeout_ms = 3000;
    int banner_timeout_ms = 2000;
    std::string arp_table_path = "/proc/net/arp";
    std::string scanner_name = "builtin";
    // Output
    std::string output_file; // empty = stdout
    bool pretty = false;
    bool compact = false;
    bool ndjson = false;
    std::string log_level = "info";
    bool progress = false; // log every progress report at info level
    // Privilege
    bool drop_priv = false; // drop all capabilities except CAP_NET_RAW
    bool list_scanners = false;
};

Config& config();
void set_config(const Config& c);

// Builds the immutable per-scan rule. Assumes the config was validated.
DiscoveryRule make_rule(const Config& cfg);

}
