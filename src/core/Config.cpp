#include "Config.h"

namespace rack_scan {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

DiscoveryRule make_rule(const Config& cfg){
    DiscoveryRule r;
    r.scan_type = parse_scan_type(cfg.scan_type).value_or(ScanType::Full);
    r.scan_ports = cfg.scan_ports;
    r.port_scan_type = parse_port_scan_type(cfg.port_scan_type).value_or(PortScanType::Common);
    r.custom_ports.insert(cfg.custom_ports.begin(), cfg.custom_ports.end());
    r.service_detection = cfg.service_detection;
    r.os_detection = cfg.os_detection;
    r.exclude_ips = cfg.exclude_ips;
    r.timeout_seconds = cfg.timeout_seconds;
    return r;
}
}
