#pragma once
#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <optional>

namespace rack_scan {

using Clock = std::chrono::system_clock;

enum class ScanType { Quick, Full, Deep };
enum class PortScanType { Common, Full, Custom };
enum class ScanStatus { Pending, Running, Completed, Failed };
enum class DeviceStatus { Unknown, Online };

const char* to_string(ScanType t);
const char* to_string(PortScanType t);
const char* to_string(ScanStatus s);
const char* to_string(DeviceStatus s);
std::optional<ScanType> parse_scan_type(const std::string& s);
std::optional<PortScanType> parse_port_scan_type(const std::string& s);

// quick=1, full=3, deep=5
int scan_depth_for(ScanType t);

struct Network {
    std::string id;
    std::string name;
    std::string subnet; // CIDR, e.g. 192.168.1.0/24
    std::string datacenter_id;
    std::string description;
};

// Per-network discovery policy; immutable for the duration of a scan.
struct DiscoveryRule {
    ScanType scan_type = ScanType::Full;
    bool scan_ports = true;
    PortScanType port_scan_type = PortScanType::Common;
    std::set<int> custom_ports;
    bool service_detection = true;
    bool os_detection = true;
    std::vector<std::string> exclude_ips; // literal addresses or CIDR blocks
    int timeout_seconds = 5;

    std::chrono::milliseconds timeout() const { return std::chrono::seconds(timeout_seconds); }
};

struct DiscoveryScan {
    std::string id;
    std::string network_id;
    ScanStatus status = ScanStatus::Pending;
    ScanType scan_type = ScanType::Full;
    int scan_depth = 0;
    int total_hosts = 0;
    int scanned_hosts = 0;
    int found_hosts = 0;
    double progress_percent = 0.0;
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> completed_at;
    int duration_seconds = 0;
    std::string error_message;

    bool terminal() const { return status == ScanStatus::Completed || status == ScanStatus::Failed; }
};

struct ServiceInfo {
    int port = 0;
    std::string protocol = "tcp";
    std::string banner;
    std::string service;
    std::string version;
};

struct DiscoveredDevice {
    std::string id;
    std::string ip;
    std::string mac_address;
    std::string hostname;
    std::string network_id;
    DeviceStatus status = DeviceStatus::Unknown;
    int confidence = 50;
    std::string os_guess;
    std::string os_family;
    std::vector<int> open_ports;
    std::vector<ServiceInfo> services;
    std::string last_scan_id;
    Clock::time_point first_seen{};
    Clock::time_point last_seen{};
};

}
