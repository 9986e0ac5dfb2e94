#pragma once
#include "../core/Discovery.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rack_scan {

struct Config;
struct ScanContext;

// Stage seams of the per-host pipeline. Every stage is best-effort: failures
// surface as empty results, never as exceptions for ordinary network errors.

class ReachabilityProbe {
public:
    virtual ~ReachabilityProbe() = default;
    // true = echo reply, false = no reply in time, empty = unknown (no privilege or socket error)
    virtual std::optional<bool> ping(const std::string& ip, std::chrono::milliseconds timeout, const ScanContext& context) = 0;
    virtual bool privileged() const = 0;
};

class IdentityProbe {
public:
    virtual ~IdentityProbe() = default;
    virtual std::optional<std::string> lookup_mac(const std::string& ip, const ScanContext& context) = 0;
    virtual std::optional<std::string> lookup_hostname(const std::string& ip, const ScanContext& context) = 0;
};

class PortProbe {
public:
    virtual ~PortProbe() = default;
    // Ascending list of ports that accepted a connection within the rule's timeout.
    virtual std::vector<int> scan_ports(const std::string& ip, const DiscoveryRule& rule, const ScanContext& context) = 0;
};

class ServiceProbe {
public:
    virtual ~ServiceProbe() = default;
    virtual std::vector<ServiceInfo> detect_services(const std::string& ip, const std::vector<int>& ports, const ScanContext& context) = 0;
};

struct ProbeSet {
    std::unique_ptr<ReachabilityProbe> reachability;
    std::unique_ptr<IdentityProbe> identity;
    std::unique_ptr<PortProbe> ports;
    std::unique_ptr<ServiceProbe> services;

    // Real network probers configured from cfg.
    static ProbeSet make_default(const Config& cfg);
};

}
