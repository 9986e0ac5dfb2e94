#pragma once
#include "../core/Scanner.h"
#include "../core/DiscoveryStorage.h"
#include "Probes.h"
#include <optional>

namespace rack_scan {

class ScanProgress;

// Built-in scanner: enumerate the subnet, run the per-host pipeline on a
// bounded worker pool, upsert each result and report throttled progress.
class DiscoveryScanner : public Scanner {
public:
    DiscoveryScanner(DiscoveryStorage& storage, ProbeSet probes);

    std::string name() const override { return "builtin"; }
    std::string description() const override { return "ICMP/ARP/TCP discovery with banner-based service and OS inference"; }
    DiscoveryScan scan_network(ScanContext& context, const std::string& network_id,
                               const DiscoveryRule& rule, const ScanUpdateFn& on_update) override;

    // Runs reachability -> identity -> ports -> services -> OS/confidence for
    // one host. Empty when a quick scan finds the host unresponsive.
    std::optional<DiscoveredDevice> scan_host(const ScanContext& context, const std::string& ip, const std::string& network_id,
                                              const DiscoveryRule& rule, const std::string& scan_id);
private:
    void process_host(ScanContext& context, const std::string& ip, const std::string& network_id,
                      const DiscoveryRule& rule, ScanProgress& progress, const ScanUpdateFn& on_update);
    [[noreturn]] void abort_scan(ScanProgress& progress, const std::string& message, const ScanUpdateFn& on_update);

    DiscoveryStorage& storage_;
    ProbeSet probes_;
};

}
