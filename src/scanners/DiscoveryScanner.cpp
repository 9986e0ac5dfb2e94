#include "DiscoveryScanner.h"
#include "DeviceBuilder.h"
#include "IpRange.h"
#include "OsHeuristic.h"
#include "../core/Errors.h"
#include "../core/Ids.h"
#include "../core/Logging.h"
#include "../core/ScanContext.h"
#include "../core/ScanProgress.h"
#include "../core/WorkQueue.h"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace rack_scan {

DiscoveryScanner::DiscoveryScanner(DiscoveryStorage& storage, ProbeSet probes)
    : storage_(storage), probes_(std::move(probes)) {
    if(!probes_.reachability || !probes_.identity || !probes_.ports || !probes_.services)
        throw std::invalid_argument("DiscoveryScanner requires all probes");
}

void DiscoveryScanner::abort_scan(ScanProgress& progress, const std::string& message, const ScanUpdateFn& on_update){
    progress.fail(message);
    auto snap = progress.snapshot();
    progress.report(snap, on_update);
    Logger::instance().error("Network scan failed", {{"scan_id", snap.id}, {"network_id", snap.network_id}, {"error", message}});
    throw ScanError(message);
}

DiscoveryScan DiscoveryScanner::scan_network(ScanContext& context, const std::string& network_id,
                                             const DiscoveryRule& rule, const ScanUpdateFn& on_update){
    const Config& cfg = context.config;

    DiscoveryScan scan;
    scan.id = generate_id();
    scan.network_id = network_id;
    scan.status = ScanStatus::Running;
    scan.scan_type = rule.scan_type;
    scan.scan_depth = scan_depth_for(rule.scan_type);
    scan.started_at = Clock::now();

    ScanProgress progress(scan, cfg.progress_interval);
    progress.report(progress.snapshot(), on_update);

    Network network;
    try {
        network = storage_.get_network(network_id);
    } catch(const std::exception& ex) {
        abort_scan(progress, std::string("getting network: ") + ex.what(), on_update);
    }

    std::vector<std::string> hosts;
    try {
        hosts = enumerate_hosts(network.subnet, cfg.max_hosts);
    } catch(const InvalidSubnetError& ex) {
        abort_scan(progress, std::string("generating IP list: ") + ex.what(), on_update);
    } catch(const SubnetTooLargeError& ex) {
        abort_scan(progress, std::string("generating IP list: ") + ex.what(), on_update);
    }

    progress.set_total(static_cast<int>(hosts.size()));
    progress.report(progress.snapshot(), on_update);

    size_t pool = std::min(hosts.size(), static_cast<size_t>(std::max(1, cfg.max_concurrent_hosts)));
    Logger::instance().info("Starting network scan", {{"scan_id", scan.id}, {"network_id", network_id},
        {"subnet", network.subnet}, {"hosts", std::to_string(hosts.size())}, {"max_concurrent", std::to_string(pool)}});
    Logger::instance().debug("Scan configuration", {{"type", to_string(rule.scan_type)},
        {"scan_ports", rule.scan_ports ? "true" : "false"}, {"timeout", std::to_string(rule.timeout_seconds)}});

    WorkQueue<std::string> queue;
    for(auto& ip : hosts) queue.push(std::move(ip));
    queue.shutdown();

    std::vector<std::thread> workers;
    workers.reserve(pool);
    for(size_t i=0; i<pool; ++i){
        workers.emplace_back([&]{
            while(auto ip = queue.pop()) process_host(context, *ip, network_id, rule, progress, on_update);
        });
    }
    for(auto& t : workers) t.join();

    if(context.cancelled()){
        Logger::instance().warn("Network scan cancelled", {{"scan_id", scan.id}});
        progress.complete("scan cancelled");
    } else {
        progress.complete();
    }
    DiscoveryScan final_scan = progress.snapshot();
    progress.report(final_scan, on_update);

    Logger::instance().info("Network scan completed", {{"scan_id", final_scan.id}, {"network_id", network_id},
        {"found", std::to_string(final_scan.found_hosts)}, {"duration", std::to_string(final_scan.duration_seconds)}});
    return final_scan;
}

void DiscoveryScanner::process_host(ScanContext& context, const std::string& ip, const std::string& network_id,
                                    const DiscoveryRule& rule, ScanProgress& progress, const ScanUpdateFn& on_update){
    const std::string& scan_id = progress.scan_id();
    try {
        if(context.cancelled()) {
            Logger::instance().trace("Skipping " + ip + " (cancelled)");
        } else if(is_excluded(ip, rule.exclude_ips)) {
            Logger::instance().debug("Skipping excluded host", {{"ip", ip}});
        } else if(auto device = scan_host(context, ip, network_id, rule, scan_id)) {
            progress.record_found();
            Logger::instance().debug("Device discovered", {{"ip", ip}, {"status", to_string(device->status)},
                {"ports", std::to_string(device->open_ports.size())}});
            try {
                storage_.create_or_update_discovered_device(*device);
            } catch(const std::exception& ex) {
                Logger::instance().error("Failed to save discovered device", {{"ip", ip}, {"error", ex.what()}});
            }
        }
    } catch(const std::exception& ex) {
        Logger::instance().debug("Host scan failed", {{"ip", ip}, {"error", ex.what()}});
    }

    if(auto snap = progress.record_scanned()) {
        Logger::instance().info("Scan progress", {{"scanned", std::to_string(snap->scanned_hosts)},
            {"total", std::to_string(snap->total_hosts)}, {"found", std::to_string(snap->found_hosts)}});
        progress.report(*snap, on_update);
    }
}

std::optional<DiscoveredDevice> DiscoveryScanner::scan_host(const ScanContext& context, const std::string& ip, const std::string& network_id,
                                                            const DiscoveryRule& rule, const std::string& scan_id){
    Logger::instance().trace("Scanning host " + ip);

    // Stage 1: reachability
    std::optional<bool> reach = probes_.reachability->ping(ip, rule.timeout(), context);
    bool alive = reach.value_or(false);

    // Quick scans rely on ICMP alone
    if(rule.scan_type == ScanType::Quick && !alive) return std::nullopt;

    DeviceBuilder builder(ip, network_id, scan_id);

    // Stage 2: identity, only for hosts that answered
    if(alive) {
        builder.mark_online();
        if(!context.cancelled()) builder.set_mac(probes_.identity->lookup_mac(ip, context));
        if(!context.cancelled()) builder.set_hostname(probes_.identity->lookup_hostname(ip, context));
    }

    // Stage 3: ports, attempted even when ICMP gave nothing
    if(rule.scan_ports && rule.scan_type != ScanType::Quick && !context.cancelled()) {
        builder.set_open_ports(probes_.ports->scan_ports(ip, rule, context));
    }

    // Stage 4: services
    if(rule.service_detection && !builder.open_ports().empty() && !context.cancelled()) {
        builder.set_services(probes_.services->detect_services(ip, builder.open_ports(), context));
    }

    // Stage 5: OS heuristic
    if(rule.os_detection) {
        builder.set_os(guess_os(builder.open_ports(), builder.services()));
    }

    return builder.finalize();
}

}
