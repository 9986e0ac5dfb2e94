#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/MemoryStore.h"
#include "core/Privilege.h"
#include "core/ScanContext.h"
#include "core/ScannerRegistry.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace rack_scan;

namespace {
std::atomic<ScanContext*> g_context{nullptr};
void handle_signal(int){ if(auto* ctx = g_context.load()) ctx->cancel(); }
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)){ std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n"; return 2; }
    Logger::instance().set_level(lvl);

    MemoryStore store;
    ScannerRegistry registry;
    if(cfg.list_scanners){
        set_config(cfg);
        registry.register_all_default(store);
        for(const auto& n : registry.names()) std::cout << n << "\n";
        return 0;
    }

    ConfigValidator validator;
    if(!validator.load_external_files(cfg)) return 2;
    if(!validator.validate(cfg)) return 2;
    set_config(cfg);

    if(cfg.drop_priv){ drop_capabilities(true); }

    Network network;
    network.id = cfg.network_id;
    network.name = cfg.network_name.empty() ? cfg.subnet : cfg.network_name;
    network.subnet = cfg.subnet;
    store.add_network(network);

    registry.register_all_default(store);

    ScanContext context(cfg);
    g_context.store(&context);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    DiscoveryRule rule = make_rule(cfg);
    DiscoveryScan last_update;
    auto on_update = [&](const DiscoveryScan& scan){
        last_update = scan;
        store.update_discovery_scan(scan);
        if(cfg.progress){
            std::ostringstream pct; pct << std::fixed << std::setprecision(1) << scan.progress_percent;
            Logger::instance().info("Scan update", {{"status", to_string(scan.status)},
                {"scanned", std::to_string(scan.scanned_hosts) + "/" + std::to_string(scan.total_hosts)},
                {"found", std::to_string(scan.found_hosts)}, {"percent", pct.str()}});
        }
    };

    int rc = 0;
    DiscoveryScan final_scan;
    try {
        final_scan = registry.run(cfg.scanner_name, context, network.id, rule, on_update);
    } catch(const ScanError& ex) {
        std::cerr << "Scan failed: " << ex.what() << "\n";
        final_scan = last_update;
        rc = 1;
    } catch(const std::exception& ex) {
        std::cerr << "Scan error: " << ex.what() << "\n";
        rc = 1;
    }
    g_context.store(nullptr);
    if(rc != 0 && final_scan.status != ScanStatus::Failed) return rc; // nothing terminal to report

    JSONWriter writer;
    std::string json = writer.write(final_scan, store.list_discovered_devices(network.id), cfg);
    if(cfg.output_file.empty()) std::cout << json;
    else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs){ std::cerr << "Cannot write output file: " << cfg.output_file << "\n"; return 1; }
        ofs << json;
    }
    return rc;
}
