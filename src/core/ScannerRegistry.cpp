#include "ScannerRegistry.h"
#include "ScanContext.h"
#include "Logging.h"
#include "Errors.h"
#include "../scanners/DiscoveryScanner.h"

namespace rack_scan {

void ScannerRegistry::register_scanner(ScannerPtr scanner) {
    // Later registrations replace earlier ones with the same name
    for(auto& s : scanners_) {
        if(s->name() == scanner->name()) { s = std::move(scanner); return; }
    }
    scanners_.push_back(std::move(scanner));
}

void ScannerRegistry::register_all_default(DiscoveryStorage& storage) {
    register_scanner(std::make_unique<DiscoveryScanner>(storage, ProbeSet::make_default(config())));
}

Scanner* ScannerRegistry::find(const std::string& name) const {
    for(const auto& s : scanners_) if(s->name() == name) return s.get();
    return nullptr;
}

std::vector<std::string> ScannerRegistry::names() const {
    std::vector<std::string> out;
    for(const auto& s : scanners_) out.push_back(s->name());
    return out;
}

DiscoveryScan ScannerRegistry::run(const std::string& name, ScanContext& context, const std::string& network_id,
                                   const DiscoveryRule& rule, const ScanUpdateFn& on_update) {
    Scanner* s = find(name);
    if(!s) throw ScanError("unknown scanner: " + name);
    Logger::instance().debug("Starting scanner: " + s->name());
    DiscoveryScan result = s->scan_network(context, network_id, rule, on_update);
    Logger::instance().debug("Finished scanner: " + s->name());
    return result;
}

}
