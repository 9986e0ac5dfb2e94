#include "Probes.h"
#include "PingProber.h"
#include "IdentityProber.h"
#include "PortProber.h"
#include "ServiceProber.h"
#include "../core/Config.h"

namespace rack_scan {

ProbeSet ProbeSet::make_default(const Config& cfg){
    ProbeSet p;
    p.reachability = std::make_unique<PingProber>();
    p.identity = std::make_unique<IdentityProber>(cfg.arp_table_path);
    p.ports = std::make_unique<PortProber>();
    p.services = std::make_unique<ServiceProber>(std::chrono::milliseconds(cfg.service_connect_timeout_ms),
                                                 std::chrono::milliseconds(cfg.banner_timeout_ms));
    return p;
}

}
