#pragma once
#include "Probes.h"

namespace rack_scan {

// Banner grabbing and signature-based service naming for open TCP ports.
class ServiceProber : public ServiceProbe {
public:
    ServiceProber(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(3000),
                  std::chrono::milliseconds banner_timeout = std::chrono::milliseconds(2000))
        : connect_timeout_(connect_timeout), banner_timeout_(banner_timeout) {}

    std::vector<ServiceInfo> detect_services(const std::string& ip, const std::vector<int>& ports, const ScanContext& context) override;
    std::optional<ServiceInfo> probe_service(const std::string& ip, int port) const;

    static bool is_http_port(int port);
    static std::optional<std::string> default_service(int port);
    // Token match on the banner, then the port table, then "unknown".
    static std::string classify_banner(const std::string& banner, int port);
    // Word following the first word containing "v" or "Version".
    static std::string parse_version(const std::string& banner);
private:
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds banner_timeout_;
};

}
