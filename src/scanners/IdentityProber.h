#pragma once
#include "Probes.h"
#include <istream>

namespace rack_scan {

// MAC via the kernel neighbour table, hostname via reverse DNS.
class IdentityProber : public IdentityProbe {
public:
    explicit IdentityProber(std::string arp_table_path = "/proc/net/arp",
                            std::chrono::milliseconds settle = std::chrono::milliseconds(250))
        : arp_table_path_(std::move(arp_table_path)), settle_(settle) {}

    std::optional<std::string> lookup_mac(const std::string& ip, const ScanContext& context) override;
    std::optional<std::string> lookup_hostname(const std::string& ip, const ScanContext& context) override;

    // Finds a completed entry for ip in /proc/net/arp formatted input.
    static std::optional<std::string> parse_arp_table(std::istream& in, const std::string& ip);
private:
    std::optional<std::string> read_table(const std::string& ip) const;
    static void solicit(const std::string& ip);

    std::string arp_table_path_;
    std::chrono::milliseconds settle_;
};

}
