#pragma once
#include "Probes.h"
#include <atomic>
#include <cstdint>

namespace rack_scan {

// One ICMP echo over a raw IPv4 socket. Privilege is probed once at construction.
class PingProber : public ReachabilityProbe {
public:
    PingProber();
    explicit PingProber(bool privileged) : privileged_(privileged) {}

    std::optional<bool> ping(const std::string& ip, std::chrono::milliseconds timeout, const ScanContext& context) override;
    bool privileged() const override { return privileged_; }

    static uint16_t checksum(const uint8_t* data, size_t len);
private:
    bool privileged_;
    std::atomic<uint16_t> sequence_{0};
};

}
