#include "scanners/IpRange.h"
#include "core/Errors.h"
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    auto cidr = rack_scan::parse_cidr(input);
    if (cidr) {
        // Every candidate must lie inside the block it came from
        try {
            for (const auto& ip : rack_scan::enumerate_hosts(input, 4096)) {
                std::array<uint8_t,16> addr{}; int family = 0;
                if (!rack_scan::parse_address(ip, addr, family) || !cidr->contains(addr, family)) __builtin_trap();
            }
        } catch (const rack_scan::SubnetTooLargeError&) {
            // too large for the cap
        }
    }
    (void)rack_scan::is_excluded("10.0.0.1", {input});
    return 0;
}
