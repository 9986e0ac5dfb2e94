// Linux privilege helpers for raw-socket probing (best-effort; compile-time gated)
#pragma once
namespace rack_scan {
void drop_capabilities(bool keep_net_raw);
bool is_privilege_available();
bool has_net_raw_capability();
bool can_open_raw_icmp_socket();
}
