#include "Discovery.h"
#include <algorithm>
#include <cctype>

namespace rack_scan {

namespace {
std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}
}

const char* to_string(ScanType t){
    switch(t){
        case ScanType::Quick: return "quick";
        case ScanType::Full: return "full";
        case ScanType::Deep: return "deep";
    }
    return "full";
}

const char* to_string(PortScanType t){
    switch(t){
        case PortScanType::Common: return "common";
        case PortScanType::Full: return "full";
        case PortScanType::Custom: return "custom";
    }
    return "common";
}

const char* to_string(ScanStatus s){
    switch(s){
        case ScanStatus::Pending: return "pending";
        case ScanStatus::Running: return "running";
        case ScanStatus::Completed: return "completed";
        case ScanStatus::Failed: return "failed";
    }
    return "pending";
}

const char* to_string(DeviceStatus s){
    return s == DeviceStatus::Online ? "online" : "unknown";
}

std::optional<ScanType> parse_scan_type(const std::string& s){
    auto v = lower(s);
    if(v=="quick") return ScanType::Quick;
    if(v=="full") return ScanType::Full;
    if(v=="deep") return ScanType::Deep;
    return std::nullopt;
}

std::optional<PortScanType> parse_port_scan_type(const std::string& s){
    auto v = lower(s);
    if(v=="common") return PortScanType::Common;
    if(v=="full") return PortScanType::Full;
    if(v=="custom") return PortScanType::Custom;
    return std::nullopt;
}

int scan_depth_for(ScanType t){
    switch(t){
        case ScanType::Quick: return 1;
        case ScanType::Full: return 3;
        case ScanType::Deep: return 5;
    }
    return 2;
}

}
