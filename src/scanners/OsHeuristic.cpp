#include "OsHeuristic.h"
#include <algorithm>

namespace rack_scan {

static bool contains_any(const std::vector<int>& ports, std::initializer_list<int> values){
    for(int v : values) if(std::find(ports.begin(), ports.end(), v) != ports.end()) return true;
    return false;
}

OsGuess guess_os(const std::vector<int>& open_ports, const std::vector<ServiceInfo>& services){
    OsGuess g;
    bool windows = contains_any(open_ports, {135, 139, 445, 3389});
    bool linux_ports = contains_any(open_ports, {22, 111, 2049});
    bool unix_ports = contains_any(open_ports, {22, 111});

    if(windows && !linux_ports){
        g.os = "Windows"; g.family = "Windows";
    } else if(linux_ports && !windows){
        g.os = "Linux"; g.family = "Unix";
    } else if(unix_ports){
        g.os = "Unix-like"; g.family = "Unix";
    }

    if(!g.known()){
        for(const auto& svc : services){
            if(svc.service == "SSH"){ g.os = "Linux/Unix"; g.family = "Unix"; break; }
        }
    }
    return g;
}

int calculate_confidence(const DiscoveredDevice& device){
    int score = 50;
    if(!device.mac_address.empty()) score += 20;
    if(!device.hostname.empty()) score += 15;
    if(!device.open_ports.empty()) score += 10;
    if(!device.os_guess.empty()) score += 5;
    return std::min(score, 100);
}

}
