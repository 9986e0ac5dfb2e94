#include "DeviceBuilder.h"
#include "../core/Ids.h"
#include <stdexcept>

namespace rack_scan {

DeviceBuilder::DeviceBuilder(std::string ip, std::string network_id, std::string scan_id){
    device_.ip = std::move(ip);
    device_.network_id = std::move(network_id);
    device_.last_scan_id = std::move(scan_id);
    device_.status = DeviceStatus::Unknown;
}

void DeviceBuilder::set_mac(std::optional<std::string> mac){
    if(mac) device_.mac_address = std::move(*mac);
}

void DeviceBuilder::set_hostname(std::optional<std::string> hostname){
    if(hostname) device_.hostname = std::move(*hostname);
}

void DeviceBuilder::set_open_ports(std::vector<int> ports){
    device_.open_ports = std::move(ports);
    if(!device_.open_ports.empty() && device_.status == DeviceStatus::Unknown) device_.status = DeviceStatus::Online;
}

void DeviceBuilder::set_services(std::vector<ServiceInfo> services){
    device_.services = std::move(services);
}

void DeviceBuilder::set_os(const OsGuess& guess){
    device_.os_guess = guess.os;
    device_.os_family = guess.family;
}

DiscoveredDevice DeviceBuilder::finalize(){
    if(finalized_) throw std::logic_error("DeviceBuilder::finalize called twice");
    finalized_ = true;
    device_.id = generate_id();
    device_.last_seen = Clock::now();
    device_.first_seen = device_.last_seen;
    device_.confidence = calculate_confidence(device_);
    return std::move(device_);
}

}
