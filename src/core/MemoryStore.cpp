#include "MemoryStore.h"
#include "Errors.h"

namespace rack_scan {

void MemoryStore::add_network(const Network& network){
    std::lock_guard<std::mutex> lock(mutex_);
    networks_[network.id] = network;
}

Network MemoryStore::get_network(const std::string& id){
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = networks_.find(id);
    if(it == networks_.end()) throw NotFoundError("network not found: " + id);
    return it->second;
}

void MemoryStore::create_or_update_discovered_device(const DiscoveredDevice& device){
    if(device.ip.empty()) throw StorageError("discovered device has no ip");
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device.ip);
    if(it == devices_.end()){
        DiscoveredDevice d = device;
        if(d.first_seen == Clock::time_point{}) d.first_seen = d.last_seen;
        devices_.emplace(d.ip, std::move(d));
        return;
    }
    // Overwrite everything but identity and first sighting
    DiscoveredDevice d = device;
    d.id = it->second.id;
    d.first_seen = it->second.first_seen;
    it->second = std::move(d);
}

void MemoryStore::update_discovery_scan(const DiscoveryScan& scan){
    std::lock_guard<std::mutex> lock(mutex_);
    scans_[scan.id] = scan;
    ++scan_updates_;
}

std::optional<DiscoveredDevice> MemoryStore::find_discovered_device(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(ip);
    if(it == devices_.end()) return std::nullopt;
    return it->second;
}

std::vector<DiscoveredDevice> MemoryStore::list_discovered_devices(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiscoveredDevice> out;
    for(const auto& kv : devices_){
        if(network_id.empty() || kv.second.network_id == network_id) out.push_back(kv.second);
    }
    return out;
}

std::optional<DiscoveryScan> MemoryStore::find_scan(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scans_.find(id);
    if(it == scans_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryStore::scan_update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan_updates_;
}

}
