#include "syncmd/server/device_registry.hpp"

#include <mutex>

namespace syncmd::server {

void DeviceRegistry::record_handshake(const DeviceInfo& info) {
    std::unique_lock lock(mutex_);
    auto& entry = devices_[info.device_id];
    entry = info;
    entry.last_seen = std::chrono::system_clock::now();
}

void DeviceRegistry::touch(const std::string& device_id) {
    std::unique_lock lock(mutex_);
    auto it = devices_.find(device_id);
    if (it != devices_.end()) {
        it->second.last_seen = std::chrono::system_clock::now();
    }
}

Result<DeviceInfo> DeviceRegistry::find(const std::string& device_id) const {
    std::shared_lock lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return Err<DeviceInfo>(ErrorKind::Auth, "Unknown device: " + device_id);
    }
    return Ok(it->second);
}

std::vector<DeviceInfo> DeviceRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<DeviceInfo> out;
    out.reserve(devices_.size());
    for (const auto& [_, info] : devices_) {
        out.push_back(info);
    }
    return out;
}

bool DeviceRegistry::contains(const std::string& device_id) const {
    std::shared_lock lock(mutex_);
    return devices_.count(device_id) > 0;
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return devices_.size();
}

std::optional<sync::Snapshot> DeviceRegistry::base_snapshot(const std::string& device_id) const {
    std::shared_lock lock(mutex_);
    auto it = bases_.find(device_id);
    if (it == bases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DeviceRegistry::store_base_snapshot(const std::string& device_id, sync::Snapshot snapshot) {
    std::unique_lock lock(mutex_);
    bases_[device_id] = std::move(snapshot);
}

bool DeviceRegistry::remove(const std::string& device_id) {
    std::unique_lock lock(mutex_);
    bases_.erase(device_id);
    return devices_.erase(device_id) > 0;
}

} // namespace syncmd::server
