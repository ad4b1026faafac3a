#pragma once

/**
 * @file device_registry.hpp
 * @brief Devices known to a running server, shared by every connection
 *
 * Read-mostly: connections look up the base snapshot for their peer on every
 * sync request and write only once a handshake or a sync completes.
 *
 * THREAD SAFETY PATTERN:
 * - Readers (find, base_snapshot, list) take a shared_lock
 * - Writers (record_handshake, touch, store_base_snapshot, remove) take a unique_lock
 */

#include "syncmd/core/result.hpp"
#include "syncmd/sync/types.hpp"

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace syncmd::server {

struct DeviceInfo {
    std::string device_id;
    std::string device_name;
    std::string address;
    std::string identity;
    std::chrono::system_clock::time_point last_seen{};
};

class DeviceRegistry {
public:
    /// Insert or refresh the entry for a device that just authenticated.
    void record_handshake(const DeviceInfo& info);

    /// Refresh last_seen; unknown devices are ignored.
    void touch(const std::string& device_id);

    [[nodiscard]] Result<DeviceInfo> find(const std::string& device_id) const;
    [[nodiscard]] std::vector<DeviceInfo> list() const;
    [[nodiscard]] bool contains(const std::string& device_id) const;
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Last snapshot this server and @p device_id agreed on
     *
     * Used as the reconcile base so deletions on either side propagate.
     */
    [[nodiscard]] std::optional<sync::Snapshot> base_snapshot(const std::string& device_id) const;
    void store_base_snapshot(const std::string& device_id, sync::Snapshot snapshot);

    bool remove(const std::string& device_id);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, DeviceInfo> devices_;
    std::unordered_map<std::string, sync::Snapshot> bases_;
};

} // namespace syncmd::server
