#pragma once

#include "syncmd/core/result.hpp"
#include "syncmd/sync/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace syncmd::sync {

/**
 * @brief Walks a sync root and produces a fresh Snapshot on every pass
 *
 * Hidden path components (leading '.') are never descended into or indexed.
 * Only files passing is_eligible() are tracked. Unreadable individual files
 * are skipped; a root that cannot be walked fails the pass.
 */
class SnapshotIndexer {
public:
    SnapshotIndexer(std::string device_id, std::filesystem::path root);

    [[nodiscard]] Result<Snapshot> index() const;

    /**
     * @brief Eligibility policy shared with the filesystem-watch collaborator
     *
     * @param relative_path Path relative to the root (any separator style)
     */
    [[nodiscard]] static bool is_eligible(const std::filesystem::path& relative_path);

    [[nodiscard]] static bool is_hidden(const std::filesystem::path& relative_path);

    /**
     * @brief Resolve a relative path under the root, rejecting absolute paths and '..'
     */
    [[nodiscard]] Result<std::filesystem::path> resolve(const std::string& relative_path) const;

    [[nodiscard]] Result<FileRecord> build_record(const std::string& relative_path) const;

    Result<std::vector<std::uint8_t>> read_content(const std::string& relative_path) const;
    Result<void> write_content(const std::string& relative_path, const std::vector<std::uint8_t>& content) const;
    Result<void> delete_file(const std::string& relative_path) const;

    const std::string& device_id() const noexcept { return device_id_; }
    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::string device_id_;
    std::filesystem::path root_;
};

/**
 * @brief Compare two snapshots of the same root
 *
 * Add for paths new in @p next, Update for paths whose digest changed,
 * Delete for paths gone from @p next. Identical paths produce nothing.
 * The result is a set; its order carries no temporal meaning.
 */
std::vector<SyncOperation> diff(const Snapshot& previous, const Snapshot& next);

/**
 * @brief Convert a filesystem timestamp to seconds since the epoch
 */
std::time_t to_time_t(std::filesystem::file_time_type time);
std::filesystem::file_time_type from_time_t(std::time_t time);

} // namespace syncmd::sync
