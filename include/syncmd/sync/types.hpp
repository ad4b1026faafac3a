#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace syncmd::sync {

/**
 * @brief One tracked file as seen by one device
 *
 * Records are never mutated after creation; a changed file produces a new
 * record in the next snapshot.
 */
struct FileRecord {
    std::string path;              ///< Relative to the sync root, POSIX separators
    std::string digest;            ///< SHA-256 of the file bytes (hex)
    std::uint64_t size = 0;
    std::time_t modified_time = 0;
    std::time_t created_time = 0;
    std::uint64_t version = 0;     ///< Seconds since epoch of the last modification
    std::string device_id;         ///< Device that produced this record

    bool operator==(const FileRecord& other) const {
        return path == other.path && digest == other.digest && size == other.size &&
               modified_time == other.modified_time && created_time == other.created_time &&
               version == other.version && device_id == other.device_id;
    }
    bool operator!=(const FileRecord& other) const { return !(*this == other); }
};

/**
 * @brief Complete inventory of one sync root
 *
 * Ordered by path so that iteration (and anything derived from it, such as
 * the root digest) is deterministic.
 */
struct Snapshot {
    std::string device_id;
    std::filesystem::path root;
    std::map<std::string, FileRecord> files;

    bool contains(const std::string& path) const { return files.count(path) > 0; }
    std::size_t size() const noexcept { return files.size(); }
    bool empty() const noexcept { return files.empty(); }

    std::vector<FileRecord> records() const {
        std::vector<FileRecord> out;
        out.reserve(files.size());
        for (const auto& [_, record] : files) {
            out.push_back(record);
        }
        return out;
    }

    static Snapshot from_records(std::string device_id, const std::vector<FileRecord>& records) {
        Snapshot snapshot;
        snapshot.device_id = std::move(device_id);
        for (const auto& record : records) {
            snapshot.files[record.path] = record;
        }
        return snapshot;
    }
};

struct AddOp {
    FileRecord record;
};

struct UpdateOp {
    FileRecord record;
};

struct DeleteOp {
    std::string path;
};

/**
 * @brief Desired end state for a single path, produced by diff/reconcile
 */
using SyncOperation = std::variant<AddOp, UpdateOp, DeleteOp>;

inline const std::string& operation_path(const SyncOperation& op) {
    if (const auto* add = std::get_if<AddOp>(&op)) {
        return add->record.path;
    }
    if (const auto* update = std::get_if<UpdateOp>(&op)) {
        return update->record.path;
    }
    return std::get<DeleteOp>(op).path;
}

/// Add and Update carry content that must follow on the wire.
inline const FileRecord* operation_record(const SyncOperation& op) {
    if (const auto* add = std::get_if<AddOp>(&op)) {
        return &add->record;
    }
    if (const auto* update = std::get_if<UpdateOp>(&op)) {
        return &update->record;
    }
    return nullptr;
}

inline const char* operation_name(const SyncOperation& op) {
    switch (op.index()) {
        case 0: return "add";
        case 1: return "update";
        default: return "delete";
    }
}

} // namespace syncmd::sync
