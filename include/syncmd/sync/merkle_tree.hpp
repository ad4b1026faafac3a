#pragma once

#include "syncmd/sync/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace syncmd::sync {

/**
 * @brief Folds a snapshot into a single root digest
 *
 * Two snapshots with identical path -> digest sets have identical roots,
 * regardless of timestamps or producing device.
 */
class MerkleTree {
public:
    void build(const Snapshot& snapshot);
    void build(const std::vector<FileRecord>& records);

    [[nodiscard]] std::vector<std::string> diff(const MerkleTree& other) const;

    [[nodiscard]] const std::string& root_hash() const noexcept { return root_hash_; }

    [[nodiscard]] bool empty() const noexcept { return leaves_.empty(); }

    [[nodiscard]] const std::map<std::string, std::string>& leaves() const noexcept { return leaves_; }

private:
    static std::string hash_leaf(const FileRecord& record);

    void recompute_root();

    std::map<std::string, std::string> leaves_; // path -> leaf digest
    std::string root_hash_;
};

/// Root digest of @p snapshot; an empty snapshot still yields a well-formed digest.
std::string root_digest(const Snapshot& snapshot);

} // namespace syncmd::sync
