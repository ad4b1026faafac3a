#include "syncmd/sync/merkle_tree.hpp"
#include "syncmd/core/digest.hpp"

#include <algorithm>
#include <sstream>

namespace syncmd::sync {

void MerkleTree::build(const Snapshot& snapshot) {
    build(snapshot.records());
}

void MerkleTree::build(const std::vector<FileRecord>& records) {
    leaves_.clear();
    for (const auto& record : records) {
        leaves_[record.path] = hash_leaf(record);
    }
    recompute_root();
}

std::vector<std::string> MerkleTree::diff(const MerkleTree& other) const {
    if (root_hash_ == other.root_hash_) {
        return {};
    }

    std::vector<std::string> differences;
    for (const auto& [path, hash] : leaves_) {
        const auto theirs = other.leaves_.find(path);
        if (theirs == other.leaves_.end() || theirs->second != hash) {
            differences.push_back(path);
        }
    }
    for (const auto& [path, hash] : other.leaves_) {
        if (leaves_.count(path) == 0) {
            differences.push_back(path);
        }
    }
    std::sort(differences.begin(), differences.end());
    return differences;
}

std::string MerkleTree::hash_leaf(const FileRecord& record) {
    return sha256_hex(record.path + '|' + record.digest);
}

void MerkleTree::recompute_root() {
    std::ostringstream aggregate;
    for (const auto& [path, hash] : leaves_) {
        aggregate << path << ':' << hash << ';';
    }
    root_hash_ = sha256_hex(aggregate.str());
}

std::string root_digest(const Snapshot& snapshot) {
    MerkleTree tree;
    tree.build(snapshot);
    return tree.root_hash();
}

} // namespace syncmd::sync
