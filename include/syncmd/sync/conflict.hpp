#pragma once

#include "syncmd/core/result.hpp"
#include "syncmd/sync/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace syncmd::sync {

enum class Winner {
    Local,
    Remote
};

struct ConflictResolutionResult {
    FileRecord resolved;
    FileRecord other;
    Winner winner = Winner::Local;
};

/**
 * @brief Operations that bring two sides into agreement
 */
struct ReconcilePlan {
    std::vector<SyncOperation> apply_locally;
    std::vector<SyncOperation> apply_remotely;
};

class ConflictResolver {
public:
    /**
     * @brief Last-writer-wins on modified_time; an exact tie keeps the local record
     *
     * Both records must name the same path.
     */
    [[nodiscard]] Result<ConflictResolutionResult> resolve(const FileRecord& local,
                                                           const FileRecord& remote) const;

    /**
     * @brief Bidirectional reconciliation of two snapshots
     *
     * @param base Last snapshot both sides agreed on; enables deletion propagation
     */
    [[nodiscard]] ReconcilePlan reconcile(const Snapshot& local,
                                          const Snapshot& remote,
                                          const std::optional<Snapshot>& base = std::nullopt) const;

    /**
     * @brief Content-level resolution for the tracked text format
     *
     * A strictly newer side wins outright; an exact tie is structurally merged.
     */
    [[nodiscard]] std::string resolve_content(const std::string& local_content,
                                              const std::string& remote_content,
                                              const std::string& base_content,
                                              const FileRecord& local,
                                              const FileRecord& remote) const;
};

} // namespace syncmd::sync
