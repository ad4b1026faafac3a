#include "syncmd/sync/conflict.hpp"
#include "syncmd/sync/merge.hpp"

#include <spdlog/spdlog.h>

namespace syncmd::sync {

Result<ConflictResolutionResult> ConflictResolver::resolve(const FileRecord& local,
                                                           const FileRecord& remote) const {
    if (local.path != remote.path) {
        return Err<ConflictResolutionResult>(ErrorKind::PathResolution,
                                             "Cannot resolve records for different paths: " + local.path +
                                                 " vs " + remote.path);
    }

    if (remote.modified_time > local.modified_time) {
        return Ok(ConflictResolutionResult{remote, local, Winner::Remote});
    }
    return Ok(ConflictResolutionResult{local, remote, Winner::Local});
}

ReconcilePlan ConflictResolver::reconcile(const Snapshot& local,
                                          const Snapshot& remote,
                                          const std::optional<Snapshot>& base) const {
    ReconcilePlan plan;

    // One-sided paths: either new on that side, or deleted on the other since base.
    auto one_sided = [&](const FileRecord& present,
                         std::vector<SyncOperation>& present_side,
                         std::vector<SyncOperation>& missing_side) {
        const FileRecord* ancestor = nullptr;
        if (base) {
            const auto it = base->files.find(present.path);
            if (it != base->files.end()) {
                ancestor = &it->second;
            }
        }

        if (ancestor == nullptr) {
            missing_side.emplace_back(AddOp{present});
        } else if (ancestor->digest == present.digest) {
            present_side.emplace_back(DeleteOp{present.path});
        } else {
            // Modified on one side, deleted on the other: the modification survives.
            missing_side.emplace_back(AddOp{present});
        }
    };

    for (const auto& [path, local_record] : local.files) {
        const auto it = remote.files.find(path);
        if (it == remote.files.end()) {
            one_sided(local_record, plan.apply_locally, plan.apply_remotely);
            continue;
        }

        const auto& remote_record = it->second;
        if (local_record.digest == remote_record.digest) {
            continue;
        }

        auto resolution = resolve(local_record, remote_record);
        if (resolution.is_error()) {
            spdlog::warn("Conflict on {} left unresolved: {}", path, resolution.error().message);
            continue;
        }
        if (resolution.value().winner == Winner::Remote) {
            plan.apply_locally.emplace_back(UpdateOp{resolution.value().resolved});
        } else {
            plan.apply_remotely.emplace_back(UpdateOp{resolution.value().resolved});
        }
    }

    for (const auto& [path, remote_record] : remote.files) {
        if (!local.contains(path)) {
            one_sided(remote_record, plan.apply_remotely, plan.apply_locally);
        }
    }

    return plan;
}

std::string ConflictResolver::resolve_content(const std::string& local_content,
                                              const std::string& remote_content,
                                              const std::string& base_content,
                                              const FileRecord& local,
                                              const FileRecord& remote) const {
    if (local.modified_time > remote.modified_time) {
        return local_content;
    }
    if (remote.modified_time > local.modified_time) {
        return remote_content;
    }
    return merge_document(local_content, remote_content, base_content).content;
}

} // namespace syncmd::sync
