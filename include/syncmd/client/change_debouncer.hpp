#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace syncmd::client {

enum class ChangeKind {
    Created,
    Modified,
    Deleted,
    Renamed
};

const char* to_string(ChangeKind kind);

/**
 * @brief One filesystem change reported by the watch collaborator
 */
struct ChangeEvent {
    ChangeKind kind = ChangeKind::Modified;
    std::string path;           ///< Terminal path (the destination for renames)
    std::string previous_path;  ///< Source path, renames only
};

/**
 * @brief Collapses repeated events for one path inside a time window
 *
 * The first event for a path triggers; later events for the same path are
 * swallowed until the window since that trigger has elapsed.
 */
class ChangeDebouncer {
public:
    using Clock = std::chrono::steady_clock;

    explicit ChangeDebouncer(std::chrono::milliseconds window);

    bool should_trigger(const std::string& path, Clock::time_point now = Clock::now());

    void clear();

    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }

private:
    void prune(Clock::time_point now);

    std::chrono::milliseconds window_;
    std::mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> last_trigger_;
};

} // namespace syncmd::client
