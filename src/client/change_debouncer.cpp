#include "syncmd/client/change_debouncer.hpp"

namespace syncmd::client {

const char* to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Created: return "created";
        case ChangeKind::Modified: return "modified";
        case ChangeKind::Deleted: return "deleted";
        case ChangeKind::Renamed: return "renamed";
    }
    return "unknown";
}

ChangeDebouncer::ChangeDebouncer(std::chrono::milliseconds window)
    : window_(window) {}

bool ChangeDebouncer::should_trigger(const std::string& path, Clock::time_point now) {
    std::lock_guard lock(mutex_);
    prune(now);

    auto it = last_trigger_.find(path);
    if (it != last_trigger_.end() && now - it->second < window_) {
        return false;
    }
    last_trigger_[path] = now;
    return true;
}

void ChangeDebouncer::clear() {
    std::lock_guard lock(mutex_);
    last_trigger_.clear();
}

void ChangeDebouncer::prune(Clock::time_point now) {
    for (auto it = last_trigger_.begin(); it != last_trigger_.end();) {
        if (now - it->second >= window_) {
            it = last_trigger_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace syncmd::client
