#include "popswarm/core/PopupRegistry.hpp"
#include <algorithm>
#include <mutex>

namespace pswarm {

PopupId PopupRegistry::registerPopup(PopupRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (const auto& entry : entries_) {
        if (entry.second == &record) {
            return entry.first;
        }
    }

    PopupId id = next_id_++;
    record.assignId(id);
    entries_.emplace_back(id, &record);
    return id;
}

bool PopupRegistry::unregisterPopup(PopupId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = std::find_if(entries_.begin(), entries_.end(),
        [id](const auto& entry) { return entry.first == id; });
    if (it == entries_.end()) {
        return false;
    }

    entries_.erase(it);
    return true;
}

std::vector<PopupSnapshot> PopupRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<PopupSnapshot> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.second->snapshot());
    }
    return result;
}

std::vector<Rect> PopupRegistry::siblingGeometries(PopupId exclude) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Rect> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (entry.first == exclude) {
            continue;
        }

        // Registered but not placed yet
        Rect rect = entry.second->getRect();
        if (rect.isEmpty()) {
            continue;
        }

        result.push_back(rect);
    }
    return result;
}

std::vector<PopupId> PopupRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<PopupId> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t PopupRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

bool PopupRegistry::contains(PopupId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
        [id](const auto& entry) { return entry.first == id; });
}

}
