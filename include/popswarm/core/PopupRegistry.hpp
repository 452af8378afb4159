#pragma once

/**
 * @file PopupRegistry.hpp
 * @brief Ordered set of live popups, shared by every lifecycle controller
 *
 * Writers (register/unregister) take the lock exclusively; readers take it
 * shared and leave with a copy, so a snapshot never contains a half-inserted
 * or half-removed record and stays valid while the live set keeps changing.
 */

#include <cstddef>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "popswarm/core/PopupRecord.hpp"

namespace pswarm {

class PopupRegistry {
public:
    PopupRegistry() = default;

    PopupRegistry(const PopupRegistry&) = delete;
    PopupRegistry& operator=(const PopupRegistry&) = delete;

    /**
     * @brief Add a record and give it the next insertion id
     *
     * Registering a record twice returns its existing id.
     */
    PopupId registerPopup(PopupRecord& record);

    /**
     * @brief Remove a popup
     * @return false if the id is unknown or was already removed
     */
    bool unregisterPopup(PopupId id);

    std::vector<PopupSnapshot> snapshot() const;

    /**
     * @brief Geometry of every other placed popup, in insertion order
     */
    std::vector<Rect> siblingGeometries(PopupId exclude) const;

    std::vector<PopupId> ids() const;

    size_t count() const;

    bool contains(PopupId id) const;

private:
    mutable std::shared_mutex mutex_;

    std::vector<std::pair<PopupId, const PopupRecord*>> entries_;

    PopupId next_id_{1};
};

}
