#pragma once

/**
 * @file PopupRecord.hpp
 * @brief Per-popup mutable state shared between a controller's threads
 *
 * Owned by the LifecycleController. The registry and the facade only ever
 * read it, through snapshot() or the individual getters.
 */

#include <cstdint>
#include <mutex>
#include <string>

#include "popswarm/geometry/Rect.hpp"

namespace pswarm {

using PopupId = uint64_t;

constexpr PopupId INVALID_POPUP_ID = 0;

enum class LifecycleState {
    Created,
    Placed,
    Active,
    Closing,
    Closed
};

inline std::string lifecycleStateToString(LifecycleState state) {
    switch (state) {
        case LifecycleState::Created: return "Created";
        case LifecycleState::Placed: return "Placed";
        case LifecycleState::Active: return "Active";
        case LifecycleState::Closing: return "Closing";
        case LifecycleState::Closed: return "Closed";
        default: return "Unknown";
    }
}

struct PopupSnapshot {
    PopupId id{INVALID_POPUP_ID};
    Rect rect;
    Rect monitor;
    int clicks_remaining{1};
    bool denial_active{false};
    double opacity{1.0};
    LifecycleState state{LifecycleState::Created};
};

class PopupRecord {
public:
    PopupRecord(const Rect& monitor, int clicks_to_close, bool denial_active, double opacity);

    PopupRecord(const PopupRecord&) = delete;
    PopupRecord& operator=(const PopupRecord&) = delete;

    PopupId getId() const;
    void assignId(PopupId id);

    Rect getRect() const;
    void setRect(const Rect& rect);

    const Rect& getMonitor() const { return monitor_; }

    bool isDenialActive() const { return denial_active_; }

    int getClicksRemaining() const;

    /**
     * @brief Decrement the click counter
     * @return Clicks left after this one
     */
    int consumeClick();

    double getOpacity() const;
    void setOpacity(double opacity);

    LifecycleState getState() const;
    void setState(LifecycleState state);

    PopupSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;

    PopupId id_{INVALID_POPUP_ID};
    Rect rect_;
    const Rect monitor_;
    int clicks_remaining_;
    const bool denial_active_;
    double opacity_;
    LifecycleState state_{LifecycleState::Created};
};

}
