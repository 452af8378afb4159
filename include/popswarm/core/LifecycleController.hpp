#pragma once

/**
 * @file LifecycleController.hpp
 * @brief Per-popup state machine and its concurrent sub-behaviors
 *
 * Created -> Placed -> Active -> Closing -> Closed
 *
 * While Active, up to three threads run on behalf of the popup:
 * - movement: bounces the popup around its monitor
 * - fade: waits for the timeout, fades the popup out, then closes it
 * - pump scare: closes the popup after a fixed delay
 *
 * Every wait is a cancelable wait on the controller's stop signal. close()
 * raises the signal and joins every sub-behavior except the calling one;
 * the destructor joins the rest.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "popswarm/core/PopupRecord.hpp"
#include "popswarm/core/PopupRegistry.hpp"
#include "popswarm/core/PopupSurface.hpp"
#include "popswarm/placement/Motion.hpp"
#include "popswarm/utils/Random.hpp"

namespace pswarm {

struct LifecycleTiming {
    std::chrono::milliseconds move_interval{10};
    std::chrono::milliseconds fade_interval{15};
    double fade_step{0.01};
    std::chrono::milliseconds pump_scare_delay{2500};
};

struct LifecycleOptions {
    double moving_chance{0.0};              // percent
    int moving_speed{1};

    bool timeout_enabled{false};
    std::chrono::milliseconds timeout{0};

    bool pump_scare{false};

    bool mitosis_enabled{false};
    int mitosis_strength{0};

    bool web_on_close{false};
    double web_chance{0.0};                 // percent, see webOpenChance()

    LifecycleTiming timing;
};

/**
 * @brief Outward calls made by a controller; any of them may be empty
 *
 * Hooks can run on sub-behavior threads.
 */
struct LifecycleHooks {
    std::function<bool()> blacklist_gesture;    // true while the blacklist modifier is held
    std::function<void()> blacklist;
    std::function<void(int)> mitosis;
    std::function<void()> open_web;
    std::function<void()> on_close;
};

struct PopupParams {
    Rect monitor;
    int clicks_to_close{1};
    bool denial_active{false};
    double opacity{1.0};
};

enum class CloseReason {
    Clicked,
    Timeout,
    PumpScare,
    Manual
};

class LifecycleController {
public:
    LifecycleController(PopupRegistry& registry, PopupSurface& surface,
                        const PopupParams& params, LifecycleOptions options,
                        LifecycleHooks hooks, uint64_t seed);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;
    LifecycleController(LifecycleController&&) = delete;
    LifecycleController& operator=(LifecycleController&&) = delete;

    /**
     * @brief Join the registry; the popup counts as live from here on
     */
    PopupId attach();

    void applyPlacement(const Rect& rect);

    /**
     * @brief Enter Active and launch the enabled sub-behaviors
     */
    void start();

    void onClick();

    /**
     * @brief Close the popup once
     * @return true if this call performed the close
     */
    bool close(CloseReason reason = CloseReason::Manual);

    bool isClosed() const { return record_.getState() == LifecycleState::Closed; }

    bool isMoving() const { return moving_.load(); }

    PopupId getId() const { return record_.getId(); }

    const PopupRecord& getRecord() const { return record_; }

    static double webOpenChance(double web_chance);

private:
    PopupRegistry& registry_;
    PopupSurface& surface_;
    PopupRecord record_;
    LifecycleOptions options_;
    LifecycleHooks hooks_;
    RandomEngine rng_;

    std::atomic<bool> closing_{false};
    std::atomic<bool> moving_{false};

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};

    std::mutex tasks_mutex_;
    std::vector<std::thread> tasks_;

    void launch(void (LifecycleController::*behavior)());

    void movementLoop();
    void fadeLoop();
    void pumpScareTimer();

    Velocity initial_velocity_;

    /**
     * @brief Sleep unless stopped
     * @return false if the stop signal was raised
     */
    bool waitFor(std::chrono::milliseconds duration);

    void requestStop();
    void joinSubBehaviors();
};

}
