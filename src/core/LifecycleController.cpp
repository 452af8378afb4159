/**
 * @file LifecycleController.cpp
 * @brief Per-popup state machine, movement, fade and forced close
 */

#include "popswarm/core/LifecycleController.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

namespace pswarm {

// Side effects belong to external collaborators; a failing one must not stop
// the popup from closing.
static void runSideEffect(const char* name, const std::function<void()>& effect) {
    if (!effect) return;
    try {
        effect();
    } catch (const std::exception& e) {
        std::cerr << "LifecycleController: " << name << " failed: " << e.what() << std::endl;
    }
}

LifecycleController::LifecycleController(PopupRegistry& registry, PopupSurface& surface,
                                         const PopupParams& params, LifecycleOptions options,
                                         LifecycleHooks hooks, uint64_t seed)
    : registry_(registry),
      surface_(surface),
      record_(params.monitor, params.clicks_to_close, params.denial_active, params.opacity),
      options_(std::move(options)),
      hooks_(std::move(hooks)),
      rng_(seed) {}

LifecycleController::~LifecycleController() {
    requestStop();

    std::vector<std::thread> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }

    for (auto& task : tasks) {
        if (!task.joinable()) continue;
        if (task.get_id() == std::this_thread::get_id()) {
            task.detach();
        } else {
            task.join();
        }
    }

    // Destroyed without ever closing: the registry must not keep a dangling record
    if (!closing_.exchange(true)) {
        registry_.unregisterPopup(record_.getId());
    }
}

PopupId LifecycleController::attach() {
    return registry_.registerPopup(record_);
}

void LifecycleController::applyPlacement(const Rect& rect) {
    if (closing_.load()) return;

    record_.setRect(rect);
    record_.setState(LifecycleState::Placed);
    surface_.setGeometry(rect);
}

void LifecycleController::start() {
    if (closing_.load() || record_.getState() != LifecycleState::Placed) {
        return;
    }

    record_.setState(LifecycleState::Active);

    if (roll(options_.moving_chance, rng_)) {
        initial_velocity_ = randomVelocity(options_.moving_speed, rng_);
        moving_.store(true);
        launch(&LifecycleController::movementLoop);
    }

    if (options_.pump_scare) {
        launch(&LifecycleController::pumpScareTimer);
    } else if (options_.timeout_enabled) {
        launch(&LifecycleController::fadeLoop);
    }
}

void LifecycleController::launch(void (LifecycleController::*behavior)()) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);

    // close() raises closing_ before it collects tasks, so nothing launched
    // after that point can be missed
    if (closing_.load()) return;

    tasks_.emplace_back(behavior, this);
}

void LifecycleController::onClick() {
    if (closing_.load() || record_.getState() != LifecycleState::Active) {
        return;
    }

    // The counter starts at 1 or more and drops by one per click, so exactly
    // one click observes zero
    if (record_.consumeClick() != 0) {
        return;
    }

    if (!closing_.load() && hooks_.blacklist_gesture && hooks_.blacklist_gesture()) {
        runSideEffect("blacklist", hooks_.blacklist);
    }

    close(CloseReason::Clicked);
}

bool LifecycleController::close(CloseReason reason) {
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true)) {
        return false;
    }

    record_.setState(LifecycleState::Closing);
    requestStop();

    registry_.unregisterPopup(record_.getId());

    joinSubBehaviors();

    if (reason == CloseReason::Clicked && options_.mitosis_enabled &&
        options_.mitosis_strength > 0 && hooks_.mitosis) {
        int strength = options_.mitosis_strength;
        runSideEffect("mitosis", [this, strength]() { hooks_.mitosis(strength); });
    }

    // Manual closes come from panic and shutdown, which must not open anything
    if (reason != CloseReason::Manual && options_.web_on_close &&
        roll(webOpenChance(options_.web_chance), rng_)) {
        runSideEffect("web open", hooks_.open_web);
    }

    surface_.destroy();
    record_.setState(LifecycleState::Closed);

    runSideEffect("close callback", hooks_.on_close);
    return true;
}

double LifecycleController::webOpenChance(double web_chance) {
    return (100.0 - web_chance) / 2.0;
}

void LifecycleController::movementLoop() {
    Velocity velocity = initial_velocity_;
    const Rect monitor = record_.getMonitor();

    while (!closing_.load()) {
        MotionStep step = advanceWithinMonitor(record_.getRect(), velocity, monitor);
        velocity = step.velocity;
        record_.setRect(step.rect);

        // Window already destroyed by a concurrent close
        if (!surface_.setGeometry(step.rect)) {
            break;
        }

        if (!waitFor(options_.timing.move_interval)) {
            break;
        }
    }

    moving_.store(false);
}

void LifecycleController::fadeLoop() {
    if (!waitFor(options_.timeout)) {
        return;
    }

    const double step = options_.timing.fade_step > 0.0 ? options_.timing.fade_step : 0.01;
    const double start = record_.getOpacity();

    // Fixed tick count so accumulated rounding cannot add or drop a tick
    const int ticks = std::max(0, static_cast<int>(std::ceil(start / step - 1e-9)));

    for (int tick = 1; tick <= ticks; ++tick) {
        double opacity = (tick == ticks) ? 0.0 : start - tick * step;
        record_.setOpacity(opacity);

        if (closing_.load() || !surface_.setOpacity(opacity)) {
            return;
        }

        if (tick < ticks && !waitFor(options_.timing.fade_interval)) {
            return;
        }
    }

    close(CloseReason::Timeout);
}

void LifecycleController::pumpScareTimer() {
    if (waitFor(options_.timing.pump_scare_delay)) {
        close(CloseReason::PumpScare);
    }
}

bool LifecycleController::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, duration, [this]() { return stop_requested_; });
}

void LifecycleController::requestStop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

void LifecycleController::joinSubBehaviors() {
    std::vector<std::thread> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }

    std::vector<std::thread> self;
    for (auto& task : tasks) {
        if (!task.joinable()) continue;

        // close() reached from a sub-behavior: that thread returns right
        // after, the destructor joins it
        if (task.get_id() == std::this_thread::get_id()) {
            self.push_back(std::move(task));
            continue;
        }
        task.join();
    }

    if (!self.empty()) {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto& task : self) {
            tasks_.push_back(std::move(task));
        }
    }
}

}
