#include <gtest/gtest.h>
#include "popswarm/core/LifecycleController.hpp"
#include "mocks/FakeSurface.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace pswarm;
using pswarm::mocks::FakeSurface;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

}

class LifecycleControllerTest : public ::testing::Test {
protected:
    PopupRegistry registry;
    FakeSurface surface;
    Rect monitor{0, 0, 800, 600};
    Rect placement{100, 100, 200, 150};

    std::atomic<int> closed_calls{0};
    std::atomic<int> blacklist_calls{0};
    std::atomic<int> mitosis_count{0};
    std::atomic<int> web_calls{0};
    std::atomic<bool> alt_held{false};

    LifecycleOptions fastOptions() {
        LifecycleOptions options;
        options.timing.move_interval = 1ms;
        options.timing.fade_interval = 1ms;
        options.timing.fade_step = 0.1;
        options.timing.pump_scare_delay = 20ms;
        return options;
    }

    LifecycleHooks hooks() {
        LifecycleHooks h;
        h.blacklist_gesture = [this]() { return alt_held.load(); };
        h.blacklist = [this]() { blacklist_calls.fetch_add(1); };
        h.mitosis = [this](int count) { mitosis_count.fetch_add(count); };
        h.open_web = [this]() { web_calls.fetch_add(1); };
        h.on_close = [this]() { closed_calls.fetch_add(1); };
        return h;
    }

    std::unique_ptr<LifecycleController> makeController(LifecycleOptions options, int clicks = 1,
                                                        uint64_t seed = 1) {
        PopupParams params;
        params.monitor = monitor;
        params.clicks_to_close = clicks;
        params.opacity = 1.0;
        return std::make_unique<LifecycleController>(registry, surface, params,
                                                     std::move(options), hooks(), seed);
    }

    std::unique_ptr<LifecycleController> startController(LifecycleOptions options, int clicks = 1,
                                                         uint64_t seed = 1) {
        auto controller = makeController(std::move(options), clicks, seed);
        controller->attach();
        controller->applyPlacement(placement);
        controller->start();
        return controller;
    }
};

TEST_F(LifecycleControllerTest, StatesAdvanceInOrder) {
    auto controller = makeController(fastOptions());
    EXPECT_EQ(controller->getRecord().getState(), LifecycleState::Created);

    PopupId id = controller->attach();
    EXPECT_TRUE(registry.contains(id));

    controller->applyPlacement(placement);
    EXPECT_EQ(controller->getRecord().getState(), LifecycleState::Placed);
    ASSERT_EQ(surface.geometries().size(), 1u);
    EXPECT_EQ(surface.geometries()[0], placement);

    controller->start();
    EXPECT_EQ(controller->getRecord().getState(), LifecycleState::Active);

    EXPECT_TRUE(controller->close());
    EXPECT_TRUE(controller->isClosed());
    EXPECT_FALSE(registry.contains(id));
}

TEST_F(LifecycleControllerTest, StartRequiresPlacement) {
    auto controller = makeController(fastOptions());
    controller->attach();
    controller->start();

    EXPECT_EQ(controller->getRecord().getState(), LifecycleState::Created);
}

TEST_F(LifecycleControllerTest, SingleClickCloses) {
    auto controller = startController(fastOptions());

    controller->onClick();

    EXPECT_TRUE(controller->isClosed());
    EXPECT_EQ(registry.count(), 0u);
    EXPECT_EQ(surface.destroyCount(), 1);
    EXPECT_EQ(closed_calls.load(), 1);
}

TEST_F(LifecycleControllerTest, MultiClickNeedsEveryClick) {
    auto controller = startController(fastOptions(), 3);

    controller->onClick();
    controller->onClick();
    EXPECT_FALSE(controller->isClosed());
    EXPECT_EQ(controller->getRecord().getClicksRemaining(), 1);

    controller->onClick();
    EXPECT_TRUE(controller->isClosed());
    EXPECT_EQ(closed_calls.load(), 1);
}

TEST_F(LifecycleControllerTest, ClicksAfterCloseAreIgnored) {
    auto controller = startController(fastOptions());

    controller->onClick();
    controller->onClick();
    controller->onClick();

    EXPECT_EQ(closed_calls.load(), 1);
    EXPECT_EQ(surface.destroyCount(), 1);
}

TEST_F(LifecycleControllerTest, ClickBeforeStartIsIgnored) {
    auto controller = makeController(fastOptions(), 2);
    controller->attach();
    controller->applyPlacement(placement);

    controller->onClick();

    EXPECT_EQ(controller->getRecord().getClicksRemaining(), 2);
    EXPECT_EQ(controller->getRecord().getState(), LifecycleState::Placed);
}

TEST_F(LifecycleControllerTest, CloseIsIdempotent) {
    FakeSurface other_surface;
    PopupParams params;
    params.monitor = monitor;
    LifecycleController other(registry, other_surface, params, fastOptions(), {}, 2);
    other.attach();

    auto controller = startController(fastOptions());
    ASSERT_EQ(registry.count(), 2u);

    EXPECT_TRUE(controller->close());
    EXPECT_FALSE(controller->close());
    EXPECT_FALSE(controller->close(CloseReason::Timeout));

    EXPECT_EQ(registry.count(), 1u);
    EXPECT_EQ(closed_calls.load(), 1);
    EXPECT_EQ(surface.destroyCount(), 1);
}

TEST_F(LifecycleControllerTest, ConcurrentClosesCloseOnce) {
    auto controller = startController(fastOptions());

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (controller->close()) winners.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(closed_calls.load(), 1);
    EXPECT_EQ(registry.count(), 0u);
}

TEST_F(LifecycleControllerTest, BlacklistWhenGestureHeld) {
    LifecycleHooks h = hooks();
    bool alive_during_blacklist = false;
    h.blacklist = [&]() {
        alive_during_blacklist = surface.isAlive();
        blacklist_calls.fetch_add(1);
    };

    PopupParams params;
    params.monitor = monitor;
    LifecycleController controller(registry, surface, params, fastOptions(), h, 1);
    controller.attach();
    controller.applyPlacement(placement);
    controller.start();

    alt_held.store(true);
    controller.onClick();

    EXPECT_EQ(blacklist_calls.load(), 1);
    EXPECT_TRUE(alive_during_blacklist);
    EXPECT_TRUE(controller.isClosed());
}

TEST_F(LifecycleControllerTest, NoBlacklistWithoutGesture) {
    auto controller = startController(fastOptions());

    controller->onClick();

    EXPECT_EQ(blacklist_calls.load(), 0);
    EXPECT_TRUE(controller->isClosed());
}

TEST_F(LifecycleControllerTest, NoBlacklistOnTimeoutClose) {
    auto controller = startController(fastOptions());
    alt_held.store(true);

    controller->close(CloseReason::Timeout);

    EXPECT_EQ(blacklist_calls.load(), 0);
}

TEST_F(LifecycleControllerTest, FailingBlacklistStillCloses) {
    LifecycleHooks h = hooks();
    h.blacklist = []() { throw std::runtime_error("disk full"); };

    PopupParams params;
    params.monitor = monitor;
    LifecycleController controller(registry, surface, params, fastOptions(), h, 1);
    controller.attach();
    controller.applyPlacement(placement);
    controller.start();

    alt_held.store(true);
    controller.onClick();

    EXPECT_TRUE(controller.isClosed());
    EXPECT_EQ(closed_calls.load(), 1);
}

TEST_F(LifecycleControllerTest, MitosisOnClickClose) {
    LifecycleOptions options = fastOptions();
    options.mitosis_enabled = true;
    options.mitosis_strength = 3;

    auto controller = startController(options);
    controller->onClick();

    EXPECT_EQ(mitosis_count.load(), 3);
}

TEST_F(LifecycleControllerTest, NoMitosisOnOtherCloses) {
    LifecycleOptions options = fastOptions();
    options.mitosis_enabled = true;
    options.mitosis_strength = 3;

    auto controller = startController(options);
    controller->close(CloseReason::Timeout);

    EXPECT_EQ(mitosis_count.load(), 0);
}

TEST_F(LifecycleControllerTest, NoMitosisWhenDisabled) {
    LifecycleOptions options = fastOptions();
    options.mitosis_strength = 3;

    auto controller = startController(options);
    controller->onClick();

    EXPECT_EQ(mitosis_count.load(), 0);
}

TEST_F(LifecycleControllerTest, WebOpenChanceFormula) {
    EXPECT_DOUBLE_EQ(LifecycleController::webOpenChance(0.0), 50.0);
    EXPECT_DOUBLE_EQ(LifecycleController::webOpenChance(50.0), 25.0);
    EXPECT_DOUBLE_EQ(LifecycleController::webOpenChance(100.0), 0.0);
}

TEST_F(LifecycleControllerTest, WebNeverOpensAtFullChance) {
    LifecycleOptions options = fastOptions();
    options.web_on_close = true;
    options.web_chance = 100.0;

    for (uint64_t seed = 1; seed <= 50; ++seed) {
        auto controller = startController(options, 1, seed);
        controller->onClick();
    }

    EXPECT_EQ(web_calls.load(), 0);
}

TEST_F(LifecycleControllerTest, WebOpensAboutHalfTheTimeAtZeroChance) {
    LifecycleOptions options = fastOptions();
    options.web_on_close = true;
    options.web_chance = 0.0;

    const int closes = 400;
    for (int seed = 1; seed <= closes; ++seed) {
        auto controller = startController(options, 1, static_cast<uint64_t>(seed));
        controller->close(CloseReason::Clicked);
    }

    EXPECT_GT(web_calls.load(), closes * 3 / 10);
    EXPECT_LT(web_calls.load(), closes * 7 / 10);
}

TEST_F(LifecycleControllerTest, NoWebOnManualClose) {
    LifecycleOptions options = fastOptions();
    options.web_on_close = true;
    options.web_chance = 0.0;

    for (uint64_t seed = 1; seed <= 50; ++seed) {
        auto controller = startController(options, 1, seed);
        controller->close(CloseReason::Manual);
    }

    EXPECT_EQ(web_calls.load(), 0);
}

TEST_F(LifecycleControllerTest, MovementStaysOnMonitor) {
    LifecycleOptions options = fastOptions();
    options.moving_chance = 100.0;
    options.moving_speed = 20;

    auto controller = startController(options);
    EXPECT_TRUE(controller->isMoving());

    ASSERT_TRUE(waitUntil([&]() { return surface.geometries().size() > 50; }));

    controller->close();
    EXPECT_FALSE(controller->isMoving());

    for (const auto& rect : surface.geometries()) {
        EXPECT_TRUE(monitor.contains(rect));
    }
}

TEST_F(LifecycleControllerTest, MovementStopsAfterClose) {
    LifecycleOptions options = fastOptions();
    options.moving_chance = 100.0;

    auto controller = startController(options);
    ASSERT_TRUE(waitUntil([&]() { return surface.geometries().size() > 5; }));

    controller->close();
    size_t count = surface.geometries().size();

    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(surface.geometries().size(), count);
}

TEST_F(LifecycleControllerTest, MovementEndsWhenWindowVanishes) {
    LifecycleOptions options = fastOptions();
    options.moving_chance = 100.0;

    auto controller = startController(options);
    ASSERT_TRUE(controller->isMoving());

    surface.destroy();

    EXPECT_TRUE(waitUntil([&]() { return !controller->isMoving(); }));
    EXPECT_TRUE(controller->close());
}

TEST_F(LifecycleControllerTest, NoMovementAtZeroChance) {
    auto controller = startController(fastOptions());

    std::this_thread::sleep_for(10ms);
    EXPECT_FALSE(controller->isMoving());
    EXPECT_EQ(surface.geometries().size(), 1u);
}

TEST_F(LifecycleControllerTest, FadeOutThenClose) {
    LifecycleOptions options = fastOptions();
    options.timeout_enabled = true;
    options.timeout = 5ms;

    auto controller = startController(options);

    ASSERT_TRUE(waitUntil([&]() { return controller->isClosed(); }));
    EXPECT_EQ(closed_calls.load(), 1);

    auto opacities = surface.opacities();
    ASSERT_EQ(opacities.size(), 10u);
    for (size_t i = 0; i < opacities.size(); ++i) {
        EXPECT_NEAR(opacities[i], 1.0 - 0.1 * (i + 1), 1e-9);
        if (i > 0) {
            EXPECT_LT(opacities[i], opacities[i - 1]);
        }
    }
    EXPECT_DOUBLE_EQ(opacities.back(), 0.0);
}

TEST_F(LifecycleControllerTest, DefaultStepFadesInHundredTicks) {
    LifecycleOptions options = fastOptions();
    options.timeout_enabled = true;
    options.timeout = 1ms;
    options.timing.fade_step = LifecycleTiming{}.fade_step;
    ASSERT_DOUBLE_EQ(options.timing.fade_step, 0.01);

    auto controller = startController(options);

    ASSERT_TRUE(waitUntil([&]() { return controller->isClosed(); }, 10000ms));
    EXPECT_EQ(closed_calls.load(), 1);

    auto opacities = surface.opacities();
    ASSERT_EQ(opacities.size(), 100u);
    for (size_t i = 0; i < opacities.size(); ++i) {
        EXPECT_NEAR(opacities[i], 1.0 - 0.01 * (i + 1), 1e-9);
        if (i > 0) {
            EXPECT_LT(opacities[i], opacities[i - 1]);
        }
    }
    EXPECT_EQ(opacities.back(), 0.0);
}

TEST_F(LifecycleControllerTest, ManualCloseStopsFade) {
    LifecycleOptions options = fastOptions();
    options.timeout_enabled = true;
    options.timeout = 1ms;
    options.timing.fade_step = 0.01;
    options.timing.fade_interval = 20ms;

    auto controller = startController(options);
    ASSERT_TRUE(waitUntil([&]() { return !surface.opacities().empty(); }));

    EXPECT_TRUE(controller->close());
    size_t ticks = surface.opacities().size();

    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(surface.opacities().size(), ticks);
    EXPECT_EQ(closed_calls.load(), 1);
}

TEST_F(LifecycleControllerTest, CloseCancelsPendingTimeout) {
    LifecycleOptions options = fastOptions();
    options.timeout_enabled = true;
    options.timeout = 10s;

    auto controller = startController(options);

    auto begin = std::chrono::steady_clock::now();
    EXPECT_TRUE(controller->close());
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 1s);
    EXPECT_TRUE(surface.opacities().empty());
}

TEST_F(LifecycleControllerTest, PumpScareOverridesTimeout) {
    LifecycleOptions options = fastOptions();
    options.pump_scare = true;
    options.timeout_enabled = true;
    options.timeout = 1ms;

    auto controller = startController(options);

    ASSERT_TRUE(waitUntil([&]() { return controller->isClosed(); }));
    EXPECT_TRUE(surface.opacities().empty());
    EXPECT_EQ(closed_calls.load(), 1);
}

TEST_F(LifecycleControllerTest, DestructionUnregisters) {
    PopupId id = INVALID_POPUP_ID;
    {
        auto controller = startController(fastOptions());
        id = controller->getId();
        ASSERT_TRUE(registry.contains(id));
    }
    EXPECT_FALSE(registry.contains(id));
}
