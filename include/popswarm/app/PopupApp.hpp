#pragma once

/**
 * @file PopupApp.hpp
 * @brief Wires the engine to X11, cairo and the desktop bus and runs the event loop
 */

#include <X11/Xlib.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "popswarm/config/Settings.hpp"
#include "popswarm/content/MediaBlacklist.hpp"
#include "popswarm/content/MediaPack.hpp"
#include "popswarm/core/PopupManager.hpp"
#include "popswarm/core/PopupRegistry.hpp"
#include "popswarm/core/SessionState.hpp"
#include "popswarm/desktop/DesktopNotifier.hpp"
#include "popswarm/display/MonitorManager.hpp"
#include "popswarm/utils/UiDispatcher.hpp"
#include "popswarm/window/PopupWindowHost.hpp"

namespace pswarm {

struct DisplayDeleter {
    void operator()(Display* display) const {
        if (display) XCloseDisplay(display);
    }
};

using DisplayPtr = std::unique_ptr<Display, DisplayDeleter>;

struct AppOptions {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> display_name;
    std::filesystem::path pack_path;
    int initial_count{1};
    std::chrono::milliseconds spawn_interval{0};    // 0 = no automatic spawns
    bool pump_scare{false};
};

class PopupApp {
public:
    explicit PopupApp(AppOptions options);
    ~PopupApp();

    PopupApp(const PopupApp&) = delete;
    PopupApp& operator=(const PopupApp&) = delete;

    bool initialize();

    /**
     * @brief Process events until quit, panic, or the last popup is gone
     *
     * With a spawn interval set the loop only ends on quit or panic.
     */
    void run();

    // Safe to call from a signal handler
    void requestQuit() { running_.store(false); }

    const Settings& getSettings() const { return settings_; }

    static std::filesystem::path getDefaultPackPath();

private:
    AppOptions options_;
    DisplayPtr display_;
    std::atomic<bool> running_{false};

    Settings settings_;
    SessionState session_;
    PopupRegistry registry_;
    UiDispatcher dispatcher_;
    MonitorManager monitors_;

    std::unique_ptr<DesktopNotifier> notifier_;
    std::unique_ptr<DirectoryPack> pack_;
    std::unique_ptr<MediaBlacklist> blacklist_;
    std::unique_ptr<PopupWindowHost> host_;
    std::unique_ptr<PopupManager> manager_;

    KeyCode panic_keycode_{0};

    void loadSettings();
    void grabPanicKey();
    void panic();
    void shutdown();

    static int onXError(Display* display, XErrorEvent* error);
};

}
