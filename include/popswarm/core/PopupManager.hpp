#pragma once

/**
 * @file PopupManager.hpp
 * @brief Owns every live popup and wires it to the rest of the program
 *
 * All public methods run on the UI thread. Lifecycle hooks fire on
 * sub-behavior threads and come back to the UI thread through the dispatch
 * function: mitosis spawns, link opening and reaping of closed popups all
 * happen there.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "popswarm/config/Settings.hpp"
#include "popswarm/content/MediaBlacklist.hpp"
#include "popswarm/content/MediaPack.hpp"
#include "popswarm/core/LifecycleController.hpp"
#include "popswarm/core/PopupRegistry.hpp"
#include "popswarm/core/PopupSurface.hpp"
#include "popswarm/core/SessionState.hpp"
#include "popswarm/display/Monitor.hpp"
#include "popswarm/placement/PlacementEngine.hpp"
#include "popswarm/render/Theme.hpp"

namespace pswarm {

class PopupManager {
public:
    using SurfaceFactory = std::function<std::unique_ptr<PopupSurface>(const SurfaceRequest&)>;
    using MonitorSource = std::function<std::vector<Monitor>()>;
    using Dispatch = std::function<void(std::function<void()>)>;
    using UrlOpener = std::function<void(const std::string&)>;

    struct Collaborators {
        SurfaceFactory create_surface;
        MonitorSource monitors;
        Dispatch dispatch;
        UrlOpener open_url;
        MediaBlacklist* blacklist{nullptr};
    };

    /**
     * Tasks posted through @p collaborators.dispatch turn into no-ops once the
     * manager is gone, so the dispatcher may outlive it.
     */
    PopupManager(PopupRegistry& registry, ContentProvider& content, SessionState& session,
                 Collaborators collaborators, uint64_t seed);
    ~PopupManager();

    PopupManager(const PopupManager&) = delete;
    PopupManager& operator=(const PopupManager&) = delete;

    void applySettings(const Settings& settings) { settings_ = settings; }
    const Settings& getSettings() const { return settings_; }

    void setTiming(const LifecycleTiming& timing) { timing_ = timing; }

    /**
     * @brief Create, place and start one popup
     * @return nullopt if no content, monitor or window could be obtained
     */
    std::optional<PopupId> spawn();

    size_t spawnMany(int count);

    /**
     * @brief Close every popup and drop it at once
     */
    void closeAll();

    /**
     * @brief Drop popups whose controller reached Closed
     * @return number of popups dropped
     */
    size_t reapClosed();

    size_t getOwnedCount() const { return popups_.size(); }

    size_t getLiveCount() const { return registry_.count(); }

    /**
     * @brief Controller of a popup still owned by the manager
     */
    LifecycleController* findController(PopupId id) const;

private:
    struct Popup {
        // Declared first so the controller, which refers to it, dies first
        std::unique_ptr<PopupSurface> surface;
        std::unique_ptr<LifecycleController> controller;
    };

    PopupRegistry& registry_;
    ContentProvider& content_;
    SessionState& session_;
    Collaborators collaborators_;

    Settings settings_;
    LifecycleTiming timing_;
    PlacementEngine placement_;
    RandomEngine rng_;

    std::vector<std::unique_ptr<Popup>> popups_;

    // Expires with the manager; posted tasks hold a weak reference
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);

    LifecycleOptions buildOptions() const;
    Theme buildTheme() const;
    LifecycleHooks buildHooks(const PopupContent& content);

    void post(std::function<void()> task);
    void openRandomUrl();
    void blacklistMedia(const std::filesystem::path& media);
};

}
