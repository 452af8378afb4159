#include "popswarm/core/PopupManager.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>

namespace pswarm {

PopupManager::PopupManager(PopupRegistry& registry, ContentProvider& content, SessionState& session,
                           Collaborators collaborators, uint64_t seed)
    : registry_(registry),
      content_(content),
      session_(session),
      collaborators_(std::move(collaborators)),
      rng_(seed) {}

PopupManager::~PopupManager() {
    closeAll();
}

std::optional<PopupId> PopupManager::spawn() {
    auto content = content_.nextPopup(rng_);
    if (!content) {
        std::cerr << "PopupManager: No media left in pack '" << content_.packName() << "'" << std::endl;
        return std::nullopt;
    }

    std::vector<Monitor> monitors;
    if (collaborators_.monitors) {
        monitors = collaborators_.monitors();
    }

    auto monitor = pickRandomMonitor(monitors, settings_.monitors.disabled, rng_);
    if (!monitor) {
        std::cerr << "PopupManager: No monitor available" << std::endl;
        return std::nullopt;
    }

    const bool lowkey = settings_.lowkey.enabled;
    Size size = placement_.computeSize(content->source_size.width, content->source_size.height,
                                       monitor->bounds, lowkey, rng_);

    SurfaceRequest request;
    request.media = content->media;
    request.size = size;
    request.opacity = settings_.popups.opacity;
    request.denial = roll(settings_.popups.denial_chance, rng_);
    if (request.denial) {
        request.denial_filter = pickDenialFilter(rng_);
    }
    request.denial_text = content->denial_text;
    if (settings_.popups.captions) {
        request.caption = content->caption;
    }
    request.clickthrough = settings_.popups.clickthrough;
    request.close_button = !settings_.popups.buttonless && !settings_.popups.clickthrough;
    request.theme = buildTheme();

    if (!collaborators_.create_surface) {
        return std::nullopt;
    }

    auto popup = std::make_unique<Popup>();
    popup->surface = collaborators_.create_surface(request);
    if (!popup->surface) {
        std::cerr << "PopupManager: Failed to create window for " << content->media << std::endl;
        return std::nullopt;
    }

    PopupParams params;
    params.monitor = monitor->bounds;
    params.clicks_to_close = settings_.popups.multi_click ? content->clicks_to_close : 1;
    params.denial_active = request.denial;
    params.opacity = request.opacity;

    popup->controller = std::make_unique<LifecycleController>(
        registry_, *popup->surface, params, buildOptions(), buildHooks(*content), rng_());

    LifecycleController* controller = popup->controller.get();
    popup->surface->setClickHandler([controller]() { controller->onClick(); });

    // Registering first makes this popup count toward its own index
    PopupId id = controller->attach();
    auto siblings = registry_.siblingGeometries(id);

    PlacementOptions options;
    options.lowkey_mode = lowkey;
    options.lowkey_corner = settings_.lowkey.corner;

    Rect rect = placement_.place(size, monitor->bounds, siblings, registry_.count(), options, rng_);
    controller->applyPlacement(rect);
    controller->start();

    std::cout << "PopupManager: Popup " << id << " at " << rect.x << "," << rect.y
              << " (" << rect.width << "x" << rect.height << ") on " << monitor->name
              << (params.denial_active ? " [DENIAL]" : "")
              << (controller->isMoving() ? " [MOVING]" : "") << std::endl;

    popups_.push_back(std::move(popup));
    return id;
}

size_t PopupManager::spawnMany(int count) {
    size_t spawned = 0;
    for (int i = 0; i < count; ++i) {
        if (spawn()) {
            ++spawned;
        }
    }
    return spawned;
}

void PopupManager::closeAll() {
    for (auto& popup : popups_) {
        popup->controller->close(CloseReason::Manual);
    }

    size_t count = popups_.size();
    popups_.clear();

    if (count > 0) {
        std::cout << "PopupManager: Closed " << count << " popups" << std::endl;
    }
}

size_t PopupManager::reapClosed() {
    auto it = std::remove_if(popups_.begin(), popups_.end(),
        [](const std::unique_ptr<Popup>& popup) { return popup->controller->isClosed(); });

    size_t reaped = static_cast<size_t>(std::distance(it, popups_.end()));
    popups_.erase(it, popups_.end());
    return reaped;
}

LifecycleController* PopupManager::findController(PopupId id) const {
    for (const auto& popup : popups_) {
        if (popup->controller->getId() == id) {
            return popup->controller.get();
        }
    }
    return nullptr;
}

LifecycleOptions PopupManager::buildOptions() const {
    LifecycleOptions options;
    options.moving_chance = settings_.movement.chance;
    options.moving_speed = settings_.movement.speed;

    options.timeout_enabled = settings_.timeout.enabled;
    options.timeout = std::chrono::milliseconds(settings_.timeout.delay_ms);

    options.pump_scare = session_.isPumpScare();

    options.mitosis_enabled = settings_.mitosis.enabled && !settings_.lowkey.enabled;
    options.mitosis_strength = settings_.mitosis.strength;

    options.web_on_close = settings_.web.on_close;
    options.web_chance = settings_.web.chance;

    options.timing = timing_;
    return options;
}

Theme PopupManager::buildTheme() const {
    Theme theme;
    if (auto fg = parseColor(settings_.theme.fg)) theme.fg = *fg;
    if (auto bg = parseColor(settings_.theme.bg)) theme.bg = *bg;
    if (!settings_.theme.font.empty()) theme.font = settings_.theme.font;
    theme.font_size = std::max(1, settings_.theme.font_size);
    return theme;
}

LifecycleHooks PopupManager::buildHooks(const PopupContent& content) {
    LifecycleHooks hooks;

    SessionState& session = session_;
    hooks.blacklist_gesture = [&session]() { return session.isAltHeld(); };

    std::filesystem::path media = content.media;
    hooks.blacklist = [this, media]() { blacklistMedia(media); };

    hooks.mitosis = [this](int count) {
        post([this, count]() { spawnMany(count); });
    };

    hooks.open_web = [this]() {
        post([this]() { openRandomUrl(); });
    };

    hooks.on_close = [this]() {
        post([this]() { reapClosed(); });
    };

    return hooks;
}

void PopupManager::post(std::function<void()> task) {
    if (!collaborators_.dispatch) return;

    std::weak_ptr<int> lifetime = lifetime_;
    collaborators_.dispatch([lifetime, task = std::move(task)]() {
        if (lifetime.lock()) {
            task();
        }
    });
}

void PopupManager::openRandomUrl() {
    auto url = content_.randomWebUrl(rng_);
    if (!url) {
        return;
    }

    std::cout << "PopupManager: Opening " << *url << std::endl;
    if (collaborators_.open_url) {
        collaborators_.open_url(*url);
    }
}

void PopupManager::blacklistMedia(const std::filesystem::path& media) {
    if (!collaborators_.blacklist) {
        std::cerr << "PopupManager: No blacklist configured, keeping " << media << std::endl;
        return;
    }

    if (collaborators_.blacklist->blacklist(media, content_.packName())) {
        content_.forgetMedia(media);
    }
}

}
