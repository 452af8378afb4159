#include "popswarm/app/PopupApp.hpp"
#include "popswarm/config/SettingsParser.hpp"
#include <iostream>
#include <random>
#include <cstdlib>
#include <unistd.h>

namespace pswarm {

PopupApp::PopupApp(AppOptions options)
    : options_(std::move(options)) {}

PopupApp::~PopupApp() {
    shutdown();
}

bool PopupApp::initialize() {
    const char* display_name = options_.display_name ? options_.display_name->c_str() : nullptr;
    display_.reset(XOpenDisplay(display_name));
    if (!display_) {
        std::cerr << "PopupApp: Cannot open display "
                  << (display_name ? display_name : "(default)") << std::endl;
        return false;
    }

    XSetErrorHandler(&PopupApp::onXError);

    dispatcher_.bindToCurrentThread();
    session_.setPumpScare(options_.pump_scare);

    loadSettings();

    if (!monitors_.initialize(display_.get())) {
        std::cerr << "PopupApp: Failed to initialize monitors" << std::endl;
        return false;
    }

    notifier_ = std::make_unique<DesktopNotifier>("popswarm");
    if (!notifier_->isValid()) {
        std::cerr << "PopupApp: Desktop notifications unavailable" << std::endl;
    }

    pack_ = std::make_unique<DirectoryPack>(options_.pack_path, &PopupWindowHost::readPngSize,
                                            settings_.popups.max_clicks);
    if (!pack_->load()) {
        std::cerr << "PopupApp: Pack " << options_.pack_path << " has no usable media" << std::endl;
        return false;
    }

    DesktopNotifier* notifier = notifier_.get();
    blacklist_ = std::make_unique<MediaBlacklist>(
        MediaBlacklist::getDefaultRoot(),
        [notifier](const std::string& title, const std::string& message) {
            notifier->notify(title, message);
        });

    host_ = std::make_unique<PopupWindowHost>(display_.get(), dispatcher_, session_);
    if (!host_->initialize()) {
        return false;
    }

    PopupManager::Collaborators collaborators;
    PopupWindowHost* host = host_.get();
    collaborators.create_surface = [host](const SurfaceRequest& request) { return host->createPopup(request); };
    collaborators.monitors = [this]() { return monitors_.getMonitors(); };
    collaborators.dispatch = [this](std::function<void()> task) { dispatcher_.post(std::move(task)); };
    collaborators.open_url = [](const std::string& url) {
        if (!DesktopNotifier::openUri(url)) {
            std::cerr << "PopupApp: Could not open " << url << std::endl;
        }
    };
    collaborators.blacklist = blacklist_.get();

    manager_ = std::make_unique<PopupManager>(registry_, *pack_, session_,
                                              std::move(collaborators), std::random_device{}());
    manager_->applySettings(settings_);

    grabPanicKey();

    running_.store(true);
    return true;
}

void PopupApp::loadSettings() {
    SettingsParser parser;

    std::filesystem::path path = options_.config_path.value_or(SettingsParser::getDefaultConfigPath());

    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);

    if (exists && parser.load(path)) {
        std::cout << "PopupApp: Loaded settings from " << path << std::endl;
    } else {
        if (exists || options_.config_path) {
            std::cerr << "PopupApp: Could not use " << path << ", using built-in settings" << std::endl;
        }
        if (!parser.loadFromString(SettingsParser::getEmbeddedConfig())) {
            std::cerr << "PopupApp: Built-in settings failed to parse" << std::endl;
        }
    }

    settings_ = parser.getSettings();
}

void PopupApp::grabPanicKey() {
    const std::string& key = settings_.popups.panic_key;
    if (key.empty()) return;

    KeySym keysym = XStringToKeysym(key.c_str());
    if (keysym == NoSymbol) {
        std::cerr << "PopupApp: Unknown panic key '" << key << "'" << std::endl;
        return;
    }

    panic_keycode_ = XKeysymToKeycode(display_.get(), keysym);
    if (panic_keycode_ == 0) {
        std::cerr << "PopupApp: Panic key '" << key << "' has no keycode" << std::endl;
        return;
    }

    Window root = DefaultRootWindow(display_.get());
    XGrabKey(display_.get(), panic_keycode_, AnyModifier, root, True, GrabModeAsync, GrabModeAsync);
    XFlush(display_.get());

    std::cout << "PopupApp: Press " << key << " to close every popup" << std::endl;
}

void PopupApp::run() {
    if (!manager_) return;

    size_t spawned = manager_->spawnMany(options_.initial_count);
    std::cout << "PopupApp: Spawned " << spawned << " popups" << std::endl;

    const bool periodic = options_.spawn_interval.count() > 0;
    auto next_spawn = std::chrono::steady_clock::now() + options_.spawn_interval;

    XEvent event;

    while (running_) {
        while (XPending(display_.get()) > 0) {
            XNextEvent(display_.get(), &event);

            if (monitors_.handleEvent(event)) {
                continue;
            }

            if (event.type == KeyPress && panic_keycode_ != 0 && event.xkey.keycode == panic_keycode_) {
                panic();
                break;
            }

            host_->handleEvent(event);
        }

        dispatcher_.drain();

        if (!running_) break;

        if (periodic && std::chrono::steady_clock::now() >= next_spawn) {
            manager_->spawn();
            next_spawn = std::chrono::steady_clock::now() + options_.spawn_interval;
        }

        if (!periodic && manager_->getOwnedCount() == 0 && dispatcher_.pending() == 0) {
            std::cout << "PopupApp: No popups left" << std::endl;
            break;
        }

        usleep(1000);
    }

    shutdown();
}

void PopupApp::panic() {
    std::cout << "PopupApp: Panic key pressed" << std::endl;
    running_.store(false);
    if (manager_) {
        manager_->closeAll();
    }
}

void PopupApp::shutdown() {
    // Manager first: closing popups posts window teardown to the dispatcher
    manager_.reset();
    dispatcher_.drain();
    host_.reset();

    if (display_ && panic_keycode_ != 0) {
        XUngrabKey(display_.get(), panic_keycode_, AnyModifier, DefaultRootWindow(display_.get()));
        panic_keycode_ = 0;
    }

    if (display_) {
        XSync(display_.get(), False);
    }
}

std::filesystem::path PopupApp::getDefaultPackPath() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "popswarm" / "pack";
    }

    auto home = std::getenv("HOME");
    if (!home) return "/tmp/popswarm/pack";

    return std::filesystem::path(home) / ".local" / "share" / "popswarm" / "pack";
}

int PopupApp::onXError(Display* display, XErrorEvent* error) {
    char error_text[1024];
    XGetErrorText(display, error->error_code, error_text, sizeof(error_text));

    std::cerr << "X Error: " << error_text << std::endl;
    std::cerr << "  Request: " << static_cast<int>(error->request_code) << std::endl;
    std::cerr << "  Resource: " << error->resourceid << std::endl;

    return 0;
}

}
