#pragma once

#include <string>
#include <vector>

namespace pswarm {

/**
 * @brief Read-only popup settings, one struct per .wmi block
 */
struct Settings {
    struct PopupsConfig {
        double opacity{1.0};
        bool multi_click{false};
        int max_clicks{3};
        bool clickthrough{false};
        bool buttonless{false};
        double denial_chance{0.0};          // percent
        bool captions{false};
        std::string panic_key{"Escape"};
    };

    struct MovementConfig {
        double chance{0.0};                 // percent
        int speed{10};
    };

    struct TimeoutConfig {
        bool enabled{false};
        int delay_ms{10000};
    };

    struct LowkeyConfig {
        bool enabled{false};
        int corner{4};                      // 0 TL, 1 TR, 2 BL, 3 BR, 4 random
    };

    struct MitosisConfig {
        bool enabled{false};
        int strength{2};
    };

    struct WebConfig {
        bool on_close{false};
        double chance{0.0};                 // percent
    };

    // Label colours are "#rrggbb" or "#rrggbbaa"
    struct ThemeConfig {
        std::string fg{"#ffffff"};
        std::string bg{"#262626e6"};
        std::string font{"Sans"};
        int font_size{12};
    };

    struct MonitorsConfig {
        std::vector<std::string> disabled;  // XRandR output names
    };

    PopupsConfig popups;
    MovementConfig movement;
    TimeoutConfig timeout;
    LowkeyConfig lowkey;
    MitosisConfig mitosis;
    WebConfig web;
    ThemeConfig theme;
    MonitorsConfig monitors;
};

}
