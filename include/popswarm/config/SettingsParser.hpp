#pragma once

/**
 * @file SettingsParser.hpp
 * @brief Reader for popswarm.wmi
 *
 * The file is a tree of named blocks:
 *
 *     popswarm: {
 *         let base_opacity = 0.9
 *         popups: { opacity: base_opacity  buttonless: false }
 *         theme: { fg: "#ffffff"  font: "Sans"  font_size: 14 }
 *         monitors: { disabled: ["HDMI-1"] }
 *     }
 *
 * A setting belongs to the innermost block around it. Values are integers,
 * floats, strings, booleans, string arrays or the name of an earlier `let`.
 * Line and block comments are skipped.
 *
 * Syntax errors reject the whole file. A setting with an unknown name or a
 * value of the wrong type is reported and skipped.
 */

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "popswarm/config/Settings.hpp"

namespace pswarm {

class SettingsParser {
public:
    using Value = std::variant<int, double, std::string, bool, std::vector<std::string>>;
    using ErrorCallback = std::function<void(const std::string&)>;

    explicit SettingsParser(ErrorCallback on_error = nullptr);

    /**
     * @brief Load settings from a file
     * @return false if the file is missing or does not parse; the current
     *         settings are left untouched in that case
     */
    bool load(const std::filesystem::path& path = getDefaultConfigPath());

    bool loadFromString(const std::string& source);

    /**
     * @brief Settings used when no usable file exists
     */
    static std::string getEmbeddedConfig();

    static std::filesystem::path getDefaultConfigPath();

    const Settings& getSettings() const { return settings_; }

    /**
     * @brief One `key: value` line as read from the file
     *
     * An empty value means the expression could not be evaluated, e.g. it
     * names an unknown variable.
     */
    struct Entry {
        std::string block;
        std::string key;
        int line{0};
        std::optional<Value> value;
    };

private:
    ErrorCallback on_error_;
    Settings settings_;

    void applyEntry(const Entry& entry, Settings& settings);

    static void validate(Settings& settings);

    void reportError(const std::string& message);
};

}
