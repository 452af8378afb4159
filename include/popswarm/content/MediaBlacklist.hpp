#pragma once

/**
 * @file MediaBlacklist.hpp
 * @brief Moves media out of a pack into a per-pack blacklist directory
 */

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace pswarm {

class MediaBlacklist {
public:
    using NotifyCallback = std::function<void(const std::string& title, const std::string& message)>;

    MediaBlacklist(std::filesystem::path root, NotifyCallback notify);

    /**
     * @brief Move @p media to <root>/<pack name without whitespace>/
     *
     * Reports the outcome through the notify callback either way. Never
     * throws.
     *
     * @return destination path on success
     */
    std::optional<std::filesystem::path> blacklist(const std::filesystem::path& media,
                                                   const std::string& pack_name);

    std::filesystem::path directoryFor(const std::string& pack_name) const;

    const std::filesystem::path& getRoot() const { return root_; }

    static std::filesystem::path getDefaultRoot();

private:
    std::filesystem::path root_;
    NotifyCallback notify_;

    void fail(const std::filesystem::path& media, const std::string& pack_name,
              const std::string& reason);
};

}
