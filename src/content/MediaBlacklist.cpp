#include "popswarm/content/MediaBlacklist.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <cstdlib>
#include <iostream>
#include <system_error>

namespace pswarm {

MediaBlacklist::MediaBlacklist(std::filesystem::path root, NotifyCallback notify)
    : root_(std::move(root)), notify_(std::move(notify)) {}

std::filesystem::path MediaBlacklist::directoryFor(const std::string& pack_name) const {
    std::string folder;
    std::copy_if(pack_name.begin(), pack_name.end(), std::back_inserter(folder),
        [](unsigned char c) { return !std::isspace(c); });

    if (folder.empty()) {
        folder = "default";
    }
    return root_ / folder;
}

std::optional<std::filesystem::path> MediaBlacklist::blacklist(const std::filesystem::path& media,
                                                               const std::string& pack_name) {
    std::error_code ec;

    if (!std::filesystem::is_regular_file(media, ec)) {
        fail(media, pack_name, "file does not exist");
        return std::nullopt;
    }

    auto directory = directoryFor(pack_name);
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        fail(media, pack_name, ec.message());
        return std::nullopt;
    }

    auto target = directory / media.filename();
    if (std::filesystem::exists(target, ec)) {
        fail(media, pack_name, "already blacklisted");
        return std::nullopt;
    }

    std::filesystem::rename(media, target, ec);
    if (ec) {
        // Pack and blacklist on different filesystems
        std::error_code copy_ec;
        std::filesystem::copy_file(media, target, copy_ec);
        if (copy_ec) {
            fail(media, pack_name, copy_ec.message());
            return std::nullopt;
        }

        std::filesystem::remove(media, copy_ec);
        if (copy_ec) {
            std::filesystem::remove(target, ec);
            fail(media, pack_name, copy_ec.message());
            return std::nullopt;
        }
    }

    std::cout << "MediaBlacklist: " << media.filename().string() << " -> " << directory << std::endl;

    if (notify_) {
        notify_(pack_name, media.filename().string() + " has been successfully sent to blacklist");
    }
    return target;
}

void MediaBlacklist::fail(const std::filesystem::path& media, const std::string& pack_name,
                          const std::string& reason) {
    std::cerr << "MediaBlacklist: Failed to blacklist " << media << ": " << reason << std::endl;

    if (notify_) {
        notify_(pack_name, "Could not blacklist " + media.filename().string() + ": " + reason);
    }
}

std::filesystem::path MediaBlacklist::getDefaultRoot() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "popswarm" / "blacklist";
    }

    auto home = std::getenv("HOME");
    if (!home) return "/tmp/popswarm/blacklist";

    return std::filesystem::path(home) / ".local" / "share" / "popswarm" / "blacklist";
}

}
