#pragma once

/**
 * @file MediaPack.hpp
 * @brief Where popups get their media, captions, denial lines and links
 */

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "popswarm/geometry/Rect.hpp"
#include "popswarm/utils/Random.hpp"

namespace pswarm {

struct PopupContent {
    std::filesystem::path media;
    Size source_size;
    int clicks_to_close{1};
    std::string caption;            // empty when the media has none
    std::string denial_text;
};

class ContentProvider {
public:
    virtual ~ContentProvider() = default;

    /**
     * @brief Draw the content for one popup
     * @return nullopt when the pack has no usable media left
     */
    virtual std::optional<PopupContent> nextPopup(RandomEngine& rng) = 0;

    virtual std::optional<std::string> randomWebUrl(RandomEngine& rng) = 0;

    virtual std::string packName() const = 0;

    /**
     * @brief Stop offering a media file, e.g. after it was blacklisted
     */
    virtual void forgetMedia(const std::filesystem::path& media) = 0;
};

/**
 * @brief Pack backed by a plain directory
 *
 * Layout:
 *   *.png          media (searched recursively)
 *   web.txt        one URL per line
 *   captions.txt   "file.png: caption" per line
 *   denial.txt     one denial line per line
 *
 * Lines starting with '#' and blank lines are ignored in every text file.
 */
class DirectoryPack : public ContentProvider {
public:
    using SizeReader = std::function<std::optional<Size>(const std::filesystem::path&)>;

    static constexpr const char* DEFAULT_DENIAL_TEXT = "Not for you~";

    DirectoryPack(std::filesystem::path root, SizeReader read_size, int max_clicks);

    DirectoryPack(const DirectoryPack&) = delete;
    DirectoryPack& operator=(const DirectoryPack&) = delete;

    /**
     * @brief Scan the directory
     * @return false if it does not exist or holds no media
     */
    bool load();

    std::optional<PopupContent> nextPopup(RandomEngine& rng) override;
    std::optional<std::string> randomWebUrl(RandomEngine& rng) override;
    std::string packName() const override { return name_; }
    void forgetMedia(const std::filesystem::path& media) override;

    size_t getMediaCount() const;

    void setMaxClicks(int max_clicks);

    static std::vector<std::string> readLines(const std::filesystem::path& path);

private:
    std::filesystem::path root_;
    std::string name_;
    SizeReader read_size_;

    mutable std::mutex mutex_;
    int max_clicks_;
    std::vector<std::filesystem::path> media_;
    std::vector<std::string> web_urls_;
    std::vector<std::string> denial_lines_;
    std::unordered_map<std::string, std::string> captions_;
};

}
