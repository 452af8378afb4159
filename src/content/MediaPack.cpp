#include "popswarm/content/MediaPack.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace pswarm {

namespace {

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool isPng(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png";
}

}

DirectoryPack::DirectoryPack(std::filesystem::path root, SizeReader read_size, int max_clicks)
    : root_(std::move(root)),
      read_size_(std::move(read_size)),
      max_clicks_(std::max(1, max_clicks)) {
    name_ = root_.filename().string();
    if (name_.empty()) {
        name_ = root_.parent_path().filename().string();
    }
}

bool DirectoryPack::load() {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        std::cerr << "DirectoryPack: Not a directory: " << root_ << std::endl;
        return false;
    }

    std::vector<std::filesystem::path> media;
    auto it = std::filesystem::recursive_directory_iterator(
        root_, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "DirectoryPack: Cannot read " << root_ << ": " << ec.message() << std::endl;
        return false;
    }

    for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "DirectoryPack: " << ec.message() << std::endl;
            break;
        }

        std::error_code file_ec;
        if (it->is_regular_file(file_ec) && isPng(it->path())) {
            media.push_back(it->path());
        }
    }

    // Directory order is unspecified; keep draws reproducible for a seed
    std::sort(media.begin(), media.end());

    std::unordered_map<std::string, std::string> captions;
    for (const auto& line : readLines(root_ / "captions.txt")) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string file = trim(line.substr(0, colon));
        std::string caption = trim(line.substr(colon + 1));
        if (!file.empty() && !caption.empty()) {
            captions[file] = caption;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    media_ = std::move(media);
    web_urls_ = readLines(root_ / "web.txt");
    denial_lines_ = readLines(root_ / "denial.txt");
    captions_ = std::move(captions);

    std::cout << "DirectoryPack: Loaded '" << name_ << "' with " << media_.size()
              << " media, " << web_urls_.size() << " links" << std::endl;

    return !media_.empty();
}

std::optional<PopupContent> DirectoryPack::nextPopup(RandomEngine& rng) {
    std::lock_guard<std::mutex> lock(mutex_);

    while (!media_.empty()) {
        int index = randomInt(0, static_cast<int>(media_.size()) - 1, rng);
        const auto& path = media_[index];

        std::optional<Size> size = read_size_ ? read_size_(path) : std::nullopt;
        if (!size || size->width <= 0 || size->height <= 0) {
            std::cerr << "DirectoryPack: Dropping unreadable media " << path << std::endl;
            media_.erase(media_.begin() + index);
            continue;
        }

        PopupContent content;
        content.media = path;
        content.source_size = *size;
        content.clicks_to_close = randomInt(1, max_clicks_, rng);

        auto caption = captions_.find(path.filename().string());
        if (caption != captions_.end()) {
            content.caption = caption->second;
        }

        if (denial_lines_.empty()) {
            content.denial_text = DEFAULT_DENIAL_TEXT;
        } else {
            content.denial_text = denial_lines_[randomInt(0, static_cast<int>(denial_lines_.size()) - 1, rng)];
        }

        return content;
    }

    return std::nullopt;
}

std::optional<std::string> DirectoryPack::randomWebUrl(RandomEngine& rng) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (web_urls_.empty()) {
        return std::nullopt;
    }
    return web_urls_[randomInt(0, static_cast<int>(web_urls_.size()) - 1, rng)];
}

void DirectoryPack::forgetMedia(const std::filesystem::path& media) {
    std::lock_guard<std::mutex> lock(mutex_);
    media_.erase(std::remove(media_.begin(), media_.end(), media), media_.end());
}

size_t DirectoryPack::getMediaCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return media_.size();
}

void DirectoryPack::setMaxClicks(int max_clicks) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_clicks_ = std::max(1, max_clicks);
}

std::vector<std::string> DirectoryPack::readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;

    std::ifstream file(path);
    if (!file.is_open()) {
        return lines;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        lines.push_back(line);
    }
    return lines;
}

}
