#include "rollcall/gallery.h"
#include "rollcall/errors.h"
#include "text_util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

using namespace rollcall;
using detail::trim;
namespace fs = std::filesystem;

static const std::array<const char*, 4> kSupportedExtensions = {".jpg", ".jpeg", ".png", ".bmp"};

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool rollcall::is_supported_image(const fs::path& path) {
    const std::string ext = to_lower(path.extension().string());
    return std::find(kSupportedExtensions.begin(), kSupportedExtensions.end(), ext) !=
           kSupportedExtensions.end();
}

std::string rollcall::display_name_for(const fs::path& path) {
    std::string stem = path.stem().string();
    std::replace(stem.begin(), stem.end(), '_', ' ');
    return trim(stem);
}

Gallery rollcall::load_known_faces(const fs::path& dir, Encoder& encoder) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        throw NotFoundError("Known faces directory not found: " +
                            fs::absolute(dir, ec).string());

    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(dir))
        entries.push_back(entry.path());
    std::sort(entries.begin(), entries.end());

    Gallery gallery;
    for (const auto& path : entries) {
        if (!is_supported_image(path))
            continue;

        cv::Mat bgr = cv::imread(path.string(), cv::IMREAD_COLOR);
        if (bgr.empty()) {
            spdlog::warn("Could not read {}, skipping.", path.filename().string());
            continue;
        }
        cv::Mat rgb;
        cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

        std::vector<Encoding> encodings = encoder.encode(rgb);
        if (encodings.empty()) {
            spdlog::warn("No face found in {}, skipping.", path.filename().string());
            continue;
        }
        if (encodings.size() > 1)
            spdlog::debug("{}: {} faces found, keeping the first", path.filename().string(),
                          encodings.size());

        gallery.push_back(KnownFace{display_name_for(path), std::move(encodings.front())});
    }

    if (gallery.empty())
        throw ConfigurationError(
            "No valid face encodings were loaded. Add clear face images in " + dir.string());

    spdlog::info("Loaded {} known face(s).", gallery.size());
    return gallery;
}
