#include "rollcall/haar_detector.h"
#include "rollcall/errors.h"

#include <algorithm>
#include <filesystem>
#include <opencv2/imgproc.hpp>

using namespace rollcall;
namespace fs = std::filesystem;

HaarFaceDetector::HaarFaceDetector(const std::string& cascade_path, int min_face_size)
    : min_face_size_(min_face_size) {
    if (!fs::exists(cascade_path))
        throw MissingDependencyError("Haar cascade not found: " + cascade_path +
                                     ". Install OpenCV data files or pass --cascade.");
    if (!cascade_.load(cascade_path))
        throw MissingDependencyError("Failed to load Haar cascade: " + cascade_path);
}

std::vector<FaceBox> HaarFaceDetector::detect(const cv::Mat& rgb) {
    std::vector<FaceBox> out;
    if (rgb.empty())
        return out;

    cv::Mat gray;
    if (rgb.channels() == 3)
        cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
    else
        gray = rgb;

    std::vector<cv::Rect> faces;
    cascade_.detectMultiScale(gray, faces, 1.1, 4, 0, {min_face_size_, min_face_size_});

    std::sort(faces.begin(), faces.end(),
              [](const cv::Rect& a, const cv::Rect& b) { return a.area() > b.area(); });

    const cv::Rect bounds(0, 0, rgb.cols, rgb.rows);
    for (const auto& f : faces) {
        cv::Rect r = f & bounds;
        if (r.area() <= 0)
            continue;
        out.push_back(FaceBox::from_rect(r));
    }
    return out;
}
