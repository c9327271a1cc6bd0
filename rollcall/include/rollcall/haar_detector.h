#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

#include "rollcall/face_types.h"

namespace rollcall {

// Frontal face detector over an OpenCV Haar cascade.
class HaarFaceDetector {
public:
    // throws MissingDependencyError if the cascade cannot be loaded
    explicit HaarFaceDetector(const std::string& cascade_path, int min_face_size = 80);

    // boxes clipped to the image, largest first; accepts RGB or grey input
    std::vector<FaceBox> detect(const cv::Mat& rgb);

private:
    cv::CascadeClassifier cascade_;
    int min_face_size_;
};

} // namespace rollcall
