#pragma once
#include <memory>
#include <vector>
#include <opencv2/core.hpp>

#include "rollcall/face_types.h"

namespace rollcall {

struct AppConfig;

// Face detection and encoding service. Input images are RGB (CV_8UC3).
class Encoder {
public:
    virtual ~Encoder() = default;

    virtual std::vector<FaceBox> detect_boxes(const cv::Mat& rgb) = 0;

    // one encoding per box, in the order of `boxes`
    virtual std::vector<Encoding> encode_faces(const cv::Mat& rgb,
                                               const std::vector<FaceBox>& boxes) = 0;

    virtual DistanceMetric metric() const = 0;

    // detect then encode every face in the image
    std::vector<Encoding> encode(const cv::Mat& rgb) {
        return encode_faces(rgb, detect_boxes(rgb));
    }
};

// Build the backend named by cfg.backend. Throws MissingDependencyError when
// the cascade, the model or the ONNX runtime is unavailable.
std::unique_ptr<Encoder> make_encoder(const AppConfig& cfg);

} // namespace rollcall
