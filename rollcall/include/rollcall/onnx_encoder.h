#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

#include "rollcall/encoder.h"
#include "rollcall/haar_detector.h"

namespace rollcall {

// Neural embedding backend: Haar cascade for boxes, an ONNX face embedding
// network for encodings (L2-normalised, compared with Euclidean distance).
// Builds without ROLLCALL_ENABLE_ONNX throw MissingDependencyError on
// construction.
class OnnxEncoder : public Encoder {
public:
    OnnxEncoder(const std::string& model_path, const std::string& cascade_path,
                int min_face_size);
    ~OnnxEncoder() override;

    std::vector<FaceBox> detect_boxes(const cv::Mat& rgb) override;
    std::vector<Encoding> encode_faces(const cv::Mat& rgb,
                                       const std::vector<FaceBox>& boxes) override;
    DistanceMetric metric() const override { return DistanceMetric::Euclidean; }

    // embedding of one RGB face crop
    Encoding embed(const cv::Mat& rgb_crop);

    // model input (width,height)
    std::pair<int,int> input_size() const { return input_size_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::unique_ptr<HaarFaceDetector> detector_;

    std::pair<int,int> input_size_ = {112,112};
};

} // namespace rollcall
