#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "rollcall/encoder.h"
#include "rollcall/haar_detector.h"

namespace rollcall {

// Local binary pattern spatial histogram of a grey face crop:
// resized to 200x200, histogram-equalised, `grid` x `grid` cells of
// 256 bins each, L2-normalised.
Encoding lbp_spatial_histogram(const cv::Mat& gray, int grid = 8);

// Encoder backend that needs no model file: Haar cascade + LBP histograms,
// compared with cosine distance.
class LbphEncoder : public Encoder {
public:
    LbphEncoder(const std::string& cascade_path, int min_face_size, int grid = 8);

    std::vector<FaceBox> detect_boxes(const cv::Mat& rgb) override;
    std::vector<Encoding> encode_faces(const cv::Mat& rgb,
                                       const std::vector<FaceBox>& boxes) override;
    DistanceMetric metric() const override { return DistanceMetric::Cosine; }

private:
    HaarFaceDetector detector_;
    int grid_;
};

} // namespace rollcall
