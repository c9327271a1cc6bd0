#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace rollcall {

// feature vector of one detected face
using Encoding = std::vector<float>;

// face location in image coordinates, edges inclusive of top/left
struct FaceBox {
    int top = 0;
    int right = 0;
    int bottom = 0;
    int left = 0;

    cv::Rect rect() const { return cv::Rect(left, top, right - left, bottom - top); }
    int area() const { return (right - left) * (bottom - top); }

    static FaceBox from_rect(const cv::Rect& r) {
        return FaceBox{r.y, r.x + r.width, r.y + r.height, r.x};
    }
};

struct KnownFace {
    std::string name;
    Encoding encoding;
};

enum class DistanceMetric {
    Euclidean,  // L2 distance, used for neural embeddings
    Cosine      // 1 - cos(a, b), used for LBP histograms
};

// known identities in sorted filename order; names may repeat
using Gallery = std::vector<KnownFace>;

} // namespace rollcall
