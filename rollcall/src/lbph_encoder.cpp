#include "rollcall/lbph_encoder.h"

#include <opencv2/imgproc.hpp>

using namespace rollcall;

/* ===================== LBP feature extractor ===================== */

// 8-neighbour codes; bit i set when neighbour i is >= the centre pixel
static cv::Mat lbp_codes(const cv::Mat &eq) {
    static const cv::Point kNeighbours[8] = {
        {-1,-1}, {0,-1}, {1,-1}, {1,0}, {1,1}, {0,1}, {-1,1}, {-1,0}
    };

    cv::Mat pad;
    cv::copyMakeBorder(eq, pad, 1, 1, 1, 1, cv::BORDER_REPLICATE);
    const cv::Mat center = pad(cv::Rect(1, 1, eq.cols, eq.rows));

    cv::Mat codes = cv::Mat::zeros(eq.size(), CV_8U);
    cv::Mat ge, bit;
    for (int i = 0; i < 8; ++i) {
        const cv::Mat nb = pad(cv::Rect(cv::Point(1, 1) + kNeighbours[i], eq.size()));
        cv::compare(nb, center, ge, cv::CMP_GE);          // 255 / 0
        cv::bitwise_and(ge, cv::Scalar(1 << i), bit);
        cv::bitwise_or(codes, bit, codes);
    }
    return codes;
}

Encoding rollcall::lbp_spatial_histogram(const cv::Mat &face, int grid) {
    if (face.empty())
        return {};
    if (grid <= 0)
        grid = 8;

    cv::Mat gray;
    if (face.channels() == 3)
        cv::cvtColor(face, gray, cv::COLOR_RGB2GRAY);
    else
        gray = face;

    cv::Mat eq;
    cv::resize(gray, eq, cv::Size(200, 200));
    cv::equalizeHist(eq, eq);

    const cv::Mat codes = lbp_codes(eq);

    const int bins = 256;
    const int cell_h = codes.rows / grid;
    const int cell_w = codes.cols / grid;
    const float range[] = {0.f, 256.f};
    const float* ranges[] = {range};
    const int channel = 0;

    Encoding feat(static_cast<size_t>(grid) * grid * bins, 0.f);
    if (cell_h == 0 || cell_w == 0)
        return feat;

    const float cell_area = static_cast<float>(cell_h * cell_w);
    float* out = feat.data();
    for (int gy = 0; gy < grid; ++gy) {
        for (int gx = 0; gx < grid; ++gx, out += bins) {
            const cv::Mat cell = codes(cv::Rect(gx * cell_w, gy * cell_h, cell_w, cell_h));
            cv::Mat hist;
            cv::calcHist(&cell, 1, &channel, cv::Mat(), hist, 1, &bins, ranges);
            for (int k = 0; k < bins; ++k)
                out[k] = hist.at<float>(k) / cell_area;
        }
    }

    cv::Mat view(1, static_cast<int>(feat.size()), CV_32F, feat.data());
    const double n = cv::norm(view, cv::NORM_L2) + 1e-12;
    view /= n;
    return feat;
}

/* ===================== encoder ===================== */

LbphEncoder::LbphEncoder(const std::string& cascade_path, int min_face_size, int grid)
    : detector_(cascade_path, min_face_size), grid_(grid) {}

std::vector<FaceBox> LbphEncoder::detect_boxes(const cv::Mat& rgb) {
    return detector_.detect(rgb);
}

std::vector<Encoding> LbphEncoder::encode_faces(const cv::Mat& rgb,
                                                const std::vector<FaceBox>& boxes) {
    std::vector<Encoding> out;
    out.reserve(boxes.size());

    const cv::Rect bounds(0, 0, rgb.cols, rgb.rows);
    for (const auto& box : boxes) {
        cv::Rect r = box.rect() & bounds;
        if (r.area() <= 0) {
            out.emplace_back();  // keeps order aligned with boxes
            continue;
        }
        out.push_back(lbp_spatial_histogram(rgb(r), grid_));
    }
    return out;
}
