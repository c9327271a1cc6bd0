#include "rollcall/onnx_encoder.h"
#include "rollcall/errors.h"

#include <filesystem>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

#ifdef ROLLCALL_ENABLE_ONNX

#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>

using namespace rollcall;

struct OnnxEncoder::Impl {
    Ort::Env env;
    Ort::SessionOptions opts;
    std::unique_ptr<Ort::Session> session;
    std::string input_name;
    std::vector<std::string> output_names;
    std::pair<int,int> input_size = {112,112};

    explicit Impl(const std::string &model)
        : env(ORT_LOGGING_LEVEL_WARNING, "rollcall")
    {
        opts.SetIntraOpNumThreads(1);
        session = std::make_unique<Ort::Session>(env, model.c_str(), opts);

        auto names = session->GetInputNames();
        if (names.empty())
            throw MissingDependencyError("ONNX model has no inputs: " + model);
        input_name = names[0];
        output_names = session->GetOutputNames();
        if (output_names.empty())
            throw MissingDependencyError("ONNX model has no outputs: " + model);

        // NCHW; dynamic dims keep the 112x112 default
        auto shape = session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() >= 4) {
            int h = shape[2] > 0 ? static_cast<int>(shape[2]) : 112;
            int w = shape[3] > 0 ? static_cast<int>(shape[3]) : 112;
            input_size = {w, h};
        }
    }
};

// planar NCHW copy of an interleaved CV_32FC3 image
static std::vector<float> to_planar(const cv::Mat &hwc) {
    const int plane = hwc.rows * hwc.cols;
    std::vector<float> out(3 * static_cast<size_t>(plane));
    std::vector<cv::Mat> planes;
    for (int c = 0; c < 3; ++c)
        planes.emplace_back(hwc.rows, hwc.cols, CV_32F, out.data() + c * plane);
    cv::split(hwc, planes);
    return out;
}

OnnxEncoder::OnnxEncoder(const std::string& model_path, const std::string& cascade_path,
                         int min_face_size)
{
    if (!fs::exists(model_path))
        throw MissingDependencyError("ONNX embedding model not found: " + model_path);

    try {
        pimpl_ = std::make_unique<Impl>(model_path);
    } catch (const Ort::Exception& e) {
        throw MissingDependencyError("Failed to load ONNX model " + model_path + ": " + e.what());
    }
    input_size_ = pimpl_->input_size;
    detector_ = std::make_unique<HaarFaceDetector>(cascade_path, min_face_size);

    spdlog::debug("onnx encoder: {} input {}x{}", model_path, input_size_.first, input_size_.second);
}

OnnxEncoder::~OnnxEncoder() = default;

Encoding OnnxEncoder::embed(const cv::Mat &rgb_crop) {
    auto [W,H] = pimpl_->input_size;

    cv::Mat rgb, resized;
    if (rgb_crop.channels() == 1)
        cv::cvtColor(rgb_crop, rgb, cv::COLOR_GRAY2RGB);
    else
        rgb = rgb_crop;
    cv::resize(rgb, resized, {W,H});
    resized.convertTo(resized, CV_32FC3, 1.0/255.0);

    std::vector<float> input = to_planar(resized);

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<int64_t> shape = {1,3,H,W};
    Ort::Value tensor = Ort::Value::CreateTensor<float>(
        mem, input.data(), input.size(), shape.data(), shape.size());

    const char* in_name = pimpl_->input_name.c_str();
    std::vector<const char*> out_names;
    for (auto &s : pimpl_->output_names) out_names.push_back(s.c_str());

    auto outputs = pimpl_->session->Run(
        Ort::RunOptions{nullptr},
        &in_name, &tensor, 1,
        out_names.data(), out_names.size());

    float* ptr = outputs[0].GetTensorMutableData<float>();
    size_t n = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();

    Encoding emb(ptr, ptr+n);

    cv::Mat view(1, static_cast<int>(emb.size()), CV_32F, emb.data());
    const double norm = cv::norm(view, cv::NORM_L2);
    if (norm > 1e-6)
        view /= norm;

    return emb;
}

#else  // ===================== built without onnxruntime =====================

using namespace rollcall;

struct OnnxEncoder::Impl {};

OnnxEncoder::OnnxEncoder(const std::string&, const std::string&, int)
{
    throw MissingDependencyError(
        "ONNX support disabled at build time; reconfigure with "
        "-DROLLCALL_ENABLE_ONNX=ON or use --backend lbph");
}

OnnxEncoder::~OnnxEncoder() = default;

Encoding OnnxEncoder::embed(const cv::Mat&) {
    throw MissingDependencyError("ONNX support disabled at build time");
}

#endif

std::vector<FaceBox> OnnxEncoder::detect_boxes(const cv::Mat& rgb) {
    return detector_->detect(rgb);
}

std::vector<Encoding> OnnxEncoder::encode_faces(const cv::Mat& rgb,
                                                const std::vector<FaceBox>& boxes) {
    std::vector<Encoding> out;
    out.reserve(boxes.size());

    const cv::Rect bounds(0, 0, rgb.cols, rgb.rows);
    for (const auto& box : boxes) {
        cv::Rect r = box.rect() & bounds;
        if (r.area() <= 0) {
            out.emplace_back();
            continue;
        }
        out.push_back(embed(rgb(r)));
    }
    return out;
}
