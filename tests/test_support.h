#pragma once
#include <atomic>
#include <chrono>
#include <cmath>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "rollcall/capture.h"
#include "rollcall/encoder.h"
#include "rollcall/matcher.h"

namespace rollcall::test {

namespace fs = std::filesystem;

// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "rollcall_";
        if (info) name += std::string(info->test_suite_name()) + "_" + info->name() + "_";
        name += std::to_string(::getpid()) + "_" + std::to_string(counter++);
        path_ = fs::temp_directory_path() / name;
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& leaf) const { return path_ / leaf; }

private:
    fs::path path_;
};

// solid BGR image
inline cv::Mat solid(int w, int h, const cv::Scalar& bgr) {
    return cv::Mat(h, w, CV_8UC3, bgr);
}

inline const cv::Scalar kRed(0, 0, 255);
inline const cv::Scalar kGreen(0, 255, 0);
inline const cv::Scalar kBlue(255, 0, 0);
inline const cv::Scalar kBlack(0, 0, 0);

inline void write_image(const fs::path& path, const cv::Mat& bgr) {
    ASSERT_TRUE(cv::imwrite(path.string(), bgr)) << path;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

// fixed local time 2024-03-14 09:30:05 plus `days`
inline std::chrono::system_clock::time_point fixed_time(int days = 0) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 14 + days;
    tm.tm_hour = 9;
    tm.tm_min = 30;
    tm.tm_sec = 5;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

// Faces are read from pixel colours. A dark image has no face; any other
// image has one face covering it, or two (left and right halves) when it
// is at least twice as wide as it is tall. The encoding of a face is its
// mean RGB colour scaled to [0,1] and rounded to one decimal.
class FakeEncoder : public Encoder {
public:
    std::vector<FaceBox> detect_boxes(const cv::Mat& rgb) override {
        ++detect_calls;
        std::vector<FaceBox> out;
        if (rgb.empty() || cv::mean(rgb)[0] + cv::mean(rgb)[1] + cv::mean(rgb)[2] < 64.0)
            return out;
        if (rgb.cols >= 2 * rgb.rows) {
            out.push_back(FaceBox{0, rgb.cols / 2, rgb.rows, 0});
            out.push_back(FaceBox{0, rgb.cols, rgb.rows, rgb.cols / 2});
        } else {
            out.push_back(FaceBox{0, rgb.cols, rgb.rows, 0});
        }
        return out;
    }

    std::vector<Encoding> encode_faces(const cv::Mat& rgb,
                                       const std::vector<FaceBox>& boxes) override {
        std::vector<Encoding> out;
        for (const auto& box : boxes) {
            cv::Scalar m = cv::mean(rgb(box.rect()));
            out.push_back({round1(m[0] / 255.0), round1(m[1] / 255.0), round1(m[2] / 255.0)});
        }
        return out;
    }

    DistanceMetric metric() const override { return DistanceMetric::Euclidean; }

    int detect_calls = 0;

private:
    static float round1(double v) { return static_cast<float>(std::round(v * 10.0) / 10.0); }
};

// Returns canned distances and match flags whatever the input.
class StubMatcher : public Matcher {
public:
    StubMatcher(std::vector<float> distances, std::vector<bool> matches)
        : distances_(std::move(distances)), matches_(std::move(matches)) {}

    std::vector<float> distance(const std::vector<Encoding>&, const Encoding&) const override {
        return distances_;
    }
    std::vector<bool> compare(const std::vector<Encoding>&, const Encoding&, float) const override {
        return matches_;
    }

private:
    std::vector<float> distances_;
    std::vector<bool> matches_;
};

// Plays back a fixed list of frames, then reports read failure.
class ScriptedSource : public FrameSource {
public:
    explicit ScriptedSource(std::vector<cv::Mat> frames) : frames_(frames.begin(), frames.end()) {}

    bool read(cv::Mat& frame) override {
        ++reads;
        if (frames_.empty())
            return false;
        frame = frames_.front().clone();
        frames_.pop_front();
        return true;
    }
    void release() override { ++releases; }

    int reads = 0;
    int releases = 0;

private:
    std::deque<cv::Mat> frames_;
};

// Records shown frames; poll_key returns scripted keys, then -1.
class FakeDisplay : public Display {
public:
    explicit FakeDisplay(std::vector<int> keys = {}) : keys_(keys.begin(), keys.end()) {}

    void show(const cv::Mat& frame) override { shown.push_back(frame.clone()); }
    int poll_key(int) override {
        if (keys_.empty())
            return -1;
        int k = keys_.front();
        keys_.pop_front();
        return k;
    }
    void close() override { ++closes; }

    std::vector<cv::Mat> shown;
    int closes = 0;

private:
    std::deque<int> keys_;
};

} // namespace rollcall::test
