#include "rollcall/capture.h"
#include "rollcall/errors.h"

#include <opencv2/highgui.hpp>
#include <spdlog/spdlog.h>

using namespace rollcall;

/* ---------------- camera ---------------- */

CameraSource::CameraSource(int index) : cap_(index), index_(index) {
    if (!cap_.isOpened())
        throw RuntimeError("Could not open camera index " + std::to_string(index) +
                           ". Check camera permissions/device.");
    spdlog::debug("camera {} opened ({}x{})", index_,
                  cap_.get(cv::CAP_PROP_FRAME_WIDTH), cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
}

CameraSource::~CameraSource() {
    release();
}

bool CameraSource::read(cv::Mat& frame) {
    if (!cap_.isOpened())
        return false;
    return cap_.read(frame) && !frame.empty();
}

void CameraSource::release() {
    if (cap_.isOpened()) {
        cap_.release();
        spdlog::debug("camera {} released", index_);
    }
}

/* ---------------- window ---------------- */

WindowDisplay::WindowDisplay(std::string title) : title_(std::move(title)) {}

WindowDisplay::~WindowDisplay() {
    close();
}

void WindowDisplay::show(const cv::Mat& frame) {
    cv::imshow(title_, frame);
    open_ = true;
}

int WindowDisplay::poll_key(int delay_ms) {
    return cv::waitKey(delay_ms);
}

void WindowDisplay::close() {
    if (!open_)
        return;
    cv::destroyAllWindows();
    open_ = false;
}
