#pragma once
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace rollcall {

// Source of BGR frames.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // false when no frame could be read
    virtual bool read(cv::Mat& frame) = 0;
    virtual void release() = 0;
};

// Preview surface with keyboard polling.
class Display {
public:
    virtual ~Display() = default;

    virtual void show(const cv::Mat& frame) = 0;
    // key code of a pressed key, or -1 after `delay_ms`
    virtual int poll_key(int delay_ms) = 0;
    virtual void close() = 0;
};

class CameraSource : public FrameSource {
public:
    // throws RuntimeError if the device cannot be opened
    explicit CameraSource(int index);
    ~CameraSource() override;

    CameraSource(const CameraSource&) = delete;
    CameraSource& operator=(const CameraSource&) = delete;

    bool read(cv::Mat& frame) override;
    void release() override;

private:
    cv::VideoCapture cap_;
    int index_;
};

class WindowDisplay : public Display {
public:
    explicit WindowDisplay(std::string title);
    ~WindowDisplay() override;

    WindowDisplay(const WindowDisplay&) = delete;
    WindowDisplay& operator=(const WindowDisplay&) = delete;

    void show(const cv::Mat& frame) override;
    int poll_key(int delay_ms) override;
    void close() override;

private:
    std::string title_;
    bool open_ = false;
};

} // namespace rollcall
