#include "rollcall/overlay.h"

#include <opencv2/imgproc.hpp>

using namespace rollcall;

void rollcall::draw_identity(cv::Mat& frame, const FaceBox& box, const std::string& label) {
    const cv::Scalar green(0, 255, 0);

    cv::rectangle(frame, {box.left, box.top}, {box.right, box.bottom}, green, 2);
    cv::rectangle(frame, {box.left, box.bottom - 30}, {box.right, box.bottom}, green, cv::FILLED);
    cv::putText(frame, label, {box.left + 6, box.bottom - 6},
                cv::FONT_HERSHEY_DUPLEX, 0.7, cv::Scalar(0, 0, 0), 1);
}
