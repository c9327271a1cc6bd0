#pragma once
#include <string>
#include <opencv2/core.hpp>

#include "rollcall/face_types.h"

namespace rollcall {

// Green box around the face with the label on a filled band along its
// bottom edge.
void draw_identity(cv::Mat& frame, const FaceBox& box, const std::string& label);

} // namespace rollcall
