#pragma once
#include <filesystem>
#include <string>

#include "rollcall/encoder.h"
#include "rollcall/face_types.h"

namespace rollcall {

// .jpg .jpeg .png .bmp, case-insensitive
bool is_supported_image(const std::filesystem::path& path);

// "John_Doe.jpg" -> "John Doe"
std::string display_name_for(const std::filesystem::path& path);

// Build the gallery from one image per person, in sorted filename order.
// Images without a detectable face are skipped with a warning; only the
// first face of an image is kept.
// Throws NotFoundError if `dir` is not a directory and ConfigurationError
// if no image produced an encoding.
Gallery load_known_faces(const std::filesystem::path& dir, Encoder& encoder);

} // namespace rollcall
