#pragma once
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace rollcall {

struct AppConfig {
    std::string known_faces_dir = "known_faces";
    std::string output = "attendance.csv";
    int camera_index = 0;
    float tolerance = 0.5f;             // lower = stricter

    std::string backend = "lbph";       // "lbph" or "onnx"
    std::string model_path = "models/face_embedding.onnx";
    std::string cascade_path =
        "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml";
    int min_face_size = 80;

    std::string window_title = "Live Attendance";
    int quit_key = 'q';
    std::string log_level = "info";
};

// bad command line syntax; reported with usage text
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// Overlay the keys present in a JSON object file onto `base`.
// Throws NotFoundError if the file is missing, ConfigurationError if it is
// not a JSON object or a value has the wrong type.
AppConfig load_config_file(const std::string& path, AppConfig base = AppConfig{});

// Parse argv. Precedence: defaults < --config file < explicit flags.
// Returns nullopt after writing usage to `out` when --help was given.
std::optional<AppConfig> parse_command_line(int argc, const char* const argv[],
                                            std::ostream& out);

// Whole-string float for positional tolerance arguments; UsageError otherwise.
float parse_tolerance(const std::string& text);

// Throws ConfigurationError describing the first invalid setting.
void validate(const AppConfig& cfg);

} // namespace rollcall
