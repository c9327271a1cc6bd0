#include "rollcall/config.h"
#include "rollcall/errors.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace rollcall;
namespace fs = std::filesystem;
namespace po = boost::program_options;
using json = nlohmann::json;

/* ---------------- JSON config file ---------------- */

AppConfig rollcall::load_config_file(const std::string& path, AppConfig base) {
    if (!fs::is_regular_file(path))
        throw NotFoundError("Config file not found: " + path);

    std::ifstream in(path);
    if (!in.good())
        throw NotFoundError("Config file not readable: " + path);

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw ConfigurationError("Malformed config file " + path + ": " + e.what());
    }
    if (!j.is_object())
        throw ConfigurationError("Config file " + path + " must hold a JSON object");

    AppConfig cfg = std::move(base);
    try {
        cfg.known_faces_dir = j.value("known_faces_dir", cfg.known_faces_dir);
        cfg.output          = j.value("output", cfg.output);
        cfg.camera_index    = j.value("camera_index", cfg.camera_index);
        cfg.tolerance       = j.value("tolerance", cfg.tolerance);
        cfg.backend         = j.value("backend", cfg.backend);
        cfg.model_path      = j.value("model", cfg.model_path);
        cfg.cascade_path    = j.value("cascade", cfg.cascade_path);
        cfg.min_face_size   = j.value("min_face_size", cfg.min_face_size);
        cfg.window_title    = j.value("window_title", cfg.window_title);
        cfg.log_level       = j.value("log_level", cfg.log_level);

        if (j.contains("quit_key")) {
            auto key = j["quit_key"].get<std::string>();
            if (key.size() != 1)
                throw ConfigurationError("quit_key must be a single character");
            cfg.quit_key = static_cast<unsigned char>(key[0]);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("Bad value in config file " + path + ": " + e.what());
    }
    return cfg;
}

/* ---------------- command line ---------------- */

std::optional<AppConfig> rollcall::parse_command_line(int argc, const char* const argv[],
                                                      std::ostream& out) {
    const AppConfig defaults;

    po::options_description desc("Live facial recognition attendance");
    desc.add_options()
        ("help,h", "Print this help and exit.")
        ("config", po::value<std::string>(),
            "JSON file with settings; explicit flags take precedence.")
        ("known-faces-dir", po::value<std::string>()->default_value(defaults.known_faces_dir),
            "Directory containing known face images.")
        ("output", po::value<std::string>()->default_value(defaults.output),
            "CSV file to write attendance records.")
        ("camera-index", po::value<int>()->default_value(defaults.camera_index),
            "OpenCV camera index.")
        ("tolerance", po::value<float>()->default_value(defaults.tolerance, "0.5"),
            "Face match tolerance (lower = stricter).")
        ("backend", po::value<std::string>()->default_value(defaults.backend),
            "Face encoding backend: lbph or onnx.")
        ("model", po::value<std::string>()->default_value(defaults.model_path),
            "ONNX embedding model (onnx backend).")
        ("cascade", po::value<std::string>()->default_value(defaults.cascade_path),
            "Haar cascade used for face detection.")
        ("min-face-size", po::value<int>()->default_value(defaults.min_face_size),
            "Smallest face side in pixels the detector reports.")
        ("log-level", po::value<std::string>()->default_value(defaults.log_level),
            "trace, debug, info, warn, error, critical or off.");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::ostringstream usage;
        usage << e.what() << "\n" << desc;
        throw UsageError(usage.str());
    }

    if (vm.count("help")) {
        out << desc << "\n";
        return std::nullopt;
    }

    AppConfig cfg = defaults;
    if (vm.count("config"))
        cfg = load_config_file(vm["config"].as<std::string>(), cfg);

    auto explicit_flag = [&vm](const char* name) {
        return vm.count(name) && !vm[name].defaulted();
    };

    if (explicit_flag("known-faces-dir")) cfg.known_faces_dir = vm["known-faces-dir"].as<std::string>();
    if (explicit_flag("output"))          cfg.output = vm["output"].as<std::string>();
    if (explicit_flag("camera-index"))    cfg.camera_index = vm["camera-index"].as<int>();
    if (explicit_flag("tolerance"))       cfg.tolerance = vm["tolerance"].as<float>();
    if (explicit_flag("backend"))         cfg.backend = vm["backend"].as<std::string>();
    if (explicit_flag("model"))           cfg.model_path = vm["model"].as<std::string>();
    if (explicit_flag("cascade"))         cfg.cascade_path = vm["cascade"].as<std::string>();
    if (explicit_flag("min-face-size"))   cfg.min_face_size = vm["min-face-size"].as<int>();
    if (explicit_flag("log-level"))       cfg.log_level = vm["log-level"].as<std::string>();

    return cfg;
}

float rollcall::parse_tolerance(const std::string& text) {
    size_t used = 0;
    float value = 0.0f;
    try {
        value = std::stof(text, &used);
    } catch (const std::logic_error&) {
        throw UsageError("tolerance is not a number: '" + text + "'");
    }
    if (used != text.size())
        throw UsageError("tolerance is not a number: '" + text + "'");
    return value;
}

/* ---------------- validation ---------------- */

void rollcall::validate(const AppConfig& cfg) {
    if (!std::isfinite(cfg.tolerance) || cfg.tolerance <= 0.0f)
        throw ConfigurationError("tolerance must be a positive number");
    if (cfg.camera_index < 0)
        throw ConfigurationError("camera index must not be negative");
    if (cfg.backend != "lbph" && cfg.backend != "onnx")
        throw ConfigurationError("unknown backend '" + cfg.backend + "' (expected lbph or onnx)");
    if (cfg.min_face_size <= 0)
        throw ConfigurationError("min face size must be positive");
    if (cfg.known_faces_dir.empty())
        throw ConfigurationError("known faces directory must not be empty");
    if (cfg.output.empty())
        throw ConfigurationError("output path must not be empty");

    if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off")
        throw ConfigurationError("unknown log level '" + cfg.log_level + "'");
}
