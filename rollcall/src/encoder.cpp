#include "rollcall/encoder.h"
#include "rollcall/config.h"
#include "rollcall/errors.h"
#include "rollcall/lbph_encoder.h"
#include "rollcall/onnx_encoder.h"

#include <spdlog/spdlog.h>

using namespace rollcall;

std::unique_ptr<Encoder> rollcall::make_encoder(const AppConfig& cfg) {
    if (cfg.backend == "lbph") {
        spdlog::info("Using LBPH face encoder (cascade {})", cfg.cascade_path);
        return std::make_unique<LbphEncoder>(cfg.cascade_path, cfg.min_face_size);
    }
    if (cfg.backend == "onnx") {
        spdlog::info("Using ONNX face encoder (model {})", cfg.model_path);
        return std::make_unique<OnnxEncoder>(cfg.model_path, cfg.cascade_path, cfg.min_face_size);
    }
    throw ConfigurationError("unknown backend '" + cfg.backend + "'");
}
