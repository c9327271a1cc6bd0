#include "rollcall/app.h"
#include "rollcall/capture.h"
#include "rollcall/encoder.h"
#include "rollcall/gallery.h"
#include "rollcall/ledger.h"
#include "rollcall/matcher.h"
#include "rollcall/session.h"

#include <spdlog/spdlog.h>

using namespace rollcall;

App::App(const AppConfig& cfg) : cfg_(cfg) {}

int App::run() {
    AttendanceLedger ledger(cfg_.output);
    ledger.ensure_header();

    auto encoder = make_encoder(cfg_);
    Gallery gallery = load_known_faces(cfg_.known_faces_dir, *encoder);
    DistanceMatcher matcher(encoder->metric());

    CameraSource camera(cfg_.camera_index);
    WindowDisplay window(cfg_.window_title);

    AttendanceSession session(std::move(gallery), *encoder, matcher, ledger,
                              cfg_.tolerance, cfg_.quit_key);
    session.run(camera, window);
    return 0;
}
