#include "rollcall/session.h"
#include "rollcall/errors.h"
#include "rollcall/overlay.h"

#include <algorithm>
#include <set>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

using namespace rollcall;

const char* rollcall::to_string(StopReason reason) {
    switch (reason) {
    case StopReason::None:        return "none";
    case StopReason::QuitKey:     return "quit key";
    case StopReason::EndOfStream: return "end of stream";
    }
    return "unknown";
}

AttendanceSession::AttendanceSession(Gallery gallery, Encoder& encoder, const Matcher& matcher,
                                     AttendanceLedger& ledger, float tolerance, int quit_key)
    : gallery_(std::move(gallery)),
      known_(gallery_encodings(gallery_)),
      encoder_(encoder),
      matcher_(matcher),
      ledger_(ledger),
      tolerance_(tolerance),
      quit_key_(quit_key) {}

/* ---------------- one frame ---------------- */

std::vector<Identity> AttendanceSession::process_frame(cv::Mat& frame) {
    std::vector<Identity> out;
    if (frame.empty())
        return out;

    cv::Mat rgb;
    if (frame.channels() == 1)
        cv::cvtColor(frame, rgb, cv::COLOR_GRAY2RGB);
    else
        cv::cvtColor(frame, rgb, cv::COLOR_BGR2RGB);

    const std::vector<FaceBox> boxes = encoder_.detect_boxes(rgb);
    const std::vector<Encoding> encodings = encoder_.encode_faces(rgb, boxes);

    const size_t n = std::min(boxes.size(), encodings.size());
    out.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        Identity id = identify(gallery_, known_, matcher_, encodings[i], tolerance_);
        if (id.matched) {
            ++stats_.recognised;
            if (ledger_.mark_attendance(id.name))
                ++stats_.marked;
        }
        spdlog::debug("face {} at ({},{}) -> {} (distance {:.3f})",
                      i, boxes[i].left, boxes[i].top, id.name, id.distance);

        draw_identity(frame, boxes[i], id.name);
        out.push_back(std::move(id));
    }
    stats_.faces += n;
    return out;
}

/* ---------------- loop ---------------- */

namespace {

// releases capture and display however the loop ends
class LoopGuard {
public:
    LoopGuard(FrameSource& source, Display& display, SessionState& state)
        : source_(source), display_(display), state_(state) {}
    ~LoopGuard() {
        state_ = SessionState::Stopped;
        source_.release();
        display_.close();
    }

private:
    FrameSource& source_;
    Display& display_;
    SessionState& state_;
};

} // namespace

SessionStats AttendanceSession::run(FrameSource& source, Display& display) {
    stats_ = SessionStats{};
    {
        LoopGuard guard(source, display, state_);
        state_ = SessionState::Running;

        spdlog::info("Starting camera feed... press '{}' to quit.", static_cast<char>(quit_key_));

        while (state_ == SessionState::Running) {
            cv::Mat frame;
            if (!source.read(frame)) {
                spdlog::warn("Could not read frame from camera.");
                stats_.reason = StopReason::EndOfStream;
                break;
            }
            ++stats_.frames;

            process_frame(frame);
            display.show(frame);

            int key = display.poll_key(1);
            if (key >= 0 && (key & 0xFF) == quit_key_) {
                stats_.reason = StopReason::QuitKey;
                break;
            }
        }
    }

    spdlog::info("Session stopped ({}): {} frame(s), {} face(s), {} recognised, {} marked",
                 to_string(stats_.reason), stats_.frames, stats_.faces,
                 stats_.recognised, stats_.marked);
    log_summary();
    return stats_;
}

/* ---------------- summary ---------------- */

void AttendanceSession::log_summary() const {
    std::set<std::string> known;
    for (const auto& face : gallery_)
        known.insert(face.name);

    std::set<std::string> present;
    try {
        present = ledger_.names_on(ledger_.today());
    } catch (const RuntimeError& e) {
        spdlog::warn("Attendance summary unavailable: {}", e.what());
        return;
    }

    std::vector<std::string> absent;
    size_t here = 0;
    for (const auto& name : known) {
        if (present.count(name))
            ++here;
        else
            absent.push_back(name);
    }

    spdlog::info("Present today: {} of {} known", here, known.size());
    if (!absent.empty()) {
        std::string list;
        for (const auto& name : absent) {
            if (!list.empty()) list += ", ";
            list += name;
        }
        spdlog::info("Absent: {}", list);
    }
}
