#pragma once
#include <cstddef>
#include <vector>
#include <opencv2/core.hpp>

#include "rollcall/capture.h"
#include "rollcall/encoder.h"
#include "rollcall/face_types.h"
#include "rollcall/ledger.h"
#include "rollcall/matcher.h"

namespace rollcall {

enum class SessionState { Running, Stopped };

enum class StopReason {
    None,
    QuitKey,
    EndOfStream   // frame read failed
};

struct SessionStats {
    size_t frames = 0;
    size_t faces = 0;
    size_t recognised = 0;   // faces matched to a gallery identity
    size_t marked = 0;       // rows appended to the ledger
    StopReason reason = StopReason::None;
};

// Live matching loop: read a frame, identify every face against the
// gallery, write attendance for recognised faces, annotate and show the
// frame, stop on the quit key or when the source runs dry.
class AttendanceSession {
public:
    AttendanceSession(Gallery gallery, Encoder& encoder, const Matcher& matcher,
                      AttendanceLedger& ledger, float tolerance, int quit_key = 'q');

    // Blocks until stopped. The source and display are released on every
    // exit path, including exceptions.
    SessionStats run(FrameSource& source, Display& display);

    // Identify and annotate the faces of one BGR frame in place, updating
    // the ledger for recognised identities.
    std::vector<Identity> process_frame(cv::Mat& frame);

    SessionState state() const { return state_; }
    const SessionStats& stats() const { return stats_; }
    const Gallery& gallery() const { return gallery_; }

private:
    void log_summary() const;

    Gallery gallery_;
    std::vector<Encoding> known_;   // gallery encodings, built once
    Encoder& encoder_;
    const Matcher& matcher_;
    AttendanceLedger& ledger_;
    float tolerance_;
    int quit_key_;

    SessionState state_ = SessionState::Stopped;
    SessionStats stats_;
};

const char* to_string(StopReason reason);

} // namespace rollcall
