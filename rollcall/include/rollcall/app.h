#pragma once
#include "rollcall/config.h"

namespace rollcall {

// Wires the configured backend, gallery, ledger, camera and window into one
// attendance session.
class App {
public:
    explicit App(const AppConfig& cfg);

    // Runs until the quit key or end of stream; returns the process status.
    // Startup failures propagate as rollcall::Error.
    int run();

private:
    AppConfig cfg_;
};

} // namespace rollcall
