#include <opencv2/core.hpp>
#include <opencv2/core/ocl.hpp>

#include <iostream>
#include <spdlog/spdlog.h>

#include "rollcall/app.h"
#include "rollcall/config.h"
#include "rollcall/errors.h"

int main(int argc, char** argv) {
    // single-threaded capture loop; keep OpenCV off OpenCL
    cv::ocl::setUseOpenCL(false);
    cv::setNumThreads(1);

    spdlog::set_level(spdlog::level::info);

    try {
        auto cfg = rollcall::parse_command_line(argc, argv, std::cout);
        if (!cfg)
            return 0;

        rollcall::validate(*cfg);
        spdlog::set_level(spdlog::level::from_str(cfg->log_level));

        rollcall::App app(*cfg);
        return app.run();
    } catch (const rollcall::UsageError& e) {
        std::cerr << e.what() << "\n";
        return rollcall::kExitUsage;
    } catch (const rollcall::Error& e) {
        spdlog::critical("{} error: {}", rollcall::to_string(e.kind()), e.what());
        return rollcall::exit_code(e.kind());
    } catch (const std::exception& e) {
        spdlog::critical("fatal: {}", e.what());
        return 1;
    }
}
