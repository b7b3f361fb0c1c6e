#include <smileys/app/EventLoop.hpp>
#include <smileys/app/FrameCapture.hpp>
#include <smileys/app/Options.hpp>
#include <smileys/backend/SoftwareBackend.hpp>
#include <smileys/scene/Scene.hpp>

#if defined(SMILEYS_ENABLE_SDL2)
#include <smileys/backend/Sdl2Backend.hpp>
#endif

#include "log/TaggedLogger.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace SM;

namespace {

constexpr char const* kProgram = "smileys_example";

void report_error(char const* context, Error const& error) {
    std::cerr << kProgram << ": " << context << " failed";
    if (error.message.has_value()) {
        std::cerr << ": " << *error.message;
    } else {
        std::cerr << " (" << errorCodeToString(error.code) << ')';
    }
    std::cerr << '\n';
}

auto run_scene(Backend::GraphicsBackend& backend, App::AppOptions const& options) -> Expected<std::uint64_t> {
    auto scene = Scene::create_scene(backend, options.layout);
    if (!scene) {
        return std::unexpected(scene.error());
    }
    App::EventLoop loop{backend, *scene, App::effective_loop_options(options)};
    if (auto ran = loop.run(); !ran) {
        return std::unexpected(ran.error());
    }
    return loop.renderer().frames_rendered();
}

auto run_headless(App::AppOptions const& options) -> int {
    Expected<std::uint64_t> outcome = 0;
    std::optional<Error> capture_error;
    {
        Backend::SoftwareBackend backend{Backend::SoftwareBackend::Options{
            .width = options.window.width,
            .height = options.window.height,
            .seed = options.seed,
            .clock = Backend::SoftwareBackend::ClockMode::Steady,
            .keep_last_frame = options.frame_output_path.has_value(),
        }};
        outcome = run_scene(backend, options);
        if (outcome && options.frame_output_path && backend.last_frame()) {
            if (auto written = App::write_frame_png(*backend.last_frame(), *options.frame_output_path); !written) {
                capture_error = written.error();
            }
        }
    }
    if (!outcome) {
        report_error("headless run", outcome.error());
        return 1;
    }
    if (capture_error) {
        report_error("frame capture", *capture_error);
        return 1;
    }
    std::cout << kProgram << ": rendered " << *outcome << " frames headless\n";
    if (options.frame_output_path) {
        std::cout << kProgram << ": saved frame capture to " << options.frame_output_path->string() << '\n';
    }
    return 0;
}

auto run_windowed(App::AppOptions const& options) -> int {
#if defined(SMILEYS_ENABLE_SDL2)
    if (options.frame_output_path) {
        std::cerr << kProgram << ": --write-frame is only supported with --headless; ignoring\n";
    }
    Expected<std::uint64_t> outcome = 0;
    {
        auto backend = Backend::Sdl2Backend::Create(options.window, options.seed);
        if (!backend) {
            report_error("backend initialization", backend.error());
            return 1;
        }
        outcome = run_scene(**backend, options);
    }
    if (!outcome) {
        report_error("event loop", outcome.error());
        return 1;
    }
    return 0;
#else
    (void)options;
    std::cerr << kProgram << ": this build has no SDL2 window backend; rerun with --headless.\n";
    return 1;
#endif
}

} // namespace

int main(int argc, char** argv) {
    std::vector<char const*> args(argv, argv + argc);
    auto options = App::parse_options(args);
    if (!options) {
        report_error("option parsing", options.error());
        std::cerr << "Use --help to see available options.\n";
        return 1;
    }
    if (options->show_help) {
        std::cout << App::usage_text(kProgram);
        return 0;
    }

#ifdef SMILEYS_LOG_DEBUG
    SM::set_thread_name("Main");
    if (options->verbose) {
        SM::set_logging_enabled(true);
    }
#endif
    sm_log("starting " + std::string{options->headless ? "headless" : "windowed"} + " run, seed "
               + std::to_string(options->seed),
           "App");

    try {
        return options->headless ? run_headless(*options) : run_windowed(*options);
    } catch (std::exception const& ex) {
        std::cerr << kProgram << ": fatal: " << ex.what() << '\n';
        return 1;
    }
}
