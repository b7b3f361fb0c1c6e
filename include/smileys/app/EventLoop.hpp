#pragma once

#include <smileys/backend/Event.hpp>
#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/core/Error.hpp>
#include <smileys/scene/Scene.hpp>
#include <smileys/scene/SceneRenderer.hpp>

#include <chrono>
#include <cstdint>

namespace SM::App {

struct LoopOptions {
    std::chrono::milliseconds poll_timeout{10};
    std::chrono::milliseconds tick_interval{100};
    int primary_drift = 30;
    int secondary_drift = 20;
    int move_step = 20;
    bool verbose = false;
    // Stop once this many frames were presented; 0 runs until quit.
    std::uint64_t max_frames = 0;
};

struct LoopState {
    bool done = false;
    std::uint64_t last_tick_ms = 0;
    std::uint64_t ticks = 0;
    std::uint64_t events_dispatched = 0;
};

enum class DispatchAction {
    None,
    Redraw,
    Quit,
};

// Maps one input event onto the scene. Returns what the loop should do next;
// scene mutations have already been applied.
[[nodiscard]] auto dispatch_event(Backend::Event const& event, Scene::SmileyScene& scene, LoopOptions const& options)
    -> Expected<DispatchAction>;

class EventLoop {
public:
    EventLoop(Backend::GraphicsBackend& backend, Scene::SmileyScene& scene, LoopOptions options = {});

    // Renders the first frame, then iterates until done.
    auto run() -> Expected<void>;

    // One iteration: sample the clock, wait for an event, run the tick check,
    // dispatch the event.
    auto step() -> Expected<void>;

    // Drifts both smiley colors and redraws when a full tick interval has
    // elapsed since the last tick. Returns whether a tick happened.
    auto check_tick(std::uint64_t now_ms) -> Expected<bool>;

    auto handle_event(Backend::Event const& event) -> Expected<void>;
    auto redraw() -> Expected<void>;

    [[nodiscard]] auto state() const -> LoopState const& { return state_; }
    [[nodiscard]] auto options() const -> LoopOptions const& { return options_; }
    [[nodiscard]] auto renderer() const -> Scene::SceneRenderer const& { return renderer_; }
    [[nodiscard]] auto finished() const -> bool;

private:
    Backend::GraphicsBackend& backend_;
    Scene::SmileyScene& scene_;
    LoopOptions options_;
    LoopState state_{};
    Scene::SceneRenderer renderer_{};
};

} // namespace SM::App
