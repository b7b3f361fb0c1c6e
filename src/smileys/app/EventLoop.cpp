#include <smileys/app/EventLoop.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace SM::App {

using Backend::Event;
using Backend::EventType;
using Backend::Key;

namespace {

[[maybe_unused]] auto describe_event(Event const& event) -> std::string {
    std::string text{Backend::to_string(event.type)};
    switch (event.type) {
    case EventType::PointerPress:
        text += " at " + std::to_string(event.x) + "," + std::to_string(event.y);
        break;
    case EventType::KeyPress:
        text += " ";
        text += Backend::to_string(event.key);
        break;
    default:
        break;
    }
    return text;
}

auto dispatch_key(Key key, Scene::SmileyScene& scene, LoopOptions const& options) -> Expected<DispatchAction> {
    auto& mover = scene.secondary.entity();
    switch (key) {
    case Key::Escape:
    case Key::Q:
        return DispatchAction::Quit;
    case Key::Space:
        if (auto primary = scene.primary.randomize_color(); !primary) {
            return std::unexpected(primary.error());
        }
        if (auto secondary = scene.secondary.randomize_color(); !secondary) {
            return std::unexpected(secondary.error());
        }
        return DispatchAction::Redraw;
    case Key::Left:
        mover.translate(-options.move_step, 0);
        return DispatchAction::Redraw;
    case Key::Right:
        mover.translate(options.move_step, 0);
        return DispatchAction::Redraw;
    case Key::Up:
        mover.translate(0, -options.move_step);
        return DispatchAction::Redraw;
    case Key::Down:
        mover.translate(0, options.move_step);
        return DispatchAction::Redraw;
    case Key::Unknown:
        break;
    }
    return DispatchAction::None;
}

} // namespace

auto dispatch_event(Event const& event, Scene::SmileyScene& scene, LoopOptions const& options)
    -> Expected<DispatchAction> {
    switch (event.type) {
    case EventType::Window:
        return DispatchAction::Redraw;
    case EventType::Quit:
        return DispatchAction::Quit;
    case EventType::PointerPress:
        scene.primary.entity().set_position(event.x, event.y);
        return DispatchAction::Redraw;
    case EventType::KeyPress:
        return dispatch_key(event.key, scene, options);
    case EventType::Other:
        break;
    }
    return DispatchAction::None;
}

EventLoop::EventLoop(Backend::GraphicsBackend& backend, Scene::SmileyScene& scene, LoopOptions options)
    : backend_(backend)
    , scene_(scene)
    , options_(std::move(options)) {
    state_.last_tick_ms = backend_.now_ms();
}

auto EventLoop::finished() const -> bool {
    if (state_.done) {
        return true;
    }
    return options_.max_frames > 0 && renderer_.frames_rendered() >= options_.max_frames;
}

auto EventLoop::redraw() -> Expected<void> {
    return renderer_.render(backend_, scene_);
}

auto EventLoop::run() -> Expected<void> {
    if (auto first = redraw(); !first) {
        return first;
    }
    while (!finished()) {
        if (auto stepped = step(); !stepped) {
            return stepped;
        }
    }
    if (options_.verbose) {
        sm_log("loop finished after " + std::to_string(renderer_.frames_rendered()) + " frames, "
                   + std::to_string(state_.ticks) + " ticks",
               "Loop");
    }
    return {};
}

auto EventLoop::step() -> Expected<void> {
    auto const current_time = backend_.now_ms();
    auto event = backend_.poll_event(options_.poll_timeout);

    if (auto ticked = check_tick(current_time); !ticked) {
        return std::unexpected(ticked.error());
    }
    if (!event) {
        return {};
    }
    return handle_event(*event);
}

auto EventLoop::check_tick(std::uint64_t now_ms) -> Expected<bool> {
    if (now_ms < state_.last_tick_ms) {
        return false;
    }
    auto const elapsed = now_ms - state_.last_tick_ms;
    if (elapsed < static_cast<std::uint64_t>(options_.tick_interval.count())) {
        return false;
    }

    if (auto drifted = scene_.primary.mutate_color(options_.primary_drift); !drifted) {
        return std::unexpected(drifted.error());
    }
    if (auto drifted = scene_.secondary.mutate_color(options_.secondary_drift); !drifted) {
        return std::unexpected(drifted.error());
    }
    if (auto drawn = redraw(); !drawn) {
        return std::unexpected(drawn.error());
    }
    state_.last_tick_ms = now_ms;
    ++state_.ticks;
    if (options_.verbose) {
        sm_log("tick " + std::to_string(state_.ticks) + " at " + std::to_string(now_ms) + "ms", "Tick");
    }
    return true;
}

auto EventLoop::handle_event(Event const& event) -> Expected<void> {
    if (options_.verbose) {
        sm_log("event " + describe_event(event), "Event");
    }
    auto action = dispatch_event(event, scene_, options_);
    if (!action) {
        return std::unexpected(action.error());
    }
    ++state_.events_dispatched;
    switch (*action) {
    case DispatchAction::Redraw:
        return redraw();
    case DispatchAction::Quit:
        state_.done = true;
        break;
    case DispatchAction::None:
        break;
    }
    return {};
}

} // namespace SM::App
