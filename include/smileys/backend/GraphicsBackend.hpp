#pragma once

#include <smileys/backend/Event.hpp>
#include <smileys/backend/Surface.hpp>
#include <smileys/core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace SM::Backend {

struct WindowConfig {
    std::string title = "Smileys";
    int x = 100;
    int y = 100;
    int width = 640;
    int height = 480;
    int min_width = 320;
    int min_height = 240;
    int max_width = 1920;
    int max_height = 1080;
};

// Everything the scene and loop need from a graphics library: surfaces, a
// window surface to draw into, presentation, input, time and randomness.
class GraphicsBackend {
public:
    virtual ~GraphicsBackend() = default;

    [[nodiscard]] virtual auto make_surface(int width, int height) -> Expected<SurfacePtr> = 0;

    // Borrowed; valid until the next call or until the window is resized.
    [[nodiscard]] virtual auto window_surface() -> Expected<Surface*> = 0;
    virtual auto present() -> Expected<void> = 0;

    // Waits up to `timeout` for one event.
    [[nodiscard]] virtual auto poll_event(std::chrono::milliseconds timeout) -> std::optional<Event> = 0;

    // Monotonic milliseconds since the backend was created.
    [[nodiscard]] virtual auto now_ms() const -> std::uint64_t = 0;

    // Uniform integer in [0, n); 0 when n <= 0.
    [[nodiscard]] virtual auto random_uniform(int n) -> int = 0;
};

} // namespace SM::Backend
