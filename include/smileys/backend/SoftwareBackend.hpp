#pragma once

#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/backend/UniformRandom.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <vector>

namespace SM::Backend {

// RGBA8, straight alpha, tightly packed rows.
class SoftwareSurface final : public Surface {
public:
    SoftwareSurface(int width, int height);

    [[nodiscard]] auto width() const -> int override { return width_; }
    [[nodiscard]] auto height() const -> int override { return height_; }

    auto fill_rect(std::optional<Rect> rect, Color color) -> Expected<void> override;
    auto fill_rects(std::span<Rect const> rects, Color color) -> Expected<void> override;
    auto blit_to(Surface& dest, Rect dest_rect) const -> Expected<void> override;
    auto set_rle_hint(bool enabled) -> Expected<void> override;

    [[nodiscard]] auto rle_hint() const -> bool { return rle_hint_; }
    [[nodiscard]] auto pixel(int x, int y) const -> Color;
    [[nodiscard]] auto pixels() const -> std::span<std::uint8_t const> { return pixels_; }
    [[nodiscard]] auto row_stride_bytes() const -> std::size_t;

    // Reallocates to the new size; contents become transparent.
    void resize(int width, int height);

private:
    void fill_clipped(Rect const& rect, Color color);

    int width_ = 0;
    int height_ = 0;
    bool rle_hint_ = false;
    std::vector<std::uint8_t> pixels_;
};

struct SoftwareFrame {
    std::uint64_t frame_index = 0;
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;
};

// In-memory backend for headless runs and tests. Events are scripted through
// queue_event(); in Manual clock mode an idle poll advances time by its timeout.
class SoftwareBackend final : public GraphicsBackend {
public:
    enum class ClockMode {
        Manual,
        Steady,
    };

    struct Options {
        int width = 640;
        int height = 480;
        std::uint64_t seed = 0;
        ClockMode clock = ClockMode::Manual;
        bool keep_last_frame = true;
    };

    SoftwareBackend();
    explicit SoftwareBackend(Options options);

    [[nodiscard]] auto make_surface(int width, int height) -> Expected<SurfacePtr> override;
    [[nodiscard]] auto window_surface() -> Expected<Surface*> override;
    auto present() -> Expected<void> override;
    [[nodiscard]] auto poll_event(std::chrono::milliseconds timeout) -> std::optional<Event> override;
    [[nodiscard]] auto now_ms() const -> std::uint64_t override;
    [[nodiscard]] auto random_uniform(int n) -> int override;

    void queue_event(Event event);
    [[nodiscard]] auto pending_events() const -> std::size_t { return events_.size(); }

    void set_time_ms(std::uint64_t now);
    void advance_time(std::chrono::milliseconds delta);

    // Resizes the window surface and queues the matching Window event.
    void resize_window(int width, int height);

    // Makes every make_surface() call fail until cleared.
    void set_fail_allocations(bool fail) { fail_allocations_ = fail; }

    [[nodiscard]] auto window() -> SoftwareSurface& { return window_; }
    [[nodiscard]] auto window() const -> SoftwareSurface const& { return window_; }
    [[nodiscard]] auto present_count() const -> std::uint64_t { return present_count_; }
    [[nodiscard]] auto surfaces_allocated() const -> std::uint64_t { return surfaces_allocated_; }
    [[nodiscard]] auto last_frame() const -> std::optional<SoftwareFrame> const& { return last_frame_; }

private:
    Options options_{};
    SoftwareSurface window_;
    UniformRandom random_;
    std::deque<Event> events_;
    std::chrono::steady_clock::time_point started_at_;
    std::uint64_t manual_now_ms_ = 0;
    std::uint64_t present_count_ = 0;
    std::uint64_t surfaces_allocated_ = 0;
    bool fail_allocations_ = false;
    std::optional<SoftwareFrame> last_frame_;
};

} // namespace SM::Backend
