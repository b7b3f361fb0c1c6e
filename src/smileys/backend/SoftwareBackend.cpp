#include <smileys/backend/SoftwareBackend.hpp>

#include <algorithm>
#include <cstring>
#include <new>
#include <string>
#include <thread>
#include <utility>

namespace SM::Backend {

namespace {

constexpr std::size_t kBytesPerPixel = 4u;

auto clamp_non_negative(int value) -> int {
    return value < 0 ? 0 : value;
}

auto frame_bytes_for(int width, int height) -> std::size_t {
    return static_cast<std::size_t>(clamp_non_negative(width))
           * static_cast<std::size_t>(clamp_non_negative(height)) * kBytesPerPixel;
}

// Source-over with straight alpha, rounded to nearest.
auto blend_channel(std::uint8_t src, std::uint8_t dst, std::uint8_t src_alpha) -> std::uint8_t {
    auto const a = static_cast<unsigned>(src_alpha);
    auto const value = static_cast<unsigned>(src) * a + static_cast<unsigned>(dst) * (255u - a);
    return static_cast<std::uint8_t>((value + 127u) / 255u);
}

auto blend_alpha(std::uint8_t src_alpha, std::uint8_t dst_alpha) -> std::uint8_t {
    auto const a = static_cast<unsigned>(src_alpha);
    auto const rest = (static_cast<unsigned>(dst_alpha) * (255u - a) + 127u) / 255u;
    return static_cast<std::uint8_t>(std::min(255u, a + rest));
}

} // namespace

SoftwareSurface::SoftwareSurface(int width, int height)
    : width_(clamp_non_negative(width))
    , height_(clamp_non_negative(height))
    , pixels_(frame_bytes_for(width, height), 0u) {}

auto SoftwareSurface::row_stride_bytes() const -> std::size_t {
    return static_cast<std::size_t>(width_) * kBytesPerPixel;
}

void SoftwareSurface::resize(int width, int height) {
    width_ = clamp_non_negative(width);
    height_ = clamp_non_negative(height);
    pixels_.assign(frame_bytes_for(width_, height_), 0u);
}

auto SoftwareSurface::pixel(int x, int y) const -> Color {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return Colors::Transparent;
    }
    auto const offset = static_cast<std::size_t>(y) * row_stride_bytes()
                        + static_cast<std::size_t>(x) * kBytesPerPixel;
    return Color{pixels_[offset + 0], pixels_[offset + 1], pixels_[offset + 2], pixels_[offset + 3]};
}

void SoftwareSurface::fill_clipped(Rect const& rect, Color color) {
    auto const clipped = intersect(rect, Rect{0, 0, width_, height_});
    if (is_empty(clipped)) {
        return;
    }
    auto const stride = row_stride_bytes();
    for (int y = clipped.y; y < clipped.y + clipped.h; ++y) {
        auto* row = pixels_.data() + static_cast<std::size_t>(y) * stride;
        for (int x = clipped.x; x < clipped.x + clipped.w; ++x) {
            auto* px = row + static_cast<std::size_t>(x) * kBytesPerPixel;
            px[0] = color.r;
            px[1] = color.g;
            px[2] = color.b;
            px[3] = color.a;
        }
    }
}

auto SoftwareSurface::fill_rect(std::optional<Rect> rect, Color color) -> Expected<void> {
    fill_clipped(rect.value_or(Rect{0, 0, width_, height_}), color);
    return {};
}

auto SoftwareSurface::fill_rects(std::span<Rect const> rects, Color color) -> Expected<void> {
    for (auto const& rect : rects) {
        fill_clipped(rect, color);
    }
    return {};
}

auto SoftwareSurface::blit_to(Surface& dest, Rect dest_rect) const -> Expected<void> {
    auto* target = dynamic_cast<SoftwareSurface*>(&dest);
    if (target == nullptr) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "software surface cannot blit onto a foreign surface"});
    }
    if (target == this) {
        return std::unexpected(Error{Error::Code::SurfaceOperationFailed, "blit source and destination alias"});
    }

    Rect const placed{dest_rect.x, dest_rect.y, width_, height_};
    auto const clipped = intersect(placed, Rect{0, 0, target->width_, target->height_});
    if (is_empty(clipped)) {
        return {};
    }

    auto const src_stride = row_stride_bytes();
    auto const dst_stride = target->row_stride_bytes();
    for (int y = clipped.y; y < clipped.y + clipped.h; ++y) {
        auto const src_y = y - placed.y;
        auto const* src_row = pixels_.data() + static_cast<std::size_t>(src_y) * src_stride;
        auto* dst_row = target->pixels_.data() + static_cast<std::size_t>(y) * dst_stride;
        for (int x = clipped.x; x < clipped.x + clipped.w; ++x) {
            auto const src_x = x - placed.x;
            auto const* s = src_row + static_cast<std::size_t>(src_x) * kBytesPerPixel;
            auto* d = dst_row + static_cast<std::size_t>(x) * kBytesPerPixel;
            auto const alpha = s[3];
            if (alpha == 0) {
                continue;
            }
            if (alpha == 255) {
                std::memcpy(d, s, kBytesPerPixel);
                continue;
            }
            d[0] = blend_channel(s[0], d[0], alpha);
            d[1] = blend_channel(s[1], d[1], alpha);
            d[2] = blend_channel(s[2], d[2], alpha);
            d[3] = blend_alpha(alpha, d[3]);
        }
    }
    return {};
}

auto SoftwareSurface::set_rle_hint(bool enabled) -> Expected<void> {
    rle_hint_ = enabled;
    return {};
}

SoftwareBackend::SoftwareBackend()
    : SoftwareBackend(Options{}) {}

SoftwareBackend::SoftwareBackend(Options options)
    : options_(std::move(options))
    , window_(options_.width, options_.height)
    , random_(options_.seed)
    , started_at_(std::chrono::steady_clock::now()) {}

auto SoftwareBackend::make_surface(int width, int height) -> Expected<SurfacePtr> {
    if (width <= 0 || height <= 0) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "surface size must be positive, got " + std::to_string(width) + "x"
                                         + std::to_string(height)});
    }
    if (fail_allocations_) {
        return std::unexpected(Error{Error::Code::MemoryAllocationFailed, "software surface allocation refused"});
    }
    try {
        auto surface = std::make_unique<SoftwareSurface>(width, height);
        ++surfaces_allocated_;
        return SurfacePtr{std::move(surface)};
    } catch (std::bad_alloc const&) {
        return std::unexpected(Error{Error::Code::MemoryAllocationFailed,
                                     "out of memory allocating " + std::to_string(width) + "x"
                                         + std::to_string(height) + " surface"});
    }
}

auto SoftwareBackend::window_surface() -> Expected<Surface*> {
    return &window_;
}

auto SoftwareBackend::present() -> Expected<void> {
    ++present_count_;
    if (!options_.keep_last_frame) {
        return {};
    }
    if (!last_frame_) {
        last_frame_.emplace();
    }
    last_frame_->frame_index = present_count_;
    last_frame_->width = window_.width();
    last_frame_->height = window_.height();
    last_frame_->pixels.assign(window_.pixels().begin(), window_.pixels().end());
    return {};
}

auto SoftwareBackend::poll_event(std::chrono::milliseconds timeout) -> std::optional<Event> {
    if (!events_.empty()) {
        auto event = events_.front();
        events_.pop_front();
        return event;
    }
    if (timeout.count() > 0) {
        if (options_.clock == ClockMode::Manual) {
            manual_now_ms_ += static_cast<std::uint64_t>(timeout.count());
        } else {
            std::this_thread::sleep_for(timeout);
        }
    }
    return std::nullopt;
}

auto SoftwareBackend::now_ms() const -> std::uint64_t {
    if (options_.clock == ClockMode::Manual) {
        return manual_now_ms_;
    }
    auto const elapsed = std::chrono::steady_clock::now() - started_at_;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

auto SoftwareBackend::random_uniform(int n) -> int {
    return random_.next(n);
}

void SoftwareBackend::queue_event(Event event) {
    events_.push_back(event);
}

void SoftwareBackend::set_time_ms(std::uint64_t now) {
    manual_now_ms_ = now;
}

void SoftwareBackend::advance_time(std::chrono::milliseconds delta) {
    if (delta.count() > 0) {
        manual_now_ms_ += static_cast<std::uint64_t>(delta.count());
    }
}

void SoftwareBackend::resize_window(int width, int height) {
    window_.resize(width, height);
    queue_event(Event::window());
}

} // namespace SM::Backend
