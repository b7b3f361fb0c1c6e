#pragma once

#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/backend/UniformRandom.hpp>

#include <memory>

struct SDL_Surface;
struct SDL_Window;

namespace SM::Backend {

class Sdl2Surface final : public Surface {
public:
    struct Deleter {
        void operator()(SDL_Surface* surface) const;
    };
    using Owned = std::unique_ptr<SDL_Surface, Deleter>;

    // Takes ownership; the surface is freed when this object goes away.
    explicit Sdl2Surface(Owned surface);
    // Borrows; used for the window surface, which SDL owns.
    explicit Sdl2Surface(SDL_Surface* borrowed);

    [[nodiscard]] auto width() const -> int override;
    [[nodiscard]] auto height() const -> int override;

    auto fill_rect(std::optional<Rect> rect, Color color) -> Expected<void> override;
    auto fill_rects(std::span<Rect const> rects, Color color) -> Expected<void> override;
    auto blit_to(Surface& dest, Rect dest_rect) const -> Expected<void> override;
    auto set_rle_hint(bool enabled) -> Expected<void> override;

    [[nodiscard]] auto raw() const -> SDL_Surface* { return raw_; }
    void rebind(SDL_Surface* borrowed);

private:
    Owned owned_;
    SDL_Surface* raw_ = nullptr;
};

class Sdl2Backend final : public GraphicsBackend {
public:
    static auto Create(WindowConfig const& config, std::uint64_t seed) -> Expected<std::unique_ptr<Sdl2Backend>>;

    ~Sdl2Backend() override;

    Sdl2Backend(Sdl2Backend const&)            = delete;
    Sdl2Backend& operator=(Sdl2Backend const&) = delete;

    [[nodiscard]] auto make_surface(int width, int height) -> Expected<SurfacePtr> override;
    [[nodiscard]] auto window_surface() -> Expected<Surface*> override;
    auto present() -> Expected<void> override;
    [[nodiscard]] auto poll_event(std::chrono::milliseconds timeout) -> std::optional<Event> override;
    [[nodiscard]] auto now_ms() const -> std::uint64_t override;
    [[nodiscard]] auto random_uniform(int n) -> int override;

private:
    Sdl2Backend(SDL_Window* window, std::uint64_t seed);

    SDL_Window* window_ = nullptr;
    Sdl2Surface window_surface_{static_cast<SDL_Surface*>(nullptr)};
    UniformRandom random_;
};

} // namespace SM::Backend
