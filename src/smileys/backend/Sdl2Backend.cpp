#include <smileys/backend/Sdl2Backend.hpp>

#include <SDL.h>

#include <string>
#include <utility>
#include <vector>

namespace SM::Backend {

namespace {

auto sdl_error(Error::Code code, char const* context) -> Error {
    std::string message{context};
    if (auto const* detail = SDL_GetError(); detail != nullptr && *detail != '\0') {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

auto to_sdl_rect(Rect const& rect) -> SDL_Rect {
    return SDL_Rect{rect.x, rect.y, rect.w, rect.h};
}

auto translate_key(SDL_Keycode sym) -> Key {
    switch (sym) {
    case SDLK_ESCAPE:
        return Key::Escape;
    case SDLK_q:
        return Key::Q;
    case SDLK_SPACE:
        return Key::Space;
    case SDLK_LEFT:
        return Key::Left;
    case SDLK_RIGHT:
        return Key::Right;
    case SDLK_UP:
        return Key::Up;
    case SDLK_DOWN:
        return Key::Down;
    default:
        return Key::Unknown;
    }
}

auto translate_event(SDL_Event const& event) -> Event {
    switch (event.type) {
    case SDL_WINDOWEVENT:
        return Event::window();
    case SDL_QUIT:
        return Event::quit();
    case SDL_MOUSEBUTTONDOWN:
        return Event::pointer_press(event.button.x, event.button.y);
    case SDL_KEYDOWN:
        return Event::key_press(translate_key(event.key.keysym.sym));
    default:
        return Event{};
    }
}

} // namespace

void Sdl2Surface::Deleter::operator()(SDL_Surface* surface) const {
    SDL_FreeSurface(surface);
}

Sdl2Surface::Sdl2Surface(Owned surface)
    : owned_(std::move(surface))
    , raw_(owned_.get()) {}

Sdl2Surface::Sdl2Surface(SDL_Surface* borrowed)
    : raw_(borrowed) {}

void Sdl2Surface::rebind(SDL_Surface* borrowed) {
    owned_.reset();
    raw_ = borrowed;
}

auto Sdl2Surface::width() const -> int {
    return raw_ != nullptr ? raw_->w : 0;
}

auto Sdl2Surface::height() const -> int {
    return raw_ != nullptr ? raw_->h : 0;
}

auto Sdl2Surface::fill_rect(std::optional<Rect> rect, Color color) -> Expected<void> {
    if (raw_ == nullptr) {
        return std::unexpected(Error{Error::Code::SurfaceOperationFailed, "fill on unbound surface"});
    }
    auto const mapped = SDL_MapRGBA(raw_->format, color.r, color.g, color.b, color.a);
    SDL_Rect sdl_rect{};
    if (rect) {
        sdl_rect = to_sdl_rect(*rect);
    }
    if (SDL_FillRect(raw_, rect ? &sdl_rect : nullptr, mapped) != 0) {
        return std::unexpected(sdl_error(Error::Code::SurfaceOperationFailed, "SDL_FillRect"));
    }
    return {};
}

auto Sdl2Surface::fill_rects(std::span<Rect const> rects, Color color) -> Expected<void> {
    if (raw_ == nullptr) {
        return std::unexpected(Error{Error::Code::SurfaceOperationFailed, "fill on unbound surface"});
    }
    if (rects.empty()) {
        return {};
    }
    std::vector<SDL_Rect> sdl_rects;
    sdl_rects.reserve(rects.size());
    for (auto const& rect : rects) {
        sdl_rects.push_back(to_sdl_rect(rect));
    }
    auto const mapped = SDL_MapRGBA(raw_->format, color.r, color.g, color.b, color.a);
    if (SDL_FillRects(raw_, sdl_rects.data(), static_cast<int>(sdl_rects.size()), mapped) != 0) {
        return std::unexpected(sdl_error(Error::Code::SurfaceOperationFailed, "SDL_FillRects"));
    }
    return {};
}

auto Sdl2Surface::blit_to(Surface& dest, Rect dest_rect) const -> Expected<void> {
    auto* target = dynamic_cast<Sdl2Surface*>(&dest);
    if (target == nullptr) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "SDL surface cannot blit onto a foreign surface"});
    }
    if (raw_ == nullptr || target->raw_ == nullptr) {
        return std::unexpected(Error{Error::Code::SurfaceOperationFailed, "blit with unbound surface"});
    }
    // SDL_BlitSurface clips the destination rect in place.
    SDL_Rect placed{dest_rect.x, dest_rect.y, raw_->w, raw_->h};
    if (SDL_BlitSurface(raw_, nullptr, target->raw_, &placed) != 0) {
        return std::unexpected(sdl_error(Error::Code::SurfaceOperationFailed, "SDL_BlitSurface"));
    }
    return {};
}

auto Sdl2Surface::set_rle_hint(bool enabled) -> Expected<void> {
    if (raw_ == nullptr) {
        return std::unexpected(Error{Error::Code::SurfaceOperationFailed, "RLE hint on unbound surface"});
    }
    if (SDL_SetSurfaceRLE(raw_, enabled ? 1 : 0) != 0) {
        return std::unexpected(sdl_error(Error::Code::SurfaceOperationFailed, "SDL_SetSurfaceRLE"));
    }
    return {};
}

auto Sdl2Backend::Create(WindowConfig const& config, std::uint64_t seed) -> Expected<std::unique_ptr<Sdl2Backend>> {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        return std::unexpected(sdl_error(Error::Code::BackendInitFailed, "SDL_Init"));
    }

    auto* window = SDL_CreateWindow(config.title.c_str(),
                                    config.x,
                                    config.y,
                                    config.width,
                                    config.height,
                                    SDL_WINDOW_RESIZABLE);
    if (window == nullptr) {
        auto error = sdl_error(Error::Code::WindowCreationFailed, "SDL_CreateWindow");
        SDL_Quit();
        return std::unexpected(std::move(error));
    }
    SDL_SetWindowMinimumSize(window, config.min_width, config.min_height);
    SDL_SetWindowMaximumSize(window, config.max_width, config.max_height);

    return std::unique_ptr<Sdl2Backend>(new Sdl2Backend(window, seed));
}

Sdl2Backend::Sdl2Backend(SDL_Window* window, std::uint64_t seed)
    : window_(window)
    , random_(seed) {}

Sdl2Backend::~Sdl2Backend() {
    window_surface_.rebind(nullptr);
    if (window_ != nullptr) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    SDL_Quit();
}

auto Sdl2Backend::make_surface(int width, int height) -> Expected<SurfacePtr> {
    Sdl2Surface::Owned raw{SDL_CreateRGBSurfaceWithFormat(0, width, height, 32, SDL_PIXELFORMAT_RGBA32)};
    if (!raw) {
        return std::unexpected(sdl_error(Error::Code::MemoryAllocationFailed, "SDL_CreateRGBSurfaceWithFormat"));
    }
    return SurfacePtr{std::make_unique<Sdl2Surface>(std::move(raw))};
}

auto Sdl2Backend::window_surface() -> Expected<Surface*> {
    // The window surface is recreated by SDL after a resize, so fetch it every time.
    auto* surface = SDL_GetWindowSurface(window_);
    if (surface == nullptr) {
        return std::unexpected(sdl_error(Error::Code::SurfaceOperationFailed, "SDL_GetWindowSurface"));
    }
    window_surface_.rebind(surface);
    return &window_surface_;
}

auto Sdl2Backend::present() -> Expected<void> {
    if (SDL_UpdateWindowSurface(window_) != 0) {
        return std::unexpected(sdl_error(Error::Code::PresentFailed, "SDL_UpdateWindowSurface"));
    }
    return {};
}

auto Sdl2Backend::poll_event(std::chrono::milliseconds timeout) -> std::optional<Event> {
    SDL_Event event{};
    if (SDL_WaitEventTimeout(&event, static_cast<int>(timeout.count())) == 0) {
        return std::nullopt;
    }
    return translate_event(event);
}

auto Sdl2Backend::now_ms() const -> std::uint64_t {
    return static_cast<std::uint64_t>(SDL_GetTicks64());
}

auto Sdl2Backend::random_uniform(int n) -> int {
    return random_.next(n);
}

} // namespace SM::Backend
