#pragma once

#include <smileys/core/Error.hpp>
#include <smileys/core/Types.hpp>

#include <memory>
#include <optional>
#include <span>

namespace SM::Backend {

// Backend-owned pixel buffer. Fills replace pixels (alpha included); blits
// composite the source over the destination.
class Surface {
public:
    virtual ~Surface() = default;

    Surface(Surface const&)            = delete;
    Surface& operator=(Surface const&) = delete;

    [[nodiscard]] virtual auto width() const -> int  = 0;
    [[nodiscard]] virtual auto height() const -> int = 0;

    // Fills `rect`, or the whole surface when no rect is given.
    virtual auto fill_rect(std::optional<Rect> rect, Color color) -> Expected<void> = 0;
    virtual auto fill_rects(std::span<Rect const> rects, Color color) -> Expected<void> = 0;

    // Composites this whole surface onto `dest` with its top-left at dest_rect.x/y.
    // Fails with TypeMismatch if `dest` belongs to a different backend.
    virtual auto blit_to(Surface& dest, Rect dest_rect) const -> Expected<void> = 0;

    // Hint that the surface will be blitted often and rarely modified.
    virtual auto set_rle_hint(bool enabled) -> Expected<void> = 0;

protected:
    Surface() = default;
};

using SurfacePtr = std::unique_ptr<Surface>;

} // namespace SM::Backend
