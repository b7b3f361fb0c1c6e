#pragma once

#include <smileys/backend/Surface.hpp>
#include <smileys/core/Error.hpp>
#include <smileys/core/Types.hpp>

namespace SM::Scene {

// A drawable surface positioned by its center.
class SceneEntity {
public:
    // `surface` must not be null.
    SceneEntity(Backend::SurfacePtr surface, Point position);

    SceneEntity(SceneEntity&&) noexcept            = default;
    SceneEntity& operator=(SceneEntity&&) noexcept = default;

    // (x - w/2, y - h/2, w, h) for the current surface size.
    [[nodiscard]] auto bounding_rect() const -> Rect;

    auto draw(Backend::Surface& dest) const -> Expected<void>;

    void set_position(int x, int y) { position_ = Point{x, y}; }
    void translate(int dx, int dy) {
        position_.x += dx;
        position_.y += dy;
    }

    // Releases the previous surface. Null surfaces are ignored.
    void replace_surface(Backend::SurfacePtr surface);

    [[nodiscard]] auto position() const -> Point { return position_; }
    [[nodiscard]] auto surface() const -> Backend::Surface const& { return *surface_; }

private:
    Backend::SurfacePtr surface_;
    Point position_{};
};

} // namespace SM::Scene
