#include <smileys/scene/SceneEntity.hpp>

#include <stdexcept>
#include <utility>

namespace SM::Scene {

SceneEntity::SceneEntity(Backend::SurfacePtr surface, Point position)
    : surface_(std::move(surface))
    , position_(position) {
    if (!surface_) {
        throw std::invalid_argument{"SceneEntity requires a surface"};
    }
}

auto SceneEntity::bounding_rect() const -> Rect {
    auto const w = surface_->width();
    auto const h = surface_->height();
    return Rect{position_.x - w / 2, position_.y - h / 2, w, h};
}

auto SceneEntity::draw(Backend::Surface& dest) const -> Expected<void> {
    return surface_->blit_to(dest, bounding_rect());
}

void SceneEntity::replace_surface(Backend::SurfacePtr surface) {
    if (!surface) {
        return;
    }
    surface_ = std::move(surface);
}

} // namespace SM::Scene
