#pragma once

#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/core/Error.hpp>
#include <smileys/core/Types.hpp>
#include <smileys/scene/Scene.hpp>
#include <smileys/scene/SceneEntity.hpp>

#include <cstdint>
#include <span>

namespace SM::Scene {

// Full redraw every frame: clear, draw back to front, present.
class SceneRenderer {
public:
    explicit SceneRenderer(Color background = Colors::Background)
        : background_(background) {}

    auto render(Backend::GraphicsBackend& backend, std::span<SceneEntity const* const> back_to_front) -> Expected<void>;
    auto render(Backend::GraphicsBackend& backend, SmileyScene const& scene) -> Expected<void>;

    [[nodiscard]] auto background() const -> Color { return background_; }
    [[nodiscard]] auto frames_rendered() const -> std::uint64_t { return frames_rendered_; }

private:
    Color background_;
    std::uint64_t frames_rendered_ = 0;
};

} // namespace SM::Scene
