#pragma once

#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/core/Error.hpp>
#include <smileys/core/Types.hpp>
#include <smileys/scene/Smiley.hpp>

#include <array>

namespace SM::Scene {

struct SmileyPlacement {
    Point position{};
    Color color{};
};

struct SceneLayout {
    SmileyPlacement primary{Point{320, 240}, Color{255, 220, 0, 255}};
    SmileyPlacement secondary{Point{200, 160}, Color{80, 200, 120, 255}};
};

// The two smileys of the demo. `primary` is drawn last and so sits on top.
struct SmileyScene {
    Smiley primary;
    Smiley secondary;

    [[nodiscard]] auto draw_order() const -> std::array<SceneEntity const*, 2> {
        return {&secondary.entity(), &primary.entity()};
    }
};

[[nodiscard]] auto create_scene(Backend::GraphicsBackend& backend, SceneLayout const& layout) -> Expected<SmileyScene>;

} // namespace SM::Scene
