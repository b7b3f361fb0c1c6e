#pragma once

#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/core/Types.hpp>

#include <array>

namespace SM::Scene {

namespace Face {

inline constexpr int kSize = 100;
inline constexpr Rect kShadow{10, 10, 90, 90};
inline constexpr Rect kHead{0, 0, 90, 90};
inline constexpr std::array<Rect, 3> kCutouts{
    Rect{20, 20, 15, 20}, // left eye
    Rect{55, 20, 15, 20}, // right eye
    Rect{20, 60, 50, 10}, // mouth
};

} // namespace Face

// Renders a smiley face in `color` onto a fresh surface: shadow, head, then the
// eyes and mouth cut back to the shadow's transparency.
[[nodiscard]] auto build_face(Backend::GraphicsBackend& backend, Color color) -> Expected<Backend::SurfacePtr>;

} // namespace SM::Scene
