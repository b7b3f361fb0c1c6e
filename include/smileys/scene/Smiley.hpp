#pragma once

#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/core/Error.hpp>
#include <smileys/core/Types.hpp>
#include <smileys/scene/SceneEntity.hpp>

namespace SM::Scene {

// A face entity plus the color it was rendered from. Every color change
// rebuilds the surface, so entity() always depicts color().
class Smiley {
public:
    static constexpr int kRandomChannelMin = 50;
    static constexpr int kRandomChannelSpan = 175;
    // Offsets beyond a full channel swing saturate the same way.
    static constexpr int kMaxChannelDelta = 255;

    [[nodiscard]] static auto Create(Backend::GraphicsBackend& backend, int x, int y, Color color) -> Expected<Smiley>;

    Smiley(Smiley&&) noexcept            = default;
    Smiley& operator=(Smiley&&) noexcept = default;

    // On failure the smiley keeps its previous surface and color.
    auto set_color(Color color) -> Expected<void>;

    // Adds a uniform offset in [-delta, delta] to each of r, g, b, clamps to
    // [0, 255] and forces full opacity. delta is limited to [0, kMaxChannelDelta].
    auto mutate_color(int delta) -> Expected<void>;

    // Picks each of r, g, b uniformly from [50, 224] at full opacity.
    auto randomize_color() -> Expected<void>;

    [[nodiscard]] auto color() const -> Color { return color_; }
    [[nodiscard]] auto entity() -> SceneEntity& { return entity_; }
    [[nodiscard]] auto entity() const -> SceneEntity const& { return entity_; }

private:
    Smiley(Backend::GraphicsBackend& backend, SceneEntity entity, Color color);

    Backend::GraphicsBackend* backend_ = nullptr;
    SceneEntity entity_;
    Color color_{};
};

// Applies a signed offset to one channel, saturating at 0 and 255.
[[nodiscard]] auto offset_channel(std::uint8_t channel, int offset) -> std::uint8_t;

} // namespace SM::Scene
