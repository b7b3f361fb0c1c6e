#include <smileys/scene/Smiley.hpp>
#include <smileys/scene/FaceFactory.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace SM::Scene {

namespace {

[[maybe_unused]] auto format_color(Color const& color) -> std::string {
    return "(" + std::to_string(color.r) + "," + std::to_string(color.g) + "," + std::to_string(color.b) + ","
           + std::to_string(color.a) + ")";
}

} // namespace

auto offset_channel(std::uint8_t channel, int offset) -> std::uint8_t {
    return static_cast<std::uint8_t>(std::clamp(static_cast<int>(channel) + offset, 0, 255));
}

Smiley::Smiley(Backend::GraphicsBackend& backend, SceneEntity entity, Color color)
    : backend_(&backend)
    , entity_(std::move(entity))
    , color_(color) {}

auto Smiley::Create(Backend::GraphicsBackend& backend, int x, int y, Color color) -> Expected<Smiley> {
    auto face = build_face(backend, color);
    if (!face) {
        return std::unexpected(face.error());
    }
    return Smiley{backend, SceneEntity{std::move(*face), Point{x, y}}, color};
}

auto Smiley::set_color(Color color) -> Expected<void> {
    auto face = build_face(*backend_, color);
    if (!face) {
        return std::unexpected(face.error());
    }
    entity_.replace_surface(std::move(*face));
    color_ = color;
    return {};
}

auto Smiley::mutate_color(int delta) -> Expected<void> {
    delta = std::clamp(delta, 0, kMaxChannelDelta);
    auto const span = 2 * delta + 1;
    auto next = Color{
        offset_channel(color_.r, backend_->random_uniform(span) - delta),
        offset_channel(color_.g, backend_->random_uniform(span) - delta),
        offset_channel(color_.b, backend_->random_uniform(span) - delta),
        255,
    };
    return set_color(next);
}

auto Smiley::randomize_color() -> Expected<void> {
    auto pick = [this] {
        return static_cast<std::uint8_t>(kRandomChannelMin + backend_->random_uniform(kRandomChannelSpan));
    };
    auto next = Color{};
    next.r = pick();
    next.g = pick();
    next.b = pick();
    next.a = 255;
    sm_log("randomized color " + format_color(next), "Smiley");
    return set_color(next);
}

} // namespace SM::Scene
