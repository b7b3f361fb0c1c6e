#include <smileys/scene/SceneRenderer.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace SM::Scene {

auto SceneRenderer::render(Backend::GraphicsBackend& backend, std::span<SceneEntity const* const> back_to_front)
    -> Expected<void> {
    auto window = backend.window_surface();
    if (!window) {
        return std::unexpected(window.error());
    }
    auto& target = **window;

    if (auto cleared = target.fill_rect(std::nullopt, background_); !cleared) {
        return cleared;
    }
    for (auto const* entity : back_to_front) {
        if (entity == nullptr) {
            continue;
        }
        if (auto drawn = entity->draw(target); !drawn) {
            return drawn;
        }
    }
    if (auto presented = backend.present(); !presented) {
        sm_log("present failed: " + describeError(presented.error()), "Render", "ERROR");
        return presented;
    }
    ++frames_rendered_;
    return {};
}

auto SceneRenderer::render(Backend::GraphicsBackend& backend, SmileyScene const& scene) -> Expected<void> {
    auto const order = scene.draw_order();
    return render(backend, std::span<SceneEntity const* const>{order});
}

} // namespace SM::Scene
