#include <smileys/scene/Scene.hpp>

#include <utility>

namespace SM::Scene {

auto create_scene(Backend::GraphicsBackend& backend, SceneLayout const& layout) -> Expected<SmileyScene> {
    auto primary = Smiley::Create(backend, layout.primary.position.x, layout.primary.position.y, layout.primary.color);
    if (!primary) {
        return std::unexpected(primary.error());
    }
    auto secondary = Smiley::Create(backend,
                                    layout.secondary.position.x,
                                    layout.secondary.position.y,
                                    layout.secondary.color);
    if (!secondary) {
        return std::unexpected(secondary.error());
    }
    return SmileyScene{
        .primary = std::move(*primary),
        .secondary = std::move(*secondary),
    };
}

} // namespace SM::Scene
