#include <smileys/scene/FaceFactory.hpp>

#include "log/TaggedLogger.hpp"

#include <span>
#include <utility>

namespace SM::Scene {

auto build_face(Backend::GraphicsBackend& backend, Color color) -> Expected<Backend::SurfacePtr> {
    auto surface = backend.make_surface(Face::kSize, Face::kSize);
    if (!surface) {
        sm_log("face surface allocation failed: " + describeError(surface.error()), "Face", "ERROR");
        return std::unexpected(surface.error());
    }
    auto& face = **surface;

    if (auto shadow = face.fill_rect(Face::kShadow, Colors::Shadow); !shadow) {
        return std::unexpected(shadow.error());
    }
    if (auto head = face.fill_rect(Face::kHead, color); !head) {
        return std::unexpected(head.error());
    }
    if (auto cutouts = face.fill_rects(std::span<Rect const>{Face::kCutouts}, Colors::Shadow); !cutouts) {
        return std::unexpected(cutouts.error());
    }
    if (auto rle = face.set_rle_hint(true); !rle) {
        return std::unexpected(rle.error());
    }
    return std::move(*surface);
}

} // namespace SM::Scene
