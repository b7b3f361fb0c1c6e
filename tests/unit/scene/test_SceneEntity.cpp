#include <doctest/doctest.h>

#include <smileys/backend/SoftwareBackend.hpp>
#include <smileys/scene/SceneEntity.hpp>

#include <memory>
#include <stdexcept>

using namespace SM;
using namespace SM::Backend;

namespace {

auto solid_surface(int width, int height, Color color) -> SurfacePtr {
    auto surface = std::make_unique<SoftwareSurface>(width, height);
    REQUIRE(surface->fill_rect(std::nullopt, color).has_value());
    return surface;
}

} // namespace

TEST_SUITE("scene.entity") {

TEST_CASE("Bounding rect is centered on the position") {
    Scene::SceneEntity entity{solid_surface(100, 100, Colors::Shadow), Point{300, 300}};
    CHECK(entity.bounding_rect() == Rect{250, 250, 100, 100});

    Scene::SceneEntity odd{solid_surface(5, 3, Colors::Shadow), Point{10, 10}};
    CHECK(odd.bounding_rect() == Rect{8, 9, 5, 3});
}

TEST_CASE("Translate and set_position move the center") {
    Scene::SceneEntity entity{solid_surface(100, 100, Colors::Shadow), Point{200, 160}};
    entity.translate(-20, 0);
    CHECK(entity.position() == Point{180, 160});
    entity.translate(20, 20);
    CHECK(entity.position() == Point{200, 180});
    entity.set_position(120, 80);
    CHECK(entity.position() == Point{120, 80});
    CHECK(entity.bounding_rect() == Rect{70, 30, 100, 100});
}

TEST_CASE("Draw blits at the bounding rect") {
    SoftwareSurface target{40, 40};
    Scene::SceneEntity entity{solid_surface(10, 10, Color{255, 0, 0, 255}), Point{20, 20}};
    REQUIRE(entity.draw(target).has_value());
    CHECK(target.pixel(15, 15) == Color{255, 0, 0, 255});
    CHECK(target.pixel(24, 24) == Color{255, 0, 0, 255});
    CHECK(target.pixel(14, 15) == Colors::Transparent);
    CHECK(target.pixel(25, 25) == Colors::Transparent);
}

TEST_CASE("Drawing partially or fully off-screen is not an error") {
    SoftwareSurface target{40, 40};
    Scene::SceneEntity entity{solid_surface(10, 10, Color{0, 255, 0, 255}), Point{0, 0}};
    REQUIRE(entity.draw(target).has_value());
    CHECK(target.pixel(0, 0) == Color{0, 255, 0, 255});
    CHECK(target.pixel(5, 5) == Colors::Transparent);

    entity.set_position(-500, 900);
    CHECK(entity.draw(target).has_value());
}

TEST_CASE("Replacing the surface keeps the position") {
    Scene::SceneEntity entity{solid_surface(10, 10, Colors::Shadow), Point{50, 50}};
    entity.replace_surface(solid_surface(20, 30, Colors::Shadow));
    CHECK(entity.surface().width() == 20);
    CHECK(entity.bounding_rect() == Rect{40, 35, 20, 30});

    entity.replace_surface(nullptr);
    CHECK(entity.surface().width() == 20);
}

TEST_CASE("Null surface is rejected") {
    CHECK_THROWS_AS(Scene::SceneEntity(SurfacePtr{}, Point{0, 0}), std::invalid_argument);
}

}
