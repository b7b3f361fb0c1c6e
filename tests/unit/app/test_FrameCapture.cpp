#include <doctest/doctest.h>

#include <smileys/app/FrameCapture.hpp>
#include <smileys/backend/SoftwareBackend.hpp>

#include <chrono>
#include <filesystem>
#include <string>

using namespace SM;

namespace {

auto scratch_dir() -> std::filesystem::path {
    auto const stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("smileys_capture_" + std::to_string(stamp));
}

} // namespace

TEST_SUITE("app.frame_capture") {

TEST_CASE("Presented frame is written as PNG into a new directory") {
    Backend::SoftwareBackend backend{Backend::SoftwareBackend::Options{.width = 16, .height = 8}};
    auto window = backend.window_surface();
    REQUIRE(window.has_value());
    REQUIRE((*window)->fill_rect(std::nullopt, Colors::Background).has_value());
    REQUIRE(backend.present().has_value());
    REQUIRE(backend.last_frame().has_value());

    auto const dir = scratch_dir();
    auto const path = dir / "nested" / "frame.png";
    auto written = App::write_frame_png(*backend.last_frame(), path);
    REQUIRE(written.has_value());
    CHECK(std::filesystem::exists(path));
    CHECK(std::filesystem::file_size(path) > 8u);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_CASE("Malformed frames are rejected") {
    Backend::SoftwareFrame empty{};
    auto result = App::write_frame_png(empty, scratch_dir() / "empty.png");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::MalformedInput);

    Backend::SoftwareFrame short_frame{.frame_index = 1, .width = 4, .height = 4, .pixels = std::vector<std::uint8_t>(8)};
    auto underrun = App::write_frame_png(short_frame, scratch_dir() / "short.png");
    REQUIRE_FALSE(underrun.has_value());
    CHECK(underrun.error().code == Error::Code::MalformedInput);
}

}
