#pragma once

#include <smileys/app/EventLoop.hpp>
#include <smileys/backend/GraphicsBackend.hpp>
#include <smileys/core/Error.hpp>
#include <smileys/scene/Scene.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace SM::App {

inline constexpr std::uint64_t kDefaultHeadlessFrames = 30;

struct AppOptions {
    Backend::WindowConfig window{};
    LoopOptions loop{};
    Scene::SceneLayout layout{};
    std::uint64_t seed = 0;
    bool verbose = false;
    bool headless = false;
    bool show_help = false;
    std::optional<std::uint64_t> max_frames{};
    std::optional<std::filesystem::path> config_path{};
    std::optional<std::filesystem::path> frame_output_path{};
};

// Parses argv (argv[0] is skipped). A --config file is applied first, so flags
// given on the command line override it.
[[nodiscard]] auto parse_options(std::span<char const* const> args) -> Expected<AppOptions>;

// Merges the keys present in `config` into `options`.
[[nodiscard]] auto apply_config_json(nlohmann::json const& config, AppOptions& options) -> Expected<void>;
[[nodiscard]] auto load_config_file(std::filesystem::path const& path, AppOptions& options) -> Expected<void>;

// Loop options with the effective frame budget folded in.
[[nodiscard]] auto effective_loop_options(AppOptions const& options) -> LoopOptions;

[[nodiscard]] auto usage_text(std::string_view program) -> std::string;

} // namespace SM::App
