#include <smileys/app/Options.hpp>

#include <array>
#include <charconv>
#include <fstream>
#include <random>
#include <system_error>
#include <utility>

namespace SM::App {

namespace {

auto invalid(std::string message) -> Error {
    return Error{Error::Code::InvalidConfig, std::move(message)};
}

template <typename T>
auto parse_number(std::string_view text, std::string_view label) -> Expected<T> {
    T value{};
    auto const* first = text.data();
    auto const* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::unexpected(invalid("invalid " + std::string{label} + " '" + std::string{text} + "'"));
    }
    return value;
}

auto parse_positive_int(std::string_view text, std::string_view label) -> Expected<int> {
    auto value = parse_number<int>(text, label);
    if (!value) {
        return value;
    }
    if (*value <= 0) {
        return std::unexpected(invalid(std::string{label} + " must be positive"));
    }
    return value;
}

auto read_int(nlohmann::json const& object, char const* key, int& out) -> Expected<void> {
    auto it = object.find(key);
    if (it == object.end()) {
        return {};
    }
    if (!it->is_number_integer()) {
        return std::unexpected(invalid(std::string{"'"} + key + "' must be an integer"));
    }
    out = it->get<int>();
    return {};
}

auto read_positive_int(nlohmann::json const& object, char const* key, int& out) -> Expected<void> {
    auto value = out;
    if (auto read = read_int(object, key, value); !read) {
        return read;
    }
    if (value <= 0) {
        return std::unexpected(invalid(std::string{"'"} + key + "' must be positive"));
    }
    out = value;
    return {};
}

auto read_color(nlohmann::json const& value, Color& out) -> Expected<void> {
    if (!value.is_array() || (value.size() != 3 && value.size() != 4)) {
        return std::unexpected(invalid("color must be an array of 3 or 4 integers"));
    }
    std::array<std::uint8_t, 4> channels{0, 0, 0, 255};
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_number_integer()) {
            return std::unexpected(invalid("color channels must be integers"));
        }
        auto const channel = value[i].get<int>();
        if (channel < 0 || channel > 255) {
            return std::unexpected(invalid("color channel out of range: " + std::to_string(channel)));
        }
        channels[i] = static_cast<std::uint8_t>(channel);
    }
    out = Color{channels[0], channels[1], channels[2], channels[3]};
    return {};
}

auto read_placement(nlohmann::json const& object, char const* key, Scene::SmileyPlacement& out) -> Expected<void> {
    auto it = object.find(key);
    if (it == object.end()) {
        return {};
    }
    if (!it->is_object()) {
        return std::unexpected(invalid(std::string{"'"} + key + "' must be an object"));
    }
    if (auto x = read_int(*it, "x", out.position.x); !x) {
        return x;
    }
    if (auto y = read_int(*it, "y", out.position.y); !y) {
        return y;
    }
    if (auto color = it->find("color"); color != it->end()) {
        return read_color(*color, out.color);
    }
    return {};
}

auto apply_window(nlohmann::json const& window, Backend::WindowConfig& out) -> Expected<void> {
    if (!window.is_object()) {
        return std::unexpected(invalid("'window' must be an object"));
    }
    if (auto title = window.find("title"); title != window.end()) {
        if (!title->is_string()) {
            return std::unexpected(invalid("'title' must be a string"));
        }
        out.title = title->get<std::string>();
    }
    for (auto [key, field] : {std::pair{"x", &out.x}, std::pair{"y", &out.y}}) {
        if (auto read = read_int(window, key, *field); !read) {
            return read;
        }
    }
    for (auto [key, field] : {std::pair{"width", &out.width},
                              std::pair{"height", &out.height},
                              std::pair{"min_width", &out.min_width},
                              std::pair{"min_height", &out.min_height},
                              std::pair{"max_width", &out.max_width},
                              std::pair{"max_height", &out.max_height}}) {
        if (auto read = read_positive_int(window, key, *field); !read) {
            return read;
        }
    }
    if (out.min_width > out.max_width || out.min_height > out.max_height) {
        return std::unexpected(invalid("window minimum size exceeds maximum size"));
    }
    return {};
}

auto apply_loop(nlohmann::json const& loop, LoopOptions& out) -> Expected<void> {
    if (!loop.is_object()) {
        return std::unexpected(invalid("'loop' must be an object"));
    }
    auto tick = static_cast<int>(out.tick_interval.count());
    if (auto read = read_positive_int(loop, "tick_interval_ms", tick); !read) {
        return read;
    }
    auto poll = static_cast<int>(out.poll_timeout.count());
    if (auto read = read_int(loop, "poll_timeout_ms", poll); !read) {
        return read;
    }
    if (poll < 0) {
        return std::unexpected(invalid("'poll_timeout_ms' must not be negative"));
    }
    out.tick_interval = std::chrono::milliseconds{tick};
    out.poll_timeout = std::chrono::milliseconds{poll};
    return {};
}

auto random_seed() -> std::uint64_t {
    return static_cast<std::uint64_t>(std::random_device{}());
}

} // namespace

auto apply_config_json(nlohmann::json const& config, AppOptions& options) -> Expected<void> {
    if (!config.is_object()) {
        return std::unexpected(invalid("config root must be an object"));
    }
    if (auto window = config.find("window"); window != config.end()) {
        if (auto applied = apply_window(*window, options.window); !applied) {
            return applied;
        }
    }
    if (auto loop = config.find("loop"); loop != config.end()) {
        if (auto applied = apply_loop(*loop, options.loop); !applied) {
            return applied;
        }
    }
    if (auto smileys = config.find("smileys"); smileys != config.end()) {
        if (!smileys->is_object()) {
            return std::unexpected(invalid("'smileys' must be an object"));
        }
        if (auto primary = read_placement(*smileys, "primary", options.layout.primary); !primary) {
            return primary;
        }
        if (auto secondary = read_placement(*smileys, "secondary", options.layout.secondary); !secondary) {
            return secondary;
        }
    }
    if (auto seed = config.find("seed"); seed != config.end()) {
        if (!seed->is_number_unsigned()) {
            return std::unexpected(invalid("'seed' must be a non-negative integer"));
        }
        options.seed = seed->get<std::uint64_t>();
    }
    if (auto verbose = config.find("verbose"); verbose != config.end()) {
        if (!verbose->is_boolean()) {
            return std::unexpected(invalid("'verbose' must be a boolean"));
        }
        options.verbose = verbose->get<bool>();
    }
    return {};
}

auto load_config_file(std::filesystem::path const& path, AppOptions& options) -> Expected<void> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open config file '" + path.string() + "'"});
    }
    auto config = nlohmann::json::parse(in, nullptr, false);
    if (config.is_discarded()) {
        return std::unexpected(invalid("config file '" + path.string() + "' is not valid JSON"));
    }
    return apply_config_json(config, options);
}

auto parse_options(std::span<char const* const> args) -> Expected<AppOptions> {
    AppOptions opts{};
    opts.seed = random_seed();

    constexpr std::string_view kConfigPrefix = "--config=";
    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string_view arg{args[i]};
        if (arg.starts_with(kConfigPrefix)) {
            auto path = arg.substr(kConfigPrefix.size());
            if (path.empty()) {
                return std::unexpected(invalid("--config requires a non-empty path"));
            }
            opts.config_path = std::filesystem::path{std::string{path}};
        }
    }
    if (opts.config_path) {
        if (auto loaded = load_config_file(*opts.config_path, opts); !loaded) {
            return std::unexpected(loaded.error());
        }
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string_view arg{args[i]};
        if (arg == "--headless") {
            opts.headless = true;
        } else if (arg == "--windowed") {
            opts.headless = false;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg.starts_with("--width=")) {
            auto value = parse_positive_int(arg.substr(8), "width");
            if (!value) {
                return std::unexpected(value.error());
            }
            opts.window.width = *value;
        } else if (arg.starts_with("--height=")) {
            auto value = parse_positive_int(arg.substr(9), "height");
            if (!value) {
                return std::unexpected(value.error());
            }
            opts.window.height = *value;
        } else if (arg.starts_with("--frames=")) {
            auto value = parse_number<std::uint64_t>(arg.substr(9), "frames");
            if (!value) {
                return std::unexpected(value.error());
            }
            opts.max_frames = *value;
        } else if (arg.starts_with("--seed=")) {
            auto value = parse_number<std::uint64_t>(arg.substr(7), "seed");
            if (!value) {
                return std::unexpected(value.error());
            }
            opts.seed = *value;
        } else if (arg.starts_with("--write-frame=")) {
            constexpr std::string_view prefix = "--write-frame=";
            auto path = arg.substr(prefix.size());
            if (path.empty()) {
                return std::unexpected(invalid("--write-frame requires a non-empty path"));
            }
            opts.frame_output_path = std::filesystem::path{std::string{path}};
        } else if (arg.starts_with(kConfigPrefix)) {
            continue;
        } else {
            return std::unexpected(invalid("unknown option '" + std::string{arg} + "'"));
        }
    }

    opts.loop.verbose = opts.verbose;
    return opts;
}

auto effective_loop_options(AppOptions const& options) -> LoopOptions {
    auto loop = options.loop;
    loop.verbose = options.verbose;
    if (options.max_frames) {
        loop.max_frames = *options.max_frames;
    } else if (options.headless) {
        loop.max_frames = kDefaultHeadlessFrames;
    }
    return loop;
}

auto usage_text(std::string_view program) -> std::string {
    std::string text;
    text += "Usage: ";
    text += program;
    text += " [options]\n"
            "Options:\n"
            "  --width=<pixels>      Initial window width (default 640)\n"
            "  --height=<pixels>     Initial window height (default 480)\n"
            "  --frames=<count>      Stop after N presented frames (headless default 30)\n"
            "  --seed=<value>        PRNG seed for color drift\n"
            "  --config=<path>       JSON config file; flags override its values\n"
            "  --write-frame=<png>   Save the last presented frame (headless only)\n"
            "  --headless            Render into memory instead of a window\n"
            "  --windowed            Open an SDL2 window (default)\n"
            "  --verbose, -v         Log events and ticks to stderr\n"
            "  --help, -h            Show this help\n"
            "Keys: arrows move the green smiley, space recolors both, q/escape quits.\n"
            "Click to move the yellow smiley.\n";
    return text;
}

} // namespace SM::App
