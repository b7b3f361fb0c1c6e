#pragma once

#include <smileys/backend/SoftwareBackend.hpp>
#include <smileys/core/Error.hpp>

#include <filesystem>

namespace SM::App {

// Writes an RGBA8 frame to `output_path` as PNG, creating parent directories.
[[nodiscard]] auto write_frame_png(Backend::SoftwareFrame const& frame, std::filesystem::path const& output_path)
    -> Expected<void>;

} // namespace SM::App
