#include <smileys/app/FrameCapture.hpp>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <cstddef>
#include <string>
#include <system_error>

namespace SM::App {

namespace {

constexpr std::size_t kBytesPerPixel = 4u;

} // namespace

auto write_frame_png(Backend::SoftwareFrame const& frame, std::filesystem::path const& output_path)
    -> Expected<void> {
    if (frame.width <= 0 || frame.height <= 0) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "frame capture has invalid dimensions " + std::to_string(frame.width) + "x"
                                         + std::to_string(frame.height)});
    }

    auto const row_stride = static_cast<std::size_t>(frame.width) * kBytesPerPixel;
    auto const required_bytes = row_stride * static_cast<std::size_t>(frame.height);
    if (frame.pixels.size() < required_bytes) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "frame capture underrun (have " + std::to_string(frame.pixels.size())
                                         + " bytes, expected " + std::to_string(required_bytes) + ")"});
    }

    auto const parent = output_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec{};
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IoFailure,
                                         "failed to create directory '" + parent.string() + "': " + ec.message()});
        }
    }

    auto const path_string = output_path.string();
    if (stbi_write_png(path_string.c_str(),
                       frame.width,
                       frame.height,
                       4,
                       frame.pixels.data(),
                       static_cast<int>(row_stride))
        == 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to write PNG to '" + path_string + "'"});
    }
    return {};
}

} // namespace SM::App
