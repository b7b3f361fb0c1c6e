#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace SM {

struct Error {
    enum class Code {
        BackendInitFailed = 0,
        WindowCreationFailed,
        MemoryAllocationFailed,
        SurfaceOperationFailed,
        PresentFailed,
        TypeMismatch,
        InvalidConfig,
        MalformedInput,
        IoFailure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::BackendInitFailed:
        return "backend_init_failed";
    case Error::Code::WindowCreationFailed:
        return "window_creation_failed";
    case Error::Code::MemoryAllocationFailed:
        return "memory_allocation_failed";
    case Error::Code::SurfaceOperationFailed:
        return "surface_operation_failed";
    case Error::Code::PresentFailed:
        return "present_failed";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::InvalidConfig:
        return "invalid_config";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::IoFailure:
        return "io_failure";
    }
    return "unknown";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace SM
