#pragma once

#include <expected>
#include <string>
#include <string_view>

enum class ErrorKind {
    UnsupportedMedia,
    DecoderUnavailable,
    DeviceUnavailable,
    ModelUnavailable,
    ModelDownload,
    OutOfResource,
    Inference,
    Cancelled,
    OutputWrite,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

// Stable names shown by front ends ("DeviceUnavailableError", ...).
std::string_view to_string(ErrorKind kind);

std::string describe(const Error& err);
