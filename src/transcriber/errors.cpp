#include "errors.hpp"

#include <format>

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedMedia: return "UnsupportedMediaError";
        case ErrorKind::DecoderUnavailable: return "DecoderUnavailableError";
        case ErrorKind::DeviceUnavailable: return "DeviceUnavailableError";
        case ErrorKind::ModelUnavailable: return "ModelUnavailableError";
        case ErrorKind::ModelDownload: return "ModelDownloadError";
        case ErrorKind::OutOfResource: return "OutOfResourceError";
        case ErrorKind::Inference: return "InferenceError";
        case ErrorKind::Cancelled: return "CancelledError";
        case ErrorKind::OutputWrite: return "OutputWriteError";
    }
    return "UnknownError";
}

std::string describe(const Error& err) {
    if (err.message.empty()) return std::string(to_string(err.kind));
    return std::format("{}: {}", to_string(err.kind), err.message);
}
