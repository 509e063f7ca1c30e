#include "transferkit/error.hpp"

#include <utility>

#include <fmt/format.h>

namespace transferkit {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::BadUrl:
        return "BadURL";
    case ErrorKind::TransportFailure:
        return "TransportFailure";
    case ErrorKind::BadServerResponse:
        return "BadServerResponse";
    case ErrorKind::DecodeFailed:
        return "DecodeFailed";
    case ErrorKind::AlreadyInProgress:
        return "AlreadyInProgress";
    case ErrorKind::InvalidResumeToken:
        return "InvalidResumeToken";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::FileSystemFailure:
        return "FileSystemFailure";
    }
    return "Unknown";
}

std::string Error::message() const {
    std::string text{toString(kind)};
    if (status_code) {
        text += fmt::format(" (HTTP {})", *status_code);
    }
    if (!cause.empty()) {
        text += fmt::format(": {}", cause);
    }
    return text;
}

Error makeError(ErrorKind kind, std::string cause) {
    Error error;
    error.kind = kind;
    error.cause = std::move(cause);
    return error;
}

Error badServerResponse(long status_code) {
    Error error;
    error.kind = ErrorKind::BadServerResponse;
    error.status_code = status_code;
    return error;
}

TransferException::TransferException(Error error)
    : std::runtime_error(error.message()), error_(std::move(error)) {}

} // namespace transferkit
