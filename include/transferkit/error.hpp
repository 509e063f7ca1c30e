#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace transferkit {

enum class ErrorKind {
    BadUrl,
    TransportFailure,
    BadServerResponse,
    DecodeFailed,
    AlreadyInProgress,
    InvalidResumeToken,
    Cancelled,
    FileSystemFailure,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

struct Error {
    ErrorKind kind{ErrorKind::TransportFailure};
    std::optional<long> status_code;
    std::string cause;

    [[nodiscard]] std::string message() const;
};

[[nodiscard]] Error makeError(ErrorKind kind, std::string cause = {});
[[nodiscard]] Error badServerResponse(long status_code);

class TransferException : public std::runtime_error {
public:
    explicit TransferException(Error error);

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] ErrorKind kind() const noexcept { return error_.kind; }

private:
    Error error_;
};

// Server or network problem on the fetch path: BadUrl, TransportFailure or BadServerResponse.
class FetchFailed : public TransferException {
public:
    using TransferException::TransferException;
};

// The payload arrived but does not have the expected shape.
class DecodeFailed : public TransferException {
public:
    explicit DecodeFailed(std::string cause)
        : TransferException(makeError(ErrorKind::DecodeFailed, std::move(cause))) {}
};

} // namespace transferkit
