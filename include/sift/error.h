#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace sift {

enum class ErrorKind {
    NotFound,
    PermissionDenied,
    NotADirectory,
    InvalidTarget,
    AlreadyExists,
    IOFailure
};

struct Error {
    ErrorKind kind = ErrorKind::IOFailure;
    std::string message;
};

// Result of a single-target operation: either ok or an Error.
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status Ok() { return Status{}; }

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const Error& error() const { return *error_; }
    ErrorKind kind() const { return error_->kind; }
    const std::string& message() const { return error_->message; }

private:
    std::optional<Error> error_;
};

std::string_view ToString(ErrorKind kind) noexcept;

ErrorKind KindFromErrorCode(const std::error_code& ec) noexcept;

Error MakeError(const std::filesystem::path& path, const std::error_code& ec);
Error MakeError(ErrorKind kind, const std::filesystem::path& path, std::string_view reason);

} // namespace sift
