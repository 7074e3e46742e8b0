#include "sift/error.h"

#include <cerrno>
#include <format>

namespace sift {

std::string_view ToString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::PermissionDenied:
        return "permission denied";
    case ErrorKind::NotADirectory:
        return "not a directory";
    case ErrorKind::InvalidTarget:
        return "invalid target";
    case ErrorKind::AlreadyExists:
        return "already exists";
    case ErrorKind::IOFailure:
        break;
    }
    return "I/O failure";
}

ErrorKind KindFromErrorCode(const std::error_code& ec) noexcept {
    if (ec == std::errc::no_such_file_or_directory) return ErrorKind::NotFound;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorKind::PermissionDenied;
    }
    if (ec == std::errc::not_a_directory) return ErrorKind::NotADirectory;
    if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty) {
        return ErrorKind::AlreadyExists;
    }
    if (ec == std::errc::is_a_directory || ec == std::errc::invalid_argument) {
        return ErrorKind::InvalidTarget;
    }
    return ErrorKind::IOFailure;
}

Error MakeError(const std::filesystem::path& path, const std::error_code& ec) {
    return Error{KindFromErrorCode(ec), std::format("{}: {}", path.string(), ec.message())};
}

Error MakeError(ErrorKind kind, const std::filesystem::path& path, std::string_view reason) {
    return Error{kind, std::format("{}: {}", path.string(), reason)};
}

} // namespace sift
