#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <fmt/core.h>

namespace rcopy::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidPath:
        case ErrorCode::DiscoveryFailed:
        case ErrorCode::LedgerIOFailed:
        case ErrorCode::ConfigInvalid:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (code == ErrorCode::Interrupted) return 130; // SIGINT
    return EXIT_FAILURE;
}

std::string_view Error::kind_name() const {
    switch (code) {
        case ErrorCode::InvalidPath:        return "InvalidPath";
        case ErrorCode::DiscoveryFailed:    return "DiscoveryFailed";
        case ErrorCode::LedgerIOFailed:     return "LedgerIOFailed";
        case ErrorCode::ConfigInvalid:      return "ConfigInvalid";
        case ErrorCode::FileNotFound:       return "NotFound";
        case ErrorCode::PermissionDenied:   return "PermissionDenied";
        case ErrorCode::DiskFull:           return "DiskFull";
        case ErrorCode::IOFailure:          return "IOFailure";
        case ErrorCode::VerificationFailed: return "VerificationFailed";
        case ErrorCode::Interrupted:        return "Interrupted";
        case ErrorCode::Unknown:            break;
    }
    return "Unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

ErrorCode code_from_errno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ENOSPC:
        case EDQUOT:
            return ErrorCode::DiskFull;
        default:
            return ErrorCode::IOFailure;
    }
}

Error make_error_from(const std::error_code& ec, std::string_view context,
                      const std::source_location& loc) {
    const auto code = ec.category() == std::generic_category() ||
                      ec.category() == std::system_category()
        ? code_from_errno(ec.value())
        : ErrorCode::IOFailure;
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        err.kind_name(), err.message
    );
    return std::move(err);
}

} // namespace rcopy::infra
