#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace rcopy::infra {

enum class ErrorCode {
    // Сессионные (сессия не стартует)
    InvalidPath,
    DiscoveryFailed,
    LedgerIOFailed,
    ConfigInvalid,

    // Пофайловые (файл попадает в журнал ошибок, сессия продолжается)
    FileNotFound,
    PermissionDenied,
    DiskFull,
    IOFailure,
    VerificationFailed,

    // Системные
    Interrupted,
    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto kind_name() const -> std::string_view;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит errno / std::error_code в ErrorCode для пофайловых ошибок.
[[nodiscard]] auto code_from_errno(int err) -> ErrorCode;

[[nodiscard]] auto make_error_from(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace rcopy::infra
