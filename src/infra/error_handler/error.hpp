#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace objcp::infra {

enum class ErrorCode {
    // Configuration errors: the whole run is aborted before any transfer
    InvalidArgument,
    Configuration,

    // Per-item rejections detected before the transfer
    InvalidSource,
    Conflict,
    SameSourceAndDestination,
    VersionedDestination,

    // Reported by a transfer backend
    ItemExists,          // no-clobber detected client side
    PreconditionFailed,  // no-clobber rejected by the service
    NotFound,
    AccessDenied,
    PermissionDenied,
    TransferFailed,
    ChecksumMismatch,
    NetworkTimeout,      // transient

    // Системные
    Interrupted,
    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

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

    // Fatal errors abort the run even when continue-on-error is enabled.
    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::NetworkTimeout;
    }

    // Both flavours of no-clobber turn into a skip, not a failure.
    [[nodiscard]] auto is_no_clobber() const -> bool {
        return code == ErrorCode::ItemExists ||
               code == ErrorCode::PreconditionFailed;
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace objcp::infra
