#include "error.hpp"
#include <fmt/core.h>

namespace objcp::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidArgument:          return "InvalidArgument";
        case ErrorCode::Configuration:            return "Configuration";
        case ErrorCode::InvalidSource:            return "InvalidSource";
        case ErrorCode::Conflict:                 return "Conflict";
        case ErrorCode::SameSourceAndDestination: return "SameSourceAndDestination";
        case ErrorCode::VersionedDestination:     return "VersionedDestination";
        case ErrorCode::ItemExists:               return "ItemExists";
        case ErrorCode::PreconditionFailed:       return "PreconditionFailed";
        case ErrorCode::NotFound:                 return "NotFound";
        case ErrorCode::AccessDenied:             return "AccessDenied";
        case ErrorCode::PermissionDenied:         return "PermissionDenied";
        case ErrorCode::TransferFailed:           return "TransferFailed";
        case ErrorCode::ChecksumMismatch:         return "ChecksumMismatch";
        case ErrorCode::NetworkTimeout:           return "NetworkTimeout";
        case ErrorCode::Interrupted:              return "Interrupted";
        case ErrorCode::Unknown:                  return "Unknown";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::Configuration:
        case ErrorCode::Interrupted:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::Interrupted:    return 130; // SIGINT
        default:                        return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace objcp::infra
