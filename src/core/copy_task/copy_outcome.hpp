#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "core/storage_url/storage_url.hpp"
#include "infra/error_handler/error.hpp"

namespace objcp::core {

enum class TransferMode {
    Copy,
    Move,
};

struct Succeeded {
    std::uint64_t bytes_transferred = 0;
    std::chrono::duration<double> elapsed{0.0};
    StorageUrl destination;
    StorageUrl result_url;
    std::optional<std::string> checksum;
};

enum class SkipReason {
    AlreadyHandled,      // manifest of an earlier run
    DestinationExists,   // no-clobber, checked before writing
    NoClobberRejected,   // no-clobber, refused by the service
};

struct Skipped {
    SkipReason reason;
    std::string message;
};

enum class FailureScope {
    Item,   // counted, the run goes on
    Run,    // stop scheduling new items
};

struct Failed {
    infra::Error error;
    FailureScope scope = FailureScope::Item;
    // Set when the copy went through but a later step (ACL, delete) failed.
    std::uint64_t bytes_transferred = 0;
    std::chrono::duration<double> elapsed{0.0};
};

using CopyOutcome = std::variant<Succeeded, Skipped, Failed>;

[[nodiscard]] inline auto outcome_tag(const CopyOutcome& outcome) -> std::string_view {
    if (std::holds_alternative<Succeeded>(outcome)) return "success";
    if (std::holds_alternative<Skipped>(outcome)) return "skip";
    return "failure";
}

[[nodiscard]] inline auto aborts_run(const CopyOutcome& outcome) -> bool {
    const auto* failed = std::get_if<Failed>(&outcome);
    return failed && failed->scope == FailureScope::Run;
}

} // namespace objcp::core
