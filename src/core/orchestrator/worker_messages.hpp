#pragma once

#include <cstdint>
#include <string>
#include "core/copy_task/copy_outcome.hpp"
#include "core/name_resolver/naming_shape.hpp"
#include "infra/error_handler/error.hpp"

namespace objcp::core {

// What a worker process reports back for one finished item.
struct CompletionEvent {
    std::string tag;                 // "success", "skip" or "failure"
    std::uint64_t bytes_transferred = 0;
    double elapsed_seconds = 0.0;
    bool aborts_run = false;
    infra::ErrorCode error_code = infra::ErrorCode::Unknown;
    std::string message;
};

[[nodiscard]] auto make_completion_event(const CopyOutcome& outcome) -> CompletionEvent;

// YAML documents, one per pipe frame.
[[nodiscard]] auto encode_shape(const NamingShape& shape) -> std::string;
[[nodiscard]] auto decode_shape(const std::string& payload) -> infra::Result<NamingShape>;

[[nodiscard]] auto encode_event(const CompletionEvent& event) -> std::string;
[[nodiscard]] auto decode_event(const std::string& payload) -> infra::Result<CompletionEvent>;

} // namespace objcp::core
