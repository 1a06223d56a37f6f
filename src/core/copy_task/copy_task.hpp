#pragma once

#include <string_view>
#include "core/copy_task/copy_outcome.hpp"
#include "core/name_resolver/naming_shape.hpp"
#include "core/run_context/run_context.hpp"
#include "core/storage_url/storage_url.hpp"

namespace objcp::core {

/// Drives one enumerated item to a terminal outcome:
/// Pending -> Resolving -> ConflictChecked -> Transferring -> {Succeeded | Skipped | Failed}.
/// A task object is used for exactly one item.
class CopyTask {
public:
    enum class State {
        Pending,
        Resolving,
        ConflictChecked,
        Transferring,
        Succeeded,
        Skipped,
        Failed,
    };

    explicit CopyTask(const RunContext& context);

    [[nodiscard]] auto run(const NamingShape& shape) -> CopyOutcome;

    [[nodiscard]] auto state() const -> State { return state_; }

private:
    [[nodiscard]] auto check_destination_names_container() const -> infra::VoidResult;
    [[nodiscard]] auto ensure_local_destination_container() const -> infra::VoidResult;
    [[nodiscard]] auto check_conflicts(const StorageUrl& source,
                                       const StorageUrl& destination) const -> infra::VoidResult;

    [[nodiscard]] auto transfer(const NamingShape& shape,
                                const StorageUrl& source,
                                const StorageUrl& destination) -> CopyOutcome;
    [[nodiscard]] auto after_success(const StorageUrl& source, Succeeded success) -> CopyOutcome;
    [[nodiscard]] auto remove_source(const StorageUrl& source) const -> infra::VoidResult;

    // Turns an error into Failed, scoped by the continue-on-error policy.
    [[nodiscard]] auto fail(infra::Error error) -> CopyOutcome;
    [[nodiscard]] auto fail_run(infra::Error error) -> CopyOutcome;
    [[nodiscard]] auto skip(SkipReason reason, std::string message) -> CopyOutcome;

    void advance(State next);

    const RunContext& context_;
    State state_ = State::Pending;
    std::string source_label_;
};

[[nodiscard]] auto to_string(CopyTask::State state) -> std::string_view;

} // namespace objcp::core
