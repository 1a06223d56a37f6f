#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include "adapters/transfer_backend.hpp"
#include "core/copy_task/copy_outcome.hpp"
#include "core/storage_url/storage_url.hpp"
#include "extensions/manifest.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/retry.hpp"

namespace objcp::core {

struct CopyOptions {
    TransferMode mode = TransferMode::Copy;
    bool continue_on_error = false;
    bool no_clobber = false;
    bool print_version = false;
    bool preserve_acl = false;
    bool verify = false;
    std::optional<std::string> canned_acl;
    infra::RetryPolicy retry{};
};

struct RunStatsSnapshot {
    std::uint64_t items_copied = 0;
    std::uint64_t items_skipped = 0;
    std::uint64_t failure_count = 0;
    std::uint64_t bytes_transferred = 0;
    double summed_item_elapsed = 0.0;   // seconds
};

/// Run-wide counters. Every completion goes through record(), which takes
/// the single run lock.
class RunStats {
public:
    void record(const CopyOutcome& outcome);

    // Used by the process-pool aggregator, which receives plain events.
    void add(std::string_view tag, std::uint64_t bytes, double elapsed_seconds);

    [[nodiscard]] auto snapshot() const -> RunStatsSnapshot;

private:
    mutable std::mutex mutex_;
    RunStatsSnapshot totals_;
};

/// Everything a CopyTask needs that is shared by all items of one run.
/// Owned by the orchestrator for the duration of the run.
class RunContext {
public:
    RunContext(CopyOptions options,
               StorageUrl destination,
               bool have_existing_destination_container,
               adapters::TransferBackend& backend,
               extensions::ManifestLog* manifest = nullptr,
               adapters::AclApplier* acl_applier = nullptr);

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    [[nodiscard]] auto options() const -> const CopyOptions& { return options_; }
    [[nodiscard]] auto destination() const -> const StorageUrl& { return destination_; }
    [[nodiscard]] auto have_existing_destination_container() const -> bool {
        return have_existing_destination_container_;
    }
    [[nodiscard]] auto backend() const -> adapters::TransferBackend& { return backend_; }
    [[nodiscard]] auto manifest() const -> extensions::ManifestLog* { return manifest_; }
    [[nodiscard]] auto acl_applier() const -> adapters::AclApplier* { return acl_applier_; }

    [[nodiscard]] auto stats() -> RunStats& { return stats_; }
    [[nodiscard]] auto stats() const -> const RunStats& { return stats_; }

    // First run-aborting error wins; later ones are only logged.
    void request_abort(infra::Error error);
    [[nodiscard]] auto abort_requested() const -> bool {
        return abort_requested_.load(std::memory_order_acquire);
    }
    [[nodiscard]] auto abort_error() const -> std::optional<infra::Error>;

private:
    CopyOptions options_;
    StorageUrl destination_;
    bool have_existing_destination_container_;
    adapters::TransferBackend& backend_;
    extensions::ManifestLog* manifest_;
    adapters::AclApplier* acl_applier_;

    RunStats stats_;

    std::atomic<bool> abort_requested_{false};
    mutable std::mutex abort_mutex_;
    std::optional<infra::Error> abort_error_;
};

} // namespace objcp::core
