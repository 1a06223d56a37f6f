#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "adapters/transfer_backend.hpp"
#include "core/copy_task/copy_outcome.hpp"
#include "core/run_context/run_context.hpp"
#include "extensions/manifest.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace objcp::core {

struct RunResult {
    bool success = true;
    std::uint64_t failure_count = 0;
    std::uint64_t items_copied = 0;
    std::uint64_t items_skipped = 0;
    std::uint64_t total_bytes = 0;
    double total_elapsed = 0.0;         // wall clock, seconds
    double summed_item_elapsed = 0.0;   // sum over items, seconds
    double throughput = 0.0;            // bytes per second
};

struct OrchestratorOptions {
    CopyOptions copy{};
    std::uint32_t threads = 1;     // per process
    std::uint32_t processes = 1;   // 1 = everything runs in this process
    bool recursive = false;
    bool exclude_symlinks = false;
};

/// Runs one cp/mv invocation: expands the destination once, enumerates the
/// sources lazily and drives every item through a CopyTask on a worker pool.
class Orchestrator {
public:
    // Elapsed time reported for runs too fast for the clock to measure.
    static constexpr double kMinElapsedSeconds = 0.01;

    // Measured time unless it is zero, which would make the throughput infinite.
    [[nodiscard]] static constexpr auto effective_elapsed(double seconds) -> double {
        return seconds > 0.0 ? seconds : kMinElapsedSeconds;
    }

    Orchestrator(OrchestratorOptions options,
                 adapters::NameExpander& expander,
                 adapters::TransferBackend& backend,
                 extensions::ManifestLog* manifest = nullptr,
                 adapters::AclApplier* acl_applier = nullptr,
                 infra::ProgressMonitor* monitor = nullptr);

    /// Fails only on configuration errors and run-aborting item failures;
    /// tolerated item failures show up in RunResult::failure_count.
    [[nodiscard]] auto run(const std::vector<std::string>& sources,
                           const std::string& destination) -> infra::Result<RunResult>;

private:
    [[nodiscard]] auto validate(const std::vector<std::string>& sources) const -> infra::VoidResult;
    [[nodiscard]] auto include_all_versions(const StorageUrl& destination) const -> infra::Result<bool>;

    void run_in_threads(adapters::SourceEnumerator& enumerator, RunContext& context);
    [[nodiscard]] auto run_in_processes(adapters::SourceEnumerator& enumerator, RunContext& context)
        -> infra::VoidResult;

    // Folds one finished item into the run: statistics, progress, abort.
    void complete(const CopyOutcome& outcome, RunContext& context);
    void enumeration_failed(infra::Error error, RunContext& context);

    [[nodiscard]] auto should_stop(const RunContext& context) const -> bool;

    OrchestratorOptions options_;
    adapters::NameExpander& expander_;
    adapters::TransferBackend& backend_;
    extensions::ManifestLog* manifest_;
    adapters::AclApplier* acl_applier_;
    infra::ProgressMonitor* monitor_;
};

// Runs a single item; exceptions escaping the task become a Failed outcome.
[[nodiscard]] auto execute_item(const NamingShape& shape, const RunContext& context) -> CopyOutcome;

} // namespace objcp::core
