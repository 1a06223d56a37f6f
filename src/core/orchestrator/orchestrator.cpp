#include "orchestrator.hpp"

#include <chrono>
#include <exception>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "core/copy_task/copy_task.hpp"
#include "core/orchestrator/worker_messages.hpp"
#include "infra/interrupt.hpp"
#include "infra/process_pool/process_pool.hpp"
#include "infra/thread_pool/thread_pool.hpp"

namespace objcp::core {

namespace {

auto failure_scope(const infra::Error& error, const CopyOptions& options) -> FailureScope {
    if (error.is_fatal() || !options.continue_on_error) {
        return FailureScope::Run;
    }
    return FailureScope::Item;
}

} // namespace

auto execute_item(const NamingShape& shape, const RunContext& context) -> CopyOutcome {
    try {
        CopyTask task{context};
        return task.run(shape);
    } catch (const std::exception& e) {
        auto error = infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Error copying {}: {}", shape.expanded_source, e.what()));
        spdlog::error("{}", error.message);
        const auto scope = failure_scope(error, context.options());
        return Failed{.error = std::move(error), .scope = scope};
    }
}

Orchestrator::Orchestrator(OrchestratorOptions options,
                           adapters::NameExpander& expander,
                           adapters::TransferBackend& backend,
                           extensions::ManifestLog* manifest,
                           adapters::AclApplier* acl_applier,
                           infra::ProgressMonitor* monitor)
    : options_(std::move(options))
    , expander_(expander)
    , backend_(backend)
    , manifest_(manifest)
    , acl_applier_(acl_applier)
    , monitor_(monitor)
{}

auto Orchestrator::validate(const std::vector<std::string>& sources) const -> infra::VoidResult {
    if (sources.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "No source URLs given"));
    }
    const auto& copy = options_.copy;
    if (copy.preserve_acl && copy.canned_acl) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            "Specifying both the -p and -a options together is invalid."));
    }
    if (copy.canned_acl && !acl_applier_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            "A canned ACL was requested but no ACL applier is configured"));
    }
    return {};
}

auto Orchestrator::include_all_versions(const StorageUrl& destination) const -> infra::Result<bool> {
    if (!destination.is_cloud()) {
        return false;
    }
    const auto bucket = StorageUrl::cloud(destination.scheme(), destination.bucket(), "");
    auto state = backend_.get_versioning_state(bucket);
    if (state) {
        return state->enabled;
    }

    switch (state.error().code) {
    case infra::ErrorCode::AccessDenied:
        // Over-including versions is harmless, silently dropping them is not.
        spdlog::debug("Cannot read versioning state of {}; including all versions",
                      bucket.url_string());
        return true;
    case infra::ErrorCode::NotFound:
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            fmt::format("Destination bucket {} does not exist", bucket.url_string())));
    default:
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            fmt::format("Cannot read versioning state of {}: {}",
                        bucket.url_string(), state.error().message)));
    }
}

auto Orchestrator::should_stop(const RunContext& context) const -> bool {
    return context.abort_requested() || infra::is_interrupted();
}

void Orchestrator::complete(const CopyOutcome& outcome, RunContext& context) {
    context.stats().record(outcome);

    if (monitor_) {
        std::uint64_t bytes = 0;
        if (const auto* success = std::get_if<Succeeded>(&outcome)) {
            bytes = success->bytes_transferred;
        }
        monitor_->update(1, bytes, std::holds_alternative<Failed>(outcome) ? 1 : 0);
    }

    if (const auto* failed = std::get_if<Failed>(&outcome); failed && failed->scope == FailureScope::Run) {
        context.request_abort(failed->error);
    }
}

void Orchestrator::enumeration_failed(infra::Error error, RunContext& context) {
    spdlog::error("{}", error.message);
    const auto scope = failure_scope(error, context.options());
    complete(Failed{.error = std::move(error), .scope = scope}, context);
}

void Orchestrator::run_in_threads(adapters::SourceEnumerator& enumerator, RunContext& context) {
    infra::ThreadPool pool{options_.threads};
    // Keep the lazy enumerator at most a couple of items ahead per thread.
    const auto window = pool.size() * 2;

    while (!should_stop(context)) {
        pool.wait_for_capacity(window);
        if (should_stop(context)) break;

        auto item = enumerator.next();
        if (!item) break;
        if (!*item) {
            enumeration_failed(std::move(item->error()), context);
            continue;
        }

        pool.enqueue([this, &context, shape = std::move(**item)] {
            // Queued before an abort, not started yet.
            if (context.abort_requested()) return;
            complete(execute_item(shape, context), context);
        });
    }
    pool.wait();
}

auto Orchestrator::run_in_processes(adapters::SourceEnumerator& enumerator, RunContext& context)
    -> infra::VoidResult
{
    infra::ProcessPool pool{
        options_.processes,
        options_.threads,
        // Worker side: the context is this process' copy, so only the
        // completion event travels back.
        [&context](const std::string& job) -> std::string {
            auto shape = decode_shape(job);
            if (!shape) {
                return encode_event(CompletionEvent{
                    .tag = "failure",
                    .aborts_run = true,
                    .error_code = shape.error().code,
                    .message = shape.error().message,
                });
            }
            return encode_event(make_completion_event(execute_item(*shape, context)));
        },
        // Parent side, aggregator thread only.
        [this, &context](const std::string& payload) -> bool {
            auto event = decode_event(payload);
            if (!event) {
                spdlog::error("Dropping unreadable completion event: {}", event.error().message);
                context.stats().add("failure", 0, 0.0);
                return true;
            }
            context.stats().add(event->tag, event->bytes_transferred, event->elapsed_seconds);
            if (monitor_) {
                monitor_->update(1, event->tag == "success" ? event->bytes_transferred : 0,
                                 event->tag == "failure" ? 1 : 0);
            }
            if (event->aborts_run) {
                context.request_abort(infra::make_error(event->error_code, event->message));
                return false;
            }
            return true;
        },
    };

    if (auto started = pool.start(); !started) {
        return started;
    }
    // Render thread only after the fork.
    if (monitor_) monitor_->start();

    while (!should_stop(context) && !pool.stopped()) {
        auto item = enumerator.next();
        if (!item) break;
        if (!*item) {
            enumeration_failed(std::move(item->error()), context);
            if (context.abort_requested()) pool.stop_new_work();
            continue;
        }
        if (auto sent = pool.dispatch(encode_shape(**item)); !sent) {
            context.request_abort(std::move(sent.error()));
            break;
        }
    }

    if (should_stop(context)) {
        pool.stop_new_work();
    }
    return pool.finish();
}

auto Orchestrator::run(const std::vector<std::string>& sources,
                       const std::string& destination) -> infra::Result<RunResult>
{
    if (auto valid = validate(sources); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    const auto start = std::chrono::steady_clock::now();

    // Computed once: every item sees the same answer even if the
    // destination changes while the run is going.
    auto expanded = expander_.expand_destination(destination);
    if (!expanded) {
        return std::unexpected(std::move(expanded.error()));
    }
    if (expanded->url.has_generation()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            fmt::format("Destination URL must not name a version: {}", expanded->url.url_string())));
    }

    auto all_versions = include_all_versions(expanded->url);
    if (!all_versions) {
        return std::unexpected(std::move(all_versions.error()));
    }

    RunContext context{options_.copy, expanded->url, expanded->have_existing_container,
                       backend_, manifest_, acl_applier_};

    const adapters::EnumerationOptions enumeration{
        .recursive = options_.recursive || options_.copy.mode == TransferMode::Move,
        .all_versions = *all_versions,
        .exclude_symlinks = options_.exclude_symlinks,
    };
    auto enumerator = expander_.enumerate(sources, enumeration, expanded->have_existing_container);

    spdlog::debug("Copying to {} with {} process(es) x {} thread(s)",
                  expanded->url.url_string(), options_.processes, options_.threads);

    if (options_.processes > 1) {
        if (auto res = run_in_processes(*enumerator, context); !res) {
            context.request_abort(std::move(res.error()));
        }
    } else {
        if (monitor_) monitor_->start();
        run_in_threads(*enumerator, context);
    }
    if (monitor_) monitor_->stop();

    const std::chrono::duration<double> wall = std::chrono::steady_clock::now() - start;
    const auto totals = context.stats().snapshot();

    RunResult result{
        .success = totals.failure_count == 0,
        .failure_count = totals.failure_count,
        .items_copied = totals.items_copied,
        .items_skipped = totals.items_skipped,
        .total_bytes = totals.bytes_transferred,
        .total_elapsed = effective_elapsed(wall.count()),
        .summed_item_elapsed = totals.summed_item_elapsed,
    };
    result.throughput = static_cast<double>(result.total_bytes) / result.total_elapsed;

    if (auto error = context.abort_error()) {
        spdlog::debug("Run aborted after {} copied, {} skipped, {} failed",
                      result.items_copied, result.items_skipped, result.failure_count);
        return std::unexpected(std::move(*error));
    }
    if (infra::is_interrupted()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "Interrupted by user"));
    }
    if (!result.success) {
        spdlog::error("{} file(s)/object(s) could not be transferred.", result.failure_count);
    }
    return result;
}

} // namespace objcp::core
