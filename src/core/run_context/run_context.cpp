#include "run_context.hpp"

#include <type_traits>
#include <spdlog/spdlog.h>

namespace objcp::core {

void RunStats::record(const CopyOutcome& outcome) {
    std::visit([this](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Succeeded>) {
            add("success", o.bytes_transferred, o.elapsed.count());
        } else if constexpr (std::is_same_v<T, Skipped>) {
            add("skip", 0, 0.0);
        } else {
            add("failure", o.bytes_transferred, o.elapsed.count());
        }
    }, outcome);
}

void RunStats::add(std::string_view tag, std::uint64_t bytes, double elapsed_seconds) {
    std::lock_guard lock(mutex_);
    if (tag == "success") {
        ++totals_.items_copied;
    } else if (tag == "skip") {
        ++totals_.items_skipped;
    } else {
        ++totals_.failure_count;
    }
    totals_.bytes_transferred += bytes;
    totals_.summed_item_elapsed += elapsed_seconds;
}

auto RunStats::snapshot() const -> RunStatsSnapshot {
    std::lock_guard lock(mutex_);
    return totals_;
}

RunContext::RunContext(CopyOptions options,
                       StorageUrl destination,
                       bool have_existing_destination_container,
                       adapters::TransferBackend& backend,
                       extensions::ManifestLog* manifest,
                       adapters::AclApplier* acl_applier)
    : options_(std::move(options))
    , destination_(std::move(destination))
    , have_existing_destination_container_(have_existing_destination_container)
    , backend_(backend)
    , manifest_(manifest)
    , acl_applier_(acl_applier)
{}

void RunContext::request_abort(infra::Error error) {
    std::lock_guard lock(abort_mutex_);
    if (abort_error_) {
        spdlog::debug("Run already aborting; ignoring: {}", error.message);
        return;
    }
    abort_error_ = std::move(error);
    abort_requested_.store(true, std::memory_order_release);
}

auto RunContext::abort_error() const -> std::optional<infra::Error> {
    std::lock_guard lock(abort_mutex_);
    return abort_error_;
}

} // namespace objcp::core
