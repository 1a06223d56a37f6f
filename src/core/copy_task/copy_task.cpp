#include "copy_task.hpp"

#include <chrono>
#include <filesystem>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "core/name_resolver/name_resolver.hpp"
#include "infra/retry.hpp"

namespace objcp::core {

namespace {

namespace fs = std::filesystem;

auto same_local_file(const StorageUrl& a, const StorageUrl& b) -> bool {
    std::error_code ec_a, ec_b;
    const auto ca = fs::weakly_canonical(a.object_name(), ec_a);
    const auto cb = fs::weakly_canonical(b.object_name(), ec_b);
    if (ec_a || ec_b) {
        return fs::path(a.object_name()).lexically_normal() == fs::path(b.object_name()).lexically_normal();
    }
    return ca == cb;
}

} // namespace

auto to_string(CopyTask::State state) -> std::string_view {
    switch (state) {
        case CopyTask::State::Pending:         return "Pending";
        case CopyTask::State::Resolving:       return "Resolving";
        case CopyTask::State::ConflictChecked: return "ConflictChecked";
        case CopyTask::State::Transferring:    return "Transferring";
        case CopyTask::State::Succeeded:       return "Succeeded";
        case CopyTask::State::Skipped:         return "Skipped";
        case CopyTask::State::Failed:          return "Failed";
    }
    return "Unknown";
}

CopyTask::CopyTask(const RunContext& context)
    : context_(context)
{}

void CopyTask::advance(State next) {
    spdlog::trace("{}: {} -> {}", source_label_, to_string(state_), to_string(next));
    state_ = next;
}

auto CopyTask::run(const NamingShape& shape) -> CopyOutcome {
    const auto& options = context_.options();
    const auto cmd_name = options.mode == TransferMode::Move ? "mv" : "cp";
    source_label_ = shape.expanded_source;

    advance(State::Resolving);

    auto source = StorageUrl::parse(shape.source);
    if (!source) {
        return fail(std::move(source.error()));
    }
    auto expanded = StorageUrl::parse(shape.expanded_source);
    if (!expanded) {
        return fail(std::move(expanded.error()));
    }

    if (source->is_provider()) {
        return fail(infra::make_error(infra::ErrorCode::InvalidSource,
            fmt::format("The {} command does not allow provider-only source URLs ({})",
                        cmd_name, shape.source)));
    }

    if (shape.is_multi_source_request) {
        if (auto res = check_destination_names_container(); !res) {
            return fail_run(std::move(res.error()));
        }
    }

    auto* manifest = context_.manifest();
    const auto manifest_key = expanded->url_string();
    if (manifest && manifest->was_already_handled(manifest_key)) {
        return skip(SkipReason::AlreadyHandled,
                    fmt::format("Already handled per manifest: {}", manifest_key));
    }

    if (options.mode == TransferMode::Move && shape.names_container &&
        source->contains_wildcard()) {
        return fail_run(infra::make_error(infra::ErrorCode::Configuration,
            "The mv command disallows naming source directories using wildcards"));
    }

    if (shape.is_multi_source_request) {
        if (auto res = ensure_local_destination_container(); !res) {
            return fail(std::move(res.error()));
        }
    }

    const auto destination = resolve_destination(*source, *expanded,
                                                 shape.names_container,
                                                 shape.is_multi_source_request,
                                                 context_.destination(),
                                                 shape.destination_had_existing_container);

    if (auto res = check_conflicts(*expanded, destination); !res) {
        return fail(std::move(res.error()));
    }
    advance(State::ConflictChecked);

    return transfer(shape, *expanded, destination);
}

auto CopyTask::check_destination_names_container() const -> infra::VoidResult {
    const auto& dst = context_.destination();
    const auto cmd_name = context_.options().mode == TransferMode::Move ? "mv" : "cp";

    bool names_container = true;
    if (dst.is_file()) {
        // A missing local path is created on demand; an existing file is not a container.
        std::error_code ec;
        const auto status = fs::status(dst.object_name(), ec);
        names_container = !fs::exists(status) || fs::is_directory(status);
    } else if (dst.is_object()) {
        names_container = context_.have_existing_destination_container() ||
                          dst.names_container_shape();
    }

    if (!names_container) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            fmt::format("Destination URL must name a directory, bucket, or bucket subdirectory "
                        "for the multiple source form of the {} command.", cmd_name)));
    }
    return {};
}

auto CopyTask::ensure_local_destination_container() const -> infra::VoidResult {
    const auto& dst = context_.destination();
    if (!dst.is_file()) {
        return {};
    }

    std::error_code ec;
    if (fs::exists(dst.object_name(), ec)) {
        return {};
    }
    fs::create_directories(dst.object_name(), ec);
    // Another worker (or another run) may have created it in the meantime.
    if (ec && !fs::is_directory(dst.object_name())) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot create destination directory {}: {}", dst.object_name(), ec.message())));
    }
    return {};
}

auto CopyTask::check_conflicts(const StorageUrl& source,
                               const StorageUrl& destination) const -> infra::VoidResult {
    const auto cmd_name = context_.options().mode == TransferMode::Move ? "mv" : "cp";

    if (destination.is_file()) {
        std::error_code ec;
        const fs::path dst_path(destination.object_name());
        if (fs::is_directory(dst_path, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Conflict,
                fmt::format("Cannot copy {} because a directory exists ({}) where the file needs to be created.",
                            source.url_string(), dst_path.string())));
        }
        for (auto parent = dst_path.parent_path();
             !parent.empty() && parent != parent.root_path();
             parent = parent.parent_path()) {
            const auto status = fs::status(parent, ec);
            if (fs::is_directory(status)) {
                break;
            }
            if (fs::exists(status)) {
                return std::unexpected(infra::make_error(infra::ErrorCode::Conflict,
                    fmt::format("Cannot copy {} because a file exists ({}) where a directory needs to be created.",
                                source.url_string(), parent.string())));
            }
        }
    }

    const bool same = (source.is_file() && destination.is_file())
        ? same_local_file(source, destination)
        : source.url_string() == destination.url_string();
    if (same) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SameSourceAndDestination,
            fmt::format("{}: \"{}\" and \"{}\" are the same file - abort.",
                        cmd_name, source.url_string(), destination.url_string())));
    }

    if (destination.is_cloud() && destination.has_generation()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VersionedDestination,
            fmt::format("{}: a version-specific URL ({}) cannot be the destination - abort.",
                        cmd_name, destination.url_string())));
    }
    return {};
}

auto CopyTask::transfer(const NamingShape& shape,
                        const StorageUrl& source,
                        const StorageUrl& destination) -> CopyOutcome {
    const auto& options = context_.options();
    auto* manifest = context_.manifest();
    const auto manifest_key = source.url_string();

    advance(State::Transferring);
    if (manifest) {
        manifest->begin(manifest_key, destination.url_string());
    }

    const adapters::TransferOptions transfer_options{
        .no_clobber = options.no_clobber,
        .preserve_acl = options.preserve_acl,
        .verify = options.verify,
    };

    const auto start = std::chrono::steady_clock::now();
    auto result = infra::with_retry([&] {
        return context_.backend().transfer(source, destination, transfer_options);
    }, options.retry);
    const std::chrono::duration<double> measured = std::chrono::steady_clock::now() - start;

    if (!result) {
        auto& error = result.error();
        if (error.code == infra::ErrorCode::ItemExists ||
            error.code == infra::ErrorCode::PreconditionFailed) {
            const bool server_side = error.code == infra::ErrorCode::PreconditionFailed;
            auto message = server_side
                ? fmt::format("Rejected (noclobber): {}", destination.url_string())
                : fmt::format("Skipping existing item: {}", destination.url_string());
            if (manifest) {
                if (auto res = manifest->record_outcome(manifest_key, 0, extensions::ManifestResult::Skip, message); !res) {
                    return fail(std::move(res.error()));
                }
            }
            return skip(server_side ? SkipReason::NoClobberRejected : SkipReason::DestinationExists,
                        std::move(message));
        }

        error.message = fmt::format("Error copying {}: {}", shape.source, error.message);
        if (manifest) {
            if (auto res = manifest->record_outcome(manifest_key, 0, extensions::ManifestResult::Error, error.message); !res) {
                spdlog::error("{}", res.error().message);
            }
        }
        return fail(std::move(error));
    }

    if (manifest) {
        if (result->checksum) {
            manifest->record_checksum(manifest_key, *result->checksum);
        }
        if (result->upload_id) {
            manifest->record_upload_id(manifest_key, *result->upload_id);
        }
        manifest->record_source_size(manifest_key, result->source_size);
        if (auto res = manifest->record_outcome(manifest_key, result->bytes_transferred,
                                                extensions::ManifestResult::Ok); !res) {
            return fail(std::move(res.error()));
        }
    }

    Succeeded success{
        .bytes_transferred = result->bytes_transferred,
        .elapsed = result->elapsed.count() > 0.0 ? result->elapsed : measured,
        .destination = destination,
        .result_url = result->result_url,
        .checksum = result->checksum,
    };
    return after_success(source, std::move(success));
}

auto CopyTask::after_success(const StorageUrl& source, Succeeded success) -> CopyOutcome {
    const auto& options = context_.options();

    auto fail_after_copy = [&](infra::Error error) {
        auto outcome = fail(std::move(error));
        auto& failed = std::get<Failed>(outcome);
        failed.bytes_transferred = success.bytes_transferred;
        failed.elapsed = success.elapsed;
        return outcome;
    };

    if (options.print_version) {
        spdlog::info("Created: {}", success.result_url.url_string());
    }

    if (options.canned_acl) {
        auto* applier = context_.acl_applier();
        if (!applier) {
            return fail_after_copy(infra::make_error(infra::ErrorCode::Configuration,
                "A canned ACL was requested but no ACL applier is configured"));
        }
        // Only the destination name matters to the applier.
        const NamingShape destination_only{
            .source = "",
            .expanded_source = success.destination.url_string(),
            .names_container = false,
            .is_multi_source_request = false,
            .destination_had_existing_container = std::nullopt,
        };
        if (auto res = applier->apply(destination_only, *options.canned_acl); !res) {
            return fail_after_copy(std::move(res.error()));
        }
    }

    if (options.mode == TransferMode::Move) {
        spdlog::info("Removing {}...", source.url_string());
        if (auto res = remove_source(source); !res) {
            return fail_after_copy(std::move(res.error()));
        }
    }

    advance(State::Succeeded);
    spdlog::info("Copied {} -> {} ({} bytes in {:.3f}s)",
                 source.url_string(), success.destination.url_string(),
                 success.bytes_transferred, success.elapsed.count());
    return success;
}

auto CopyTask::remove_source(const StorageUrl& source) const -> infra::VoidResult {
    if (source.is_cloud()) {
        return context_.backend().remove(source.bucket(), source.object_name(),
                                         source.generation(), source.scheme());
    }

    std::error_code ec;
    if (!fs::remove(source.object_name(), ec)) {
        return std::unexpected(infra::make_error(
            ec ? infra::ErrorCode::PermissionDenied : infra::ErrorCode::NotFound,
            fmt::format("Cannot remove {}: {}", source.object_name(),
                        ec ? ec.message() : std::string("no such file"))));
    }
    return {};
}

auto CopyTask::fail(infra::Error error) -> CopyOutcome {
    if (error.is_fatal()) {
        return fail_run(std::move(error));
    }
    advance(State::Failed);
    spdlog::error("{}", error.message);
    const auto scope = context_.options().continue_on_error ? FailureScope::Item : FailureScope::Run;
    return Failed{.error = std::move(error), .scope = scope};
}

auto CopyTask::fail_run(infra::Error error) -> CopyOutcome {
    advance(State::Failed);
    spdlog::error("{}", error.message);
    return Failed{.error = std::move(error), .scope = FailureScope::Run};
}

auto CopyTask::skip(SkipReason reason, std::string message) -> CopyOutcome {
    advance(State::Skipped);
    spdlog::info("{}", message);
    return Skipped{.reason = reason, .message = std::move(message)};
}

} // namespace objcp::core
