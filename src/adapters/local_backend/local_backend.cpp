#include "local_backend.hpp"

#include <chrono>
#include <fstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include "adapters/fs.hpp"
#include "extensions/metadata.hpp"
#include "infra/hash/xxhash_verifier.hpp"

namespace objcp::adapters {

namespace stdfs = std::filesystem;

LocalTransferBackend::LocalTransferBackend(LocalStore store)
    : store_(std::move(store))
{}

auto LocalTransferBackend::source_path(const core::StorageUrl& source) const
    -> infra::Result<stdfs::path>
{
    auto path = store_.path_for(source);
    if (!path) {
        return path;
    }

    std::error_code ec;
    const auto status = stdfs::status(*path, ec);
    if (!stdfs::exists(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No such object: {}", source.url_string())));
    }
    if (!stdfs::is_regular_file(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidSource,
            fmt::format("{} is not a file", source.url_string())));
    }

    if (source.is_cloud() && source.has_generation() &&
        LocalStore::generation_of(*path) != source.generation()) {
        // Only the live generation is kept.
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No such object version: {}", source.url_string())));
    }
    return path;
}

auto LocalTransferBackend::destination_path(const core::StorageUrl& destination) const
    -> infra::Result<stdfs::path>
{
    auto path = store_.path_for(destination);
    if (!path) {
        return path;
    }

    std::error_code ec;
    if (destination.is_cloud()) {
        auto bucket = store_.bucket_path(destination.bucket());
        if (!bucket) {
            return std::unexpected(std::move(bucket.error()));
        }
        if (!stdfs::is_directory(*bucket, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
                fmt::format("Bucket {}://{} does not exist", destination.scheme(), destination.bucket())));
        }
    }

    // Object prefixes and local sub-directories come into existence on write.
    const auto parent = path->parent_path();
    if (!parent.empty()) {
        stdfs::create_directories(parent, ec);
        if (ec && !stdfs::is_directory(parent)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot create {}: {}", parent.string(), ec.message())));
        }
    }
    return path;
}

auto LocalTransferBackend::transfer(const core::StorageUrl& source,
                                    const core::StorageUrl& destination,
                                    const TransferOptions& options)
    -> infra::Result<TransferResult>
{
    const auto start = std::chrono::steady_clock::now();

    auto src = source_path(source);
    if (!src) {
        return std::unexpected(std::move(src.error()));
    }
    auto dst = destination_path(destination);
    if (!dst) {
        return std::unexpected(std::move(dst.error()));
    }

    // Cheap early skip; the publish step below is what settles a race.
    std::error_code ec;
    if (options.no_clobber && stdfs::exists(*dst, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ItemExists,
            fmt::format("{} already exists", destination.url_string())));
    }

    auto copied = fs::copy_file_atomic(*src, *dst, !options.no_clobber);
    if (!copied) {
        return std::unexpected(std::move(copied.error()));
    }

    if (options.preserve_acl) {
        if (auto res = extensions::copy_metadata(*src, *dst); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    if (options.verify) {
        auto same = infra::XXHashVerifier::verify_files(*src, *dst);
        if (!same) {
            return std::unexpected(std::move(same.error()));
        }
        if (!*same) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
                fmt::format("Verification failed for {}", destination.url_string())));
        }
    }

    auto hash = infra::XXHashVerifier::hash_file(*dst);
    if (!hash) {
        return std::unexpected(std::move(hash.error()));
    }

    core::StorageUrl result_url = destination;
    if (destination.is_cloud()) {
        result_url = core::StorageUrl::cloud(destination.scheme(), destination.bucket(),
                                             destination.object_name(),
                                             LocalStore::generation_of(*dst));
    }

    return TransferResult{
        .bytes_transferred = *copied,
        .source_size = *copied,
        .elapsed = std::chrono::steady_clock::now() - start,
        .result_url = std::move(result_url),
        .checksum = infra::XXHashVerifier::to_hex(*hash),
        .upload_id = std::nullopt,
    };
}

auto LocalTransferBackend::remove(const std::string& bucket,
                                  const std::string& object,
                                  std::optional<std::int64_t> generation,
                                  const std::string& scheme)
    -> infra::VoidResult
{
    const auto url = core::StorageUrl::cloud(scheme, bucket, object, generation);
    auto path = source_path(url);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }

    std::error_code ec;
    if (!stdfs::remove(*path, ec) || ec) {
        return std::unexpected(infra::make_error(
            ec ? infra::ErrorCode::PermissionDenied : infra::ErrorCode::NotFound,
            fmt::format("Cannot delete {}: {}", url.url_string(), ec ? ec.message() : "not found")));
    }

    // Prefix directories only exist while they hold objects.
    auto bucket_dir = store_.bucket_path(bucket);
    for (auto dir = path->parent_path();
         bucket_dir && dir != *bucket_dir && dir.has_relative_path();
         dir = dir.parent_path()) {
        if (!stdfs::is_empty(dir, ec) || ec || !stdfs::remove(dir, ec)) {
            break;
        }
    }
    return {};
}

auto LocalTransferBackend::get_versioning_state(const core::StorageUrl& bucket)
    -> infra::Result<VersioningState>
{
    auto dir = store_.bucket_path(bucket.bucket());
    if (!dir) {
        return std::unexpected(std::move(dir.error()));
    }

    std::error_code ec;
    if (!stdfs::is_directory(*dir, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("Bucket {}://{} does not exist", bucket.scheme(), bucket.bucket())));
    }
    if (::access(dir->c_str(), R_OK | X_OK) != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AccessDenied,
            fmt::format("Access denied reading configuration of {}://{}", bucket.scheme(), bucket.bucket())));
    }

    VersioningState state;
    std::ifstream marker(*dir / LocalStore::kVersioningMarker);
    std::string value;
    if (marker && std::getline(marker, value)) {
        state.enabled = value == "Enabled";
    }
    return state;
}

} // namespace objcp::adapters
