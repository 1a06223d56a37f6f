#include "local_store.hpp"

#include <fmt/core.h>
#include <sys/stat.h>

namespace objcp::adapters {

namespace stdfs = std::filesystem;

LocalStore::LocalStore(std::optional<stdfs::path> bucket_root)
    : bucket_root_(std::move(bucket_root))
{}

auto LocalStore::bucket_path(const std::string& bucket) const -> infra::Result<stdfs::path> {
    if (!bucket_root_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            "Cloud URLs need a bucket root (--bucket-root or bucket_root in the config file)"));
    }
    if (bucket.empty() || bucket == "." || bucket == ".." ||
        bucket.find('/') != std::string::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Invalid bucket name \"{}\"", bucket)));
    }
    return *bucket_root_ / bucket;
}

auto LocalStore::path_for(const core::StorageUrl& url) const -> infra::Result<stdfs::path> {
    if (url.is_file()) {
        return stdfs::path(url.object_name());
    }
    if (url.is_provider()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("{} names no bucket", url.url_string())));
    }

    auto bucket = bucket_path(url.bucket());
    if (!bucket) {
        return bucket;
    }

    const stdfs::path object(url.object_name());
    for (const auto& part : object) {
        if (part == "..") {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("Object name {} leaves its bucket", url.object_name())));
        }
    }
    return *bucket / object;
}

auto LocalStore::object_name_for(const std::string& bucket, const stdfs::path& path) const -> std::string {
    auto root = bucket_path(bucket);
    if (!root) {
        return path.generic_string();
    }
    return path.lexically_relative(*root).generic_string();
}

bool LocalStore::is_internal_file(const stdfs::path& path) {
    const auto name = path.filename().string();
    return name == kVersioningMarker || name.find(".objcp-tmp.") != std::string::npos;
}

auto LocalStore::generation_of(const stdfs::path& path) -> std::optional<std::int64_t> {
    struct stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sb.st_mtim.tv_sec) * 1'000'000'000 + sb.st_mtim.tv_nsec;
}

} // namespace objcp::adapters
