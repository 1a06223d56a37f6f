#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/storage_url/storage_url.hpp"
#include "infra/error_handler/error.hpp"

namespace objcp::adapters {

/// Maps URLs onto the local filesystem. Local URLs map to themselves; cloud
/// URLs map into the emulated object store, where every bucket is a
/// directory under the bucket root and every object a file below it.
class LocalStore {
public:
    static constexpr std::string_view kVersioningMarker = ".versioning";

    explicit LocalStore(std::optional<std::filesystem::path> bucket_root);

    [[nodiscard]] auto path_for(const core::StorageUrl& url) const
        -> infra::Result<std::filesystem::path>;
    [[nodiscard]] auto bucket_path(const std::string& bucket) const
        -> infra::Result<std::filesystem::path>;

    // Object name of `path`, which must lie inside `bucket`.
    [[nodiscard]] auto object_name_for(const std::string& bucket,
                                       const std::filesystem::path& path) const -> std::string;

    // Files of the store itself that never show up as objects.
    [[nodiscard]] static auto is_internal_file(const std::filesystem::path& path) -> bool;

    // Modification time in nanoseconds, used as the object generation.
    [[nodiscard]] static auto generation_of(const std::filesystem::path& path)
        -> std::optional<std::int64_t>;

    [[nodiscard]] auto bucket_root() const -> const std::optional<std::filesystem::path>& {
        return bucket_root_;
    }

private:
    std::optional<std::filesystem::path> bucket_root_;
};

} // namespace objcp::adapters
