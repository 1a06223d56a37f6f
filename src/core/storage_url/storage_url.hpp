#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace objcp::core {

enum class BackendKind {
    LocalFile,
    RemoteObject,
};

// Parsed form of a transfer endpoint: either a local path or a cloud URL
// "<scheme>://<bucket>/<object>[#<generation>]".
class StorageUrl {
public:
    [[nodiscard]] static auto parse(std::string_view text) -> infra::Result<StorageUrl>;

    [[nodiscard]] static auto local(std::string path) -> StorageUrl;
    [[nodiscard]] static auto cloud(std::string scheme, std::string bucket,
                                    std::string object,
                                    std::optional<std::int64_t> generation = std::nullopt)
        -> StorageUrl;

    [[nodiscard]] auto kind() const -> BackendKind { return kind_; }
    [[nodiscard]] auto is_file() const -> bool { return kind_ == BackendKind::LocalFile; }
    [[nodiscard]] auto is_cloud() const -> bool { return kind_ == BackendKind::RemoteObject; }

    // "gs://" with neither bucket nor object.
    [[nodiscard]] auto is_provider() const -> bool { return is_cloud() && bucket_.empty(); }
    [[nodiscard]] auto is_bucket() const -> bool { return is_cloud() && !bucket_.empty() && object_.empty(); }
    [[nodiscard]] auto is_object() const -> bool { return is_cloud() && !object_.empty(); }
    [[nodiscard]] auto has_generation() const -> bool { return generation_.has_value(); }

    // Bucket roots and names ending in a delimiter always denote containers.
    [[nodiscard]] auto names_container_shape() const -> bool;
    [[nodiscard]] auto contains_wildcard() const -> bool;

    [[nodiscard]] auto scheme() const -> const std::string& { return scheme_; }
    [[nodiscard]] auto bucket() const -> const std::string& { return bucket_; }
    // Local path for file URLs, object name for cloud URLs.
    [[nodiscard]] auto object_name() const -> const std::string& { return object_; }
    [[nodiscard]] auto generation() const -> std::optional<std::int64_t> { return generation_; }
    [[nodiscard]] auto delimiter() const -> char { return '/'; }

    [[nodiscard]] auto url_string() const -> std::string;
    [[nodiscard]] auto versionless_url_string() const -> std::string;

    // Same URL with another object name.
    [[nodiscard]] auto with_object_name(std::string object) const -> StorageUrl;
    [[nodiscard]] auto without_generation() const -> StorageUrl;

    friend bool operator==(const StorageUrl&, const StorageUrl&) = default;

    // Empty local URL; only useful as a placeholder to assign into.
    StorageUrl() = default;

private:

    BackendKind kind_ = BackendKind::LocalFile;
    std::string scheme_ = "file";
    std::string bucket_;
    std::string object_;
    std::optional<std::int64_t> generation_;
};

[[nodiscard]] auto contains_wildcard(std::string_view text) -> bool;

} // namespace objcp::core
