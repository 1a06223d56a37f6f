#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/name_resolver/naming_shape.hpp"
#include "core/storage_url/storage_url.hpp"
#include "infra/error_handler/error.hpp"

namespace objcp::adapters {

struct TransferOptions {
    bool no_clobber = false;
    bool preserve_acl = false;
    bool verify = false;
};

struct TransferResult {
    std::uint64_t bytes_transferred = 0;
    std::uint64_t source_size = 0;
    std::chrono::duration<double> elapsed{0.0};
    core::StorageUrl result_url;               // may carry a generation
    std::optional<std::string> checksum;       // hex digest of the content
    std::optional<std::string> upload_id;      // resumable session, if any
};

struct VersioningState {
    bool enabled = false;
};

/// Moves bytes between two endpoints. Implementations must be safe to call
/// from several threads at once.
class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    /// Fails with ItemExists / PreconditionFailed on a no-clobber violation,
    /// NotFound when a required container is missing, another code otherwise.
    [[nodiscard]] virtual auto transfer(const core::StorageUrl& source,
                                        const core::StorageUrl& destination,
                                        const TransferOptions& options)
        -> infra::Result<TransferResult> = 0;

    /// Fails with NotFound when the item is already gone.
    [[nodiscard]] virtual auto remove(const std::string& bucket,
                                      const std::string& object,
                                      std::optional<std::int64_t> generation,
                                      const std::string& scheme)
        -> infra::VoidResult = 0;

    /// Fails with AccessDenied when the caller may not read the setting.
    [[nodiscard]] virtual auto get_versioning_state(const core::StorageUrl& bucket)
        -> infra::Result<VersioningState> = 0;
};

/// Applies a canned ACL to one destination item.
class AclApplier {
public:
    virtual ~AclApplier() = default;

    [[nodiscard]] virtual auto apply(const core::NamingShape& destination,
                                     const std::string& canned_acl)
        -> infra::VoidResult = 0;
};

/// Lazy, single pass sequence of naming descriptors.
class SourceEnumerator {
public:
    virtual ~SourceEnumerator() = default;

    /// std::nullopt marks the end of the sequence. An error describes one
    /// source token that could not be expanded; the sequence continues.
    [[nodiscard]] virtual auto next() -> std::optional<infra::Result<core::NamingShape>> = 0;
};

struct ExpandedDestination {
    core::StorageUrl url;
    bool have_existing_container = false;
};

struct EnumerationOptions {
    bool recursive = false;
    bool all_versions = false;
    bool exclude_symlinks = false;
};

/// Expands source and destination tokens against a storage namespace.
class NameExpander {
public:
    virtual ~NameExpander() = default;

    [[nodiscard]] virtual auto expand_destination(const std::string& token)
        -> infra::Result<ExpandedDestination> = 0;

    [[nodiscard]] virtual auto enumerate(std::vector<std::string> tokens,
                                         const EnumerationOptions& options,
                                         bool have_existing_destination_container)
        -> std::unique_ptr<SourceEnumerator> = 0;
};

} // namespace objcp::adapters
