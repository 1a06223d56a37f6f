#pragma once

#include "adapters/local_backend/local_store.hpp"
#include "adapters/transfer_backend.hpp"

namespace objcp::adapters {

/// TransferBackend over local files and the directory-emulated object store.
/// Holds no per-item state, so one instance serves every worker.
class LocalTransferBackend final : public TransferBackend {
public:
    explicit LocalTransferBackend(LocalStore store);

    [[nodiscard]] auto transfer(const core::StorageUrl& source,
                                const core::StorageUrl& destination,
                                const TransferOptions& options)
        -> infra::Result<TransferResult> override;

    [[nodiscard]] auto remove(const std::string& bucket,
                              const std::string& object,
                              std::optional<std::int64_t> generation,
                              const std::string& scheme)
        -> infra::VoidResult override;

    [[nodiscard]] auto get_versioning_state(const core::StorageUrl& bucket)
        -> infra::Result<VersioningState> override;

private:
    [[nodiscard]] auto source_path(const core::StorageUrl& source) const
        -> infra::Result<std::filesystem::path>;
    [[nodiscard]] auto destination_path(const core::StorageUrl& destination) const
        -> infra::Result<std::filesystem::path>;

    LocalStore store_;
};

} // namespace objcp::adapters
