#pragma once

#include <optional>
#include <string_view>
#include <sys/types.h>
#include "adapters/local_backend/local_store.hpp"
#include "adapters/transfer_backend.hpp"

namespace objcp::adapters {

/// Canned ACLs of the emulated store map onto POSIX permission bits:
///   private                    0600
///   project-private            0640
///   bucket-owner-full-control  0660
///   public-read, authenticated-read, bucket-owner-read  0644
///   public-read-write          0666
class CannedAclApplier final : public AclApplier {
public:
    explicit CannedAclApplier(LocalStore store);

    [[nodiscard]] auto apply(const core::NamingShape& destination,
                             const std::string& canned_acl) -> infra::VoidResult override;

    [[nodiscard]] static auto mode_for(std::string_view canned_acl) -> std::optional<mode_t>;
    [[nodiscard]] static auto is_known(std::string_view canned_acl) -> bool {
        return mode_for(canned_acl).has_value();
    }

private:
    LocalStore store_;
};

} // namespace objcp::adapters
