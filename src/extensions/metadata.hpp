// include/objcp/extensions/metadata.hpp
#pragma once

#include <filesystem>
#include <sys/stat.h>
#include "infra/error_handler/error.hpp"

namespace objcp::extensions {

// Carries permissions and modification time over to `dst`; this is what
// preserving an ACL means for local files and emulated objects.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>;

[[nodiscard]] auto set_permissions(const std::filesystem::path& path, mode_t mode)
    -> std::expected<void, infra::Error>;

} // namespace objcp::extensions
