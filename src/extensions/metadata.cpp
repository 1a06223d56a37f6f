// metadata.cpp
#include <filesystem>
#include <expected>
#include <fmt/core.h>
#include "metadata.hpp"

namespace objcp::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;

    // Права
    const auto perms = std::filesystem::status(src, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(dst, perms, std::filesystem::perm_options::replace, ec);
    }

    // Временные метки
    if (!ec) {
        const auto time = std::filesystem::last_write_time(src, ec);
        if (!ec) {
            std::filesystem::last_write_time(dst, time, ec);
        }
    }

    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Metadata copy from {} to {} failed: {}",
                                         src.string(), dst.string(), ec.message())));
    }
    return {};
}

auto set_permissions(const std::filesystem::path& path, mode_t mode)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;
    std::filesystem::permissions(path, static_cast<std::filesystem::perms>(mode),
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(infra::make_error(
            ec == std::errc::no_such_file_or_directory ? infra::ErrorCode::NotFound
                                                       : infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot set permissions on {}: {}", path.string(), ec.message())));
    }
    return {};
}

} // namespace objcp::extensions
