#include "canned_acl.hpp"

#include <array>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "extensions/metadata.hpp"

namespace objcp::adapters {

namespace {

constexpr std::array<std::pair<std::string_view, mode_t>, 7> kCannedAcls{{
    {"private", 0600},
    {"project-private", 0640},
    {"bucket-owner-full-control", 0660},
    {"public-read", 0644},
    {"authenticated-read", 0644},
    {"bucket-owner-read", 0644},
    {"public-read-write", 0666},
}};

} // namespace

CannedAclApplier::CannedAclApplier(LocalStore store)
    : store_(std::move(store))
{}

auto CannedAclApplier::mode_for(std::string_view canned_acl) -> std::optional<mode_t> {
    for (const auto& [name, mode] : kCannedAcls) {
        if (name == canned_acl) return mode;
    }
    return std::nullopt;
}

auto CannedAclApplier::apply(const core::NamingShape& destination,
                             const std::string& canned_acl) -> infra::VoidResult
{
    const auto mode = mode_for(canned_acl);
    if (!mode) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            fmt::format("Unknown canned ACL \"{}\"", canned_acl)));
    }

    auto url = core::StorageUrl::parse(destination.expanded_source);
    if (!url) {
        return std::unexpected(std::move(url.error()));
    }
    auto path = store_.path_for(*url);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }

    spdlog::debug("Applying canned ACL {} ({:o}) to {}", canned_acl, *mode, url->url_string());
    return extensions::set_permissions(*path, *mode);
}

} // namespace objcp::adapters
