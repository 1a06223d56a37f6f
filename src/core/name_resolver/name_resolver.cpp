#include "name_resolver.hpp"

#include <filesystem>
#include <string_view>

namespace objcp::core {

namespace {

auto trim_trailing(std::string_view text, char delim) -> std::string_view {
    while (text.size() > 1 && text.back() == delim) {
        text.remove_suffix(1);
    }
    return text;
}

auto trim_leading(std::string_view text, char delim) -> std::string_view {
    while (!text.empty() && text.front() == delim) {
        text.remove_prefix(1);
    }
    return text;
}

auto final_component(std::string_view path, char delim) -> std::string_view {
    path = trim_trailing(path, delim);
    const auto pos = path.rfind(delim);
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

// "a/b/c" -> "b/c"; "a" -> ""
auto drop_first_segment(std::string_view path, char delim) -> std::string_view {
    const auto pos = path.find(delim);
    return pos == std::string_view::npos ? std::string_view{} : trim_leading(path.substr(pos + 1), delim);
}

auto first_segment(std::string_view path, char delim) -> std::string_view {
    return path.substr(0, path.find(delim));
}

auto is_dot_directory(std::string_view name) -> bool {
    return name == "." || name == "..";
}

auto container_relative_name(const StorageUrl& source,
                             const StorageUrl& expanded_source,
                             bool keep_root_segment) -> std::string
{
    const char delim = source.delimiter();
    const auto root = trim_trailing(source.object_name(), delim);
    const auto cut = root.rfind(delim);
    const auto parent = cut == std::string_view::npos ? std::string_view{} : root.substr(0, cut + 1);
    const auto root_name = cut == std::string_view::npos ? root : root.substr(cut + 1);

    std::string_view expanded = expanded_source.object_name();
    if (!expanded.starts_with(parent)) {
        // The expansion root is not a prefix (e.g. a wildcard in a parent
        // segment); the item keeps only its own name.
        return std::string(final_component(expanded, delim));
    }

    auto relative = trim_leading(expanded.substr(parent.size()), delim);

    if (is_dot_directory(root_name)) {
        // "cp -r . dst" names items "dst/x", never "dst/./x".
        if (first_segment(relative, delim) == root_name) {
            relative = drop_first_segment(relative, delim);
        }
    } else if (!root_name.empty() && !keep_root_segment) {
        relative = drop_first_segment(relative, delim);
    }

    if (relative.empty()) {
        const auto base = is_dot_directory(root_name) || root_name.empty()
            ? final_component(expanded, delim)
            : root_name;
        return std::string(base);
    }
    return std::string(relative);
}

auto join(const StorageUrl& destination, std::string_view key) -> StorageUrl {
    const char delim = destination.delimiter();
    std::string name = destination.object_name();

    if (!name.empty() && name.back() != delim) {
        name.push_back(delim);
    }
    name.append(key);

    if (destination.is_file()) {
        // Remote names always use '/', local paths use the platform separator.
        name = std::filesystem::path(name).make_preferred().string();
    }
    return destination.with_object_name(std::move(name));
}

} // namespace

auto resolve_destination(const StorageUrl& source,
                         const StorageUrl& expanded_source,
                         bool names_container,
                         bool is_multi_source,
                         const StorageUrl& destination,
                         std::optional<bool> destination_had_existing_container)
    -> StorageUrl
{
    if (!is_multi_source &&
        !destination_had_existing_container.value_or(false) &&
        !destination.names_container_shape()) {
        // One item to one item.
        return destination;
    }

    std::string key;
    if (names_container) {
        const bool keep_root = destination.is_bucket() ||
                               destination_had_existing_container.value_or(true);
        key = container_relative_name(source, expanded_source, keep_root);
    } else {
        key = std::string(final_component(expanded_source.object_name(), expanded_source.delimiter()));
    }

    return join(destination, key);
}

auto resolve_destination(const NamingShape& shape, const StorageUrl& destination)
    -> infra::Result<StorageUrl>
{
    auto source = StorageUrl::parse(shape.source);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    auto expanded = StorageUrl::parse(shape.expanded_source);
    if (!expanded) {
        return std::unexpected(std::move(expanded.error()));
    }

    return resolve_destination(*source, *expanded, shape.names_container,
                               shape.is_multi_source_request, destination,
                               shape.destination_had_existing_container);
}

} // namespace objcp::core
