#include "storage_url.hpp"

#include <charconv>
#include <fmt/core.h>

namespace objcp::core {

namespace {

constexpr std::string_view kSchemeSeparator = "://";
constexpr std::string_view kFileScheme = "file";

auto is_supported_cloud_scheme(std::string_view scheme) -> bool {
    return scheme == "gs" || scheme == "s3";
}

// Splits "name#123" into the name and its generation. Anything after '#'
// that is not a plain non-negative number stays part of the name.
auto split_generation(std::string_view object)
    -> std::pair<std::string_view, std::optional<std::int64_t>>
{
    const auto pos = object.rfind('#');
    if (pos == std::string_view::npos || pos + 1 == object.size()) {
        return {object, std::nullopt};
    }
    const auto digits = object.substr(pos + 1);
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || value < 0) {
        return {object, std::nullopt};
    }
    return {object.substr(0, pos), value};
}

} // namespace

auto contains_wildcard(std::string_view text) -> bool {
    return text.find_first_of("*?[") != std::string_view::npos;
}

auto StorageUrl::parse(std::string_view text) -> infra::Result<StorageUrl> {
    if (text.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, "Empty URL"));
    }

    const auto sep = text.find(kSchemeSeparator);
    if (sep == std::string_view::npos) {
        return local(std::string(text));
    }

    const auto scheme = text.substr(0, sep);
    const auto rest = text.substr(sep + kSchemeSeparator.size());

    if (scheme == kFileScheme) {
        if (rest.empty()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("File URL has no path: {}", text)));
        }
        return local(std::string(rest));
    }

    if (!is_supported_cloud_scheme(scheme)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Unrecognized scheme \"{}\" in {}", scheme, text)));
    }

    const auto slash = rest.find('/');
    const auto bucket = rest.substr(0, slash);
    std::string_view object;
    if (slash != std::string_view::npos) {
        object = rest.substr(slash + 1);
    }

    if (bucket.empty() && !object.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Cloud URL has an object but no bucket: {}", text)));
    }

    auto [name, generation] = split_generation(object);
    return cloud(std::string(scheme), std::string(bucket), std::string(name), generation);
}

auto StorageUrl::local(std::string path) -> StorageUrl {
    StorageUrl url;
    url.kind_ = BackendKind::LocalFile;
    url.scheme_ = std::string(kFileScheme);
    url.object_ = std::move(path);
    return url;
}

auto StorageUrl::cloud(std::string scheme, std::string bucket, std::string object,
                       std::optional<std::int64_t> generation) -> StorageUrl {
    StorageUrl url;
    url.kind_ = BackendKind::RemoteObject;
    url.scheme_ = std::move(scheme);
    url.bucket_ = std::move(bucket);
    url.object_ = std::move(object);
    url.generation_ = generation;
    return url;
}

bool StorageUrl::names_container_shape() const {
    if (is_provider() || is_bucket()) {
        return true;
    }
    return !object_.empty() && object_.back() == delimiter();
}

bool StorageUrl::contains_wildcard() const {
    return core::contains_wildcard(bucket_) || core::contains_wildcard(object_);
}

auto StorageUrl::url_string() const -> std::string {
    auto text = versionless_url_string();
    if (generation_) {
        text += fmt::format("#{}", *generation_);
    }
    return text;
}

auto StorageUrl::versionless_url_string() const -> std::string {
    if (is_file()) {
        return fmt::format("file://{}", object_);
    }
    if (bucket_.empty()) {
        return fmt::format("{}://", scheme_);
    }
    if (object_.empty()) {
        return fmt::format("{}://{}/", scheme_, bucket_);
    }
    return fmt::format("{}://{}/{}", scheme_, bucket_, object_);
}

auto StorageUrl::with_object_name(std::string object) const -> StorageUrl {
    StorageUrl url = *this;
    url.object_ = std::move(object);
    return url;
}

auto StorageUrl::without_generation() const -> StorageUrl {
    StorageUrl url = *this;
    url.generation_.reset();
    return url;
}

} // namespace objcp::core
