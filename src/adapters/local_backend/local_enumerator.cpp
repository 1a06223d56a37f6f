#include "local_enumerator.hpp"

#include <glob.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace objcp::adapters {

namespace stdfs = std::filesystem;

namespace {

// Local items keep the plain path form of their token, cloud items the URL.
auto display(const core::StorageUrl& url) -> std::string {
    return url.is_file() ? url.object_name() : url.url_string();
}

auto glob_paths(const stdfs::path& pattern) -> std::vector<stdfs::path> {
    glob_t matches{};
    std::vector<stdfs::path> paths;
    const int rc = ::glob(pattern.c_str(), 0, nullptr, &matches);
    if (rc == 0) {
        paths.reserve(matches.gl_pathc);
        for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
            paths.emplace_back(matches.gl_pathv[i]);
        }
    } else if (rc != GLOB_NOMATCH) {
        spdlog::warn("Wildcard expansion of {} failed (glob error {})", pattern.string(), rc);
    }
    ::globfree(&matches);
    return paths;
}

} // namespace

auto expand_token(const LocalStore& store, const core::StorageUrl& url, bool exclude_symlinks)
    -> infra::Result<std::vector<ExpandedItem>>
{
    auto base = store.path_for(url);
    if (!base) {
        return std::unexpected(std::move(base.error()));
    }

    std::vector<stdfs::path> candidates;
    if (url.contains_wildcard()) {
        candidates = glob_paths(*base);
    } else {
        std::error_code ec;
        if (stdfs::exists(stdfs::symlink_status(*base, ec))) {
            candidates.push_back(*base);
        }
    }

    std::vector<ExpandedItem> items;
    for (auto& path : candidates) {
        std::error_code ec;
        if (LocalStore::is_internal_file(path)) continue;
        if (exclude_symlinks && stdfs::is_symlink(path, ec)) continue;

        ExpandedItem item{.url = url, .path = path, .is_directory = stdfs::is_directory(path, ec)};
        if (url.is_file()) {
            item.url = core::StorageUrl::local(path.string());
        } else if (url.contains_wildcard()) {
            item.url = core::StorageUrl::cloud(url.scheme(), url.bucket(),
                                               store.object_name_for(url.bucket(), path),
                                               url.generation());
        }
        items.push_back(std::move(item));
    }
    return items;
}

LocalNameExpander::LocalNameExpander(LocalStore store)
    : store_(std::move(store))
{}

auto LocalNameExpander::expand_destination(const std::string& token)
    -> infra::Result<ExpandedDestination>
{
    auto url = core::StorageUrl::parse(token);
    if (!url) {
        return std::unexpected(std::move(url.error()));
    }

    if (url->contains_wildcard()) {
        auto items = expand_token(store_, *url, false);
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        if (items->size() != 1) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
                fmt::format("Destination ({}) must match exactly 1 URL", token)));
        }
        url = items->front().url;
    }

    ExpandedDestination expanded{.url = *url, .have_existing_container = false};
    if (url->is_provider()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Configuration,
            fmt::format("Provider-only URL {} cannot be a destination", token)));
    }
    if (url->is_bucket()) {
        expanded.have_existing_container = true;
        return expanded;
    }

    // Local directory, or a bucket prefix that already holds objects.
    auto path = store_.path_for(*url);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }
    std::error_code ec;
    expanded.have_existing_container = stdfs::is_directory(*path, ec);
    return expanded;
}

auto LocalNameExpander::enumerate(std::vector<std::string> tokens,
                                  const EnumerationOptions& options,
                                  bool have_existing_destination_container)
    -> std::unique_ptr<SourceEnumerator>
{
    return std::make_unique<LocalSourceEnumerator>(store_, std::move(tokens), options,
                                                   have_existing_destination_container);
}

LocalSourceEnumerator::LocalSourceEnumerator(LocalStore store, std::vector<std::string> tokens,
                                             EnumerationOptions options,
                                             bool have_existing_destination_container)
    : store_(std::move(store))
    , tokens_(std::move(tokens))
    , options_(options)
    , have_existing_destination_container_(have_existing_destination_container)
    , multi_source_(tokens_.size() > 1)
{}

auto LocalSourceEnumerator::item_url(const core::StorageUrl& like, const stdfs::path& path) const
    -> core::StorageUrl
{
    if (like.is_file()) {
        return core::StorageUrl::local(path.string());
    }
    std::optional<std::int64_t> generation;
    if (options_.all_versions) {
        generation = LocalStore::generation_of(path);
    }
    return core::StorageUrl::cloud(like.scheme(), like.bucket(),
                                   store_.object_name_for(like.bucket(), path), generation);
}

auto LocalSourceEnumerator::make_shape(std::string source, const core::StorageUrl& item,
                                       bool names_container) const -> core::NamingShape
{
    return core::NamingShape{
        .source = std::move(source),
        .expanded_source = display(item),
        .names_container = names_container,
        .is_multi_source_request = multi_source_,
        .destination_had_existing_container = have_existing_destination_container_,
    };
}

auto LocalSourceEnumerator::next_from_walk() -> std::optional<core::NamingShape> {
    auto& walk = *walk_;
    const stdfs::recursive_directory_iterator end;
    std::error_code ec;

    while (walk.it != end) {
        const auto entry = *walk.it;
        walk.it.increment(ec);
        if (ec) {
            spdlog::warn("Listing {} stopped early: {}", walk.source, ec.message());
            walk.it = end;
        }

        if (LocalStore::is_internal_file(entry.path())) continue;
        if (options_.exclude_symlinks && entry.is_symlink(ec)) continue;
        if (!entry.is_regular_file(ec)) continue;

        return make_shape(walk.source, item_url(walk.root_url, entry.path()), true);
    }
    walk_.reset();
    return std::nullopt;
}

auto LocalSourceEnumerator::load_next_token() -> std::optional<infra::Error> {
    current_token_ = tokens_[next_token_++];

    auto url = core::StorageUrl::parse(current_token_);
    if (!url) {
        return std::move(url.error());
    }

    auto items = expand_token(store_, *url, options_.exclude_symlinks);
    if (!items) {
        return std::move(items.error());
    }
    if (items->empty()) {
        return infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("No URLs matched: {}", current_token_));
    }

    if (items->size() > 1) {
        multi_source_ = true;
    }
    for (const auto& item : *items) {
        if (item.is_directory && options_.recursive) {
            multi_source_ = true;
        }
    }
    pending_.assign(std::make_move_iterator(items->begin()), std::make_move_iterator(items->end()));

    if (options_.all_versions) {
        spdlog::debug("Listing all object versions for {}", current_token_);
    }
    return std::nullopt;
}

auto LocalSourceEnumerator::next() -> std::optional<infra::Result<core::NamingShape>> {
    while (true) {
        if (walk_) {
            if (auto shape = next_from_walk()) {
                return *shape;
            }
            continue;
        }

        if (!pending_.empty()) {
            auto item = std::move(pending_.front());
            pending_.pop_front();

            if (!item.is_directory) {
                auto url = item.url;
                if (url.is_cloud() && options_.all_versions && !url.has_generation()) {
                    url = item_url(url, item.path);
                }
                return make_shape(current_token_, url, false);
            }

            if (!options_.recursive) {
                spdlog::info("Omitting directory \"{}\". (Did you mean to do cp -r?)", display(item.url));
                continue;
            }

            std::error_code ec;
            stdfs::recursive_directory_iterator it(
                item.path, stdfs::directory_options::skip_permission_denied, ec);
            if (ec) {
                return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                    fmt::format("Cannot list {}: {}", display(item.url), ec.message())));
            }
            // The token stays the source, wildcard or not; the resolver
            // mirrors the matched directory below the token's parent.
            walk_.emplace(Walk{.source = current_token_, .root_url = item.url, .it = std::move(it)});
            continue;
        }

        if (next_token_ >= tokens_.size()) {
            return std::nullopt;
        }
        if (auto error = load_next_token()) {
            return std::unexpected(std::move(*error));
        }
    }
}

} // namespace objcp::adapters
