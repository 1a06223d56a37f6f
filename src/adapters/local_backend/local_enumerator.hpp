#pragma once

#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "adapters/local_backend/local_store.hpp"
#include "adapters/transfer_backend.hpp"

namespace objcp::adapters {

/// Expands local paths and emulated bucket URLs, including `*`, `?` and
/// `[...]` wildcards in the final segments and recursive directory walks.
class LocalNameExpander final : public NameExpander {
public:
    explicit LocalNameExpander(LocalStore store);

    [[nodiscard]] auto expand_destination(const std::string& token)
        -> infra::Result<ExpandedDestination> override;

    [[nodiscard]] auto enumerate(std::vector<std::string> tokens,
                                 const EnumerationOptions& options,
                                 bool have_existing_destination_container)
        -> std::unique_ptr<SourceEnumerator> override;

private:
    LocalStore store_;
};

// One concrete item a source token expanded to.
struct ExpandedItem {
    core::StorageUrl url;
    std::filesystem::path path;
    bool is_directory = false;
};

/// Lists what a single token names. Exposed for tests.
[[nodiscard]] auto expand_token(const LocalStore& store, const core::StorageUrl& url,
                                bool exclude_symlinks)
    -> infra::Result<std::vector<ExpandedItem>>;

class LocalSourceEnumerator final : public SourceEnumerator {
public:
    LocalSourceEnumerator(LocalStore store, std::vector<std::string> tokens,
                          EnumerationOptions options, bool have_existing_destination_container);

    [[nodiscard]] auto next() -> std::optional<infra::Result<core::NamingShape>> override;

private:
    struct Walk {
        std::string source;           // the token that named the directory
        core::StorageUrl root_url;
        std::filesystem::recursive_directory_iterator it;
    };

    [[nodiscard]] auto next_from_walk() -> std::optional<core::NamingShape>;
    [[nodiscard]] auto load_next_token() -> std::optional<infra::Error>;
    [[nodiscard]] auto item_url(const core::StorageUrl& like, const std::filesystem::path& path) const
        -> core::StorageUrl;
    [[nodiscard]] auto make_shape(std::string source, const core::StorageUrl& item, bool names_container) const
        -> core::NamingShape;

    LocalStore store_;
    std::vector<std::string> tokens_;
    EnumerationOptions options_;
    bool have_existing_destination_container_;

    std::size_t next_token_ = 0;
    std::string current_token_;
    std::deque<ExpandedItem> pending_;
    std::optional<Walk> walk_;
    bool multi_source_ = false;
};

} // namespace objcp::adapters
