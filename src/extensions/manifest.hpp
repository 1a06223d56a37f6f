#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace objcp::extensions {

enum class ManifestResult {
    Ok,
    Skip,
    Error,
};

[[nodiscard]] auto to_string(ManifestResult result) -> std::string_view;
[[nodiscard]] auto parse_manifest_result(std::string_view text) -> std::optional<ManifestResult>;

struct ManifestEntry {
    std::string source;
    std::string destination;
    std::chrono::system_clock::time_point start{};
    std::chrono::system_clock::time_point end{};
    std::string checksum;
    std::string upload_id;
    std::uint64_t source_size = 0;
    std::uint64_t bytes_transferred = 0;
    ManifestResult result = ManifestResult::Error;
    std::string description;
};

/// Durable per-item outcome log in CSV form. Rows from earlier runs are
/// loaded on open (the last row of a source wins) and new rows are appended.
/// Every append takes an exclusive flock and is fsync'ed, so worker processes
/// can share one file.
class ManifestLog {
    struct PrivateTag {};

public:
    static constexpr std::string_view kHeader =
        "Source,Destination,Start,End,Md5,UploadId,Source Size,Bytes Transferred,Result,Description";

    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> infra::Result<std::unique_ptr<ManifestLog>>;

    // Only reachable through open(), which loads the previous rows.
    ManifestLog(PrivateTag, std::filesystem::path path);

    ManifestLog(const ManifestLog&) = delete;
    ManifestLog& operator=(const ManifestLog&) = delete;

    /// True when an earlier run recorded OK or skip for this source.
    [[nodiscard]] auto was_already_handled(const std::string& source) const -> bool;
    [[nodiscard]] auto previous_entry(const std::string& source) const -> std::optional<ManifestEntry>;

    // Stages an entry; the row is written by record_outcome.
    void begin(const std::string& source, const std::string& destination,
               std::uint64_t source_size = 0);
    void record_checksum(const std::string& source, const std::string& checksum);
    void record_upload_id(const std::string& source, const std::string& upload_id);
    void record_source_size(const std::string& source, std::uint64_t size);

    /// Writes the row for `source`. Ignored when this run already wrote one.
    [[nodiscard]] auto record_outcome(const std::string& source,
                                      std::uint64_t bytes_transferred,
                                      ManifestResult result,
                                      std::string_view description = {})
        -> infra::VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    [[nodiscard]] auto load() -> infra::VoidResult;
    [[nodiscard]] auto append_row(const std::string& row) -> infra::VoidResult;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, ManifestEntry> previous_;
    std::map<std::string, ManifestEntry> pending_;
    std::set<std::string> recorded_;
};

/// CSV helpers, exposed for tests.
[[nodiscard]] auto csv_escape(std::string_view field) -> std::string;
[[nodiscard]] auto csv_parse(std::string_view content) -> std::vector<std::vector<std::string>>;
// Length of the prefix that ends with the last record terminator outside quotes.
// Anything after it is a row torn by a crash.
[[nodiscard]] auto csv_complete_length(std::string_view content) -> std::size_t;
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<std::chrono::system_clock::time_point>;

} // namespace objcp::extensions
