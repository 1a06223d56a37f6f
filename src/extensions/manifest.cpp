// manifest.cpp
#include "manifest.hpp"

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace objcp::extensions {

namespace {

enum Column : std::size_t {
    kSource = 0,
    kDestination,
    kStart,
    kEnd,
    kChecksum,
    kUploadId,
    kSourceSize,
    kBytesTransferred,
    kResult,
    kDescription,
    kColumnCount,
};

auto parse_u64(std::string_view text) -> std::uint64_t {
    std::uint64_t value = 0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

// Releases the flock and the descriptor on every exit path.
class LockedFile {
public:
    explicit LockedFile(const std::filesystem::path& path)
        : fd_(::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644))
    {
        if (fd_ != -1 && ::flock(fd_, LOCK_EX) == -1) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ~LockedFile() {
        if (fd_ != -1) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    LockedFile(const LockedFile&) = delete;
    LockedFile& operator=(const LockedFile&) = delete;

    [[nodiscard]] auto ok() const -> bool { return fd_ != -1; }

    [[nodiscard]] auto size() const -> off_t {
        return ::lseek(fd_, 0, SEEK_END);
    }

    [[nodiscard]] auto ends_with_newline() const -> bool {
        const auto end = size();
        char last = 0;
        return end > 0 && ::pread(fd_, &last, 1, end - 1) == 1 && last == '\n';
    }

    [[nodiscard]] auto read_all() const -> std::optional<std::string> {
        const auto end = size();
        if (end < 0) {
            return std::nullopt;
        }
        std::string content(static_cast<std::size_t>(end), '\0');
        std::size_t done = 0;
        while (done < content.size()) {
            const auto n = ::pread(fd_, content.data() + done, content.size() - done,
                                   static_cast<off_t>(done));
            if (n == -1) {
                if (errno == EINTR) continue;
                return std::nullopt;
            }
            if (n == 0) break;
            done += static_cast<std::size_t>(n);
        }
        content.resize(done);
        return content;
    }

    // Cuts a row torn by a crash so the next append starts a fresh record.
    [[nodiscard]] auto drop_torn_tail(const std::string& content) -> bool {
        const auto complete = csv_complete_length(content);
        if (complete == content.size()) {
            return true;
        }
        spdlog::warn("Manifest ends with an incomplete row ({} bytes); discarding it",
                     content.size() - complete);
        return ::ftruncate(fd_, static_cast<off_t>(complete)) == 0;
    }

    [[nodiscard]] auto write_all(std::string_view data) -> bool {
        while (!data.empty()) {
            const auto n = ::write(fd_, data.data(), data.size());
            if (n == -1) {
                if (errno == EINTR) continue;
                return false;
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return ::fsync(fd_) == 0;
    }

private:
    int fd_;
};

} // namespace

auto to_string(ManifestResult result) -> std::string_view {
    switch (result) {
        case ManifestResult::Ok:    return "OK";
        case ManifestResult::Skip:  return "skip";
        case ManifestResult::Error: return "error";
    }
    return "error";
}

auto parse_manifest_result(std::string_view text) -> std::optional<ManifestResult> {
    if (text == "OK") return ManifestResult::Ok;
    if (text == "skip") return ManifestResult::Skip;
    if (text == "error") return ManifestResult::Error;
    return std::nullopt;
}

auto csv_escape(std::string_view field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

auto csv_parse(std::string_view content) -> std::vector<std::vector<std::string>> {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool quoted = false;
    bool record_started = false;

    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                quoted = true;
                record_started = true;
                break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                record_started = true;
                break;
            case '\r':
                break;
            case '\n':
                if (record_started || !field.empty()) {
                    record.push_back(std::move(field));
                    records.push_back(std::move(record));
                }
                field.clear();
                record.clear();
                record_started = false;
                break;
            default:
                field.push_back(c);
                record_started = true;
                break;
        }
    }

    // Last record without a trailing newline; short rows are dropped by the loader.
    if (!quoted && (record_started || !field.empty())) {
        record.push_back(std::move(field));
        records.push_back(std::move(record));
    }
    return records;
}

auto csv_complete_length(std::string_view content) -> std::size_t {
    std::size_t complete = 0;
    bool quoted = false;
    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (c == '"') {
            // A doubled quote inside a quoted field flips twice and stays quoted.
            quoted = !quoted;
        } else if (c == '\n' && !quoted) {
            complete = i + 1;
        }
    }
    return complete;
}

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    using namespace std::chrono;
    const auto since_epoch = duration_cast<microseconds>(tp.time_since_epoch());
    const auto secs = floor<seconds>(since_epoch);
    const auto micros = (since_epoch - secs).count();
    const std::time_t t = static_cast<std::time_t>(secs.count());

    std::tm utc{};
    ::gmtime_r(&t, &utc);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, micros);
}

auto parse_timestamp(std::string_view text) -> std::optional<std::chrono::system_clock::time_point> {
    std::tm utc{};
    long micros = 0;
    const std::string copy(text);
    const int fields = std::sscanf(copy.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6ldZ",
                                   &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                                   &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &micros);
    if (fields < 6) {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    const std::time_t t = ::timegm(&utc);
    return std::chrono::system_clock::from_time_t(t) + std::chrono::microseconds(micros);
}

ManifestLog::ManifestLog(PrivateTag, std::filesystem::path path)
    : path_(std::move(path))
{}

auto ManifestLog::open(const std::filesystem::path& path)
    -> infra::Result<std::unique_ptr<ManifestLog>>
{
    auto log = std::make_unique<ManifestLog>(PrivateTag{}, path);
    if (auto res = log->load(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return log;
}

auto ManifestLog::load() -> infra::VoidResult {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return {};
    }

    LockedFile file(path_);
    auto content = file.ok() ? file.read_all() : std::nullopt;
    if (!content) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot open manifest {}: {}", path_.string(), std::strerror(errno))));
    }
    if (!file.drop_torn_tail(*content)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Cannot repair manifest {}: {}", path_.string(), std::strerror(errno))));
    }
    content->resize(csv_complete_length(*content));

    std::size_t loaded = 0;
    for (auto& record : csv_parse(*content)) {
        if (record.size() != kColumnCount || record[kSource] == "Source") {
            continue;
        }
        auto result = parse_manifest_result(record[kResult]);
        if (!result) {
            spdlog::warn("Ignoring manifest row with unknown result \"{}\" for {}",
                         record[kResult], record[kSource]);
            continue;
        }

        ManifestEntry entry;
        entry.source = record[kSource];
        entry.destination = record[kDestination];
        entry.start = parse_timestamp(record[kStart]).value_or(std::chrono::system_clock::time_point{});
        entry.end = parse_timestamp(record[kEnd]).value_or(std::chrono::system_clock::time_point{});
        entry.checksum = record[kChecksum];
        entry.upload_id = record[kUploadId];
        entry.source_size = parse_u64(record[kSourceSize]);
        entry.bytes_transferred = parse_u64(record[kBytesTransferred]);
        entry.result = *result;
        entry.description = record[kDescription];

        previous_[entry.source] = std::move(entry);
        ++loaded;
    }

    spdlog::debug("Loaded {} manifest rows from {}", loaded, path_.string());
    return {};
}

bool ManifestLog::was_already_handled(const std::string& source) const {
    std::lock_guard lock(mutex_);
    auto it = previous_.find(source);
    return it != previous_.end() &&
           (it->second.result == ManifestResult::Ok || it->second.result == ManifestResult::Skip);
}

auto ManifestLog::previous_entry(const std::string& source) const -> std::optional<ManifestEntry> {
    std::lock_guard lock(mutex_);
    auto it = previous_.find(source);
    if (it == previous_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ManifestLog::begin(const std::string& source, const std::string& destination,
                        std::uint64_t source_size) {
    std::lock_guard lock(mutex_);
    auto& entry = pending_[source];
    entry.source = source;
    entry.destination = destination;
    entry.source_size = source_size;
    entry.start = std::chrono::system_clock::now();
}

void ManifestLog::record_checksum(const std::string& source, const std::string& checksum) {
    std::lock_guard lock(mutex_);
    pending_[source].checksum = checksum;
}

void ManifestLog::record_upload_id(const std::string& source, const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    pending_[source].upload_id = upload_id;
}

void ManifestLog::record_source_size(const std::string& source, std::uint64_t size) {
    std::lock_guard lock(mutex_);
    pending_[source].source_size = size;
}

auto ManifestLog::record_outcome(const std::string& source,
                                 std::uint64_t bytes_transferred,
                                 ManifestResult result,
                                 std::string_view description)
    -> infra::VoidResult
{
    std::lock_guard lock(mutex_);
    if (!recorded_.insert(source).second) {
        spdlog::debug("Manifest already has an entry for {} from this run", source);
        return {};
    }

    auto node = pending_.extract(source);
    ManifestEntry entry = node.empty() ? ManifestEntry{} : std::move(node.mapped());
    entry.source = source;
    if (entry.start == std::chrono::system_clock::time_point{}) {
        entry.start = std::chrono::system_clock::now();
    }
    entry.end = std::chrono::system_clock::now();
    entry.bytes_transferred = bytes_transferred;
    entry.result = result;
    entry.description = std::string(description);

    const auto row = fmt::format("{},{},{},{},{},{},{},{},{},{}\n",
        csv_escape(entry.source),
        csv_escape(entry.destination),
        format_timestamp(entry.start),
        format_timestamp(entry.end),
        csv_escape(entry.checksum),
        csv_escape(entry.upload_id),
        entry.source_size,
        entry.bytes_transferred,
        to_string(entry.result),
        csv_escape(entry.description));

    return append_row(row);
}

auto ManifestLog::append_row(const std::string& row) -> infra::VoidResult {
    // Opened per row so that forked workers never share a lock owner.
    LockedFile file(path_);
    if (!file.ok()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot append to manifest {}: {}", path_.string(), std::strerror(errno))));
    }

    // Another run may have crashed mid-row since this log was opened.
    if (file.size() > 0 && !file.ends_with_newline()) {
        auto content = file.read_all();
        if (!content || !file.drop_torn_tail(*content)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                fmt::format("Cannot repair manifest {}: {}", path_.string(), std::strerror(errno))));
        }
    }

    std::string data;
    if (file.size() == 0) {
        data = fmt::format("{}\n", kHeader);
    }
    data += row;

    if (!file.write_all(data)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Failed to write manifest {}: {}", path_.string(), std::strerror(errno))));
    }
    return {};
}

} // namespace objcp::extensions
