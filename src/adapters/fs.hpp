#pragma once

#include <cstdint>
#include <filesystem>
#include <expected>
#include "infra/error_handler/error.hpp"

namespace objcp::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // 1 MB – 100 MB
    Uring,       // >= 100 MB (Linux), buffered elsewhere
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

// All variants create or truncate `dst` and return the number of bytes written.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy = CopyStrategy::Buffered
) -> std::expected<std::uint64_t, infra::Error>;

[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> std::expected<std::uint64_t, infra::Error>;

[[nodiscard]] auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> std::expected<std::uint64_t, infra::Error>;

[[nodiscard]] auto copy_file_uring(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> std::expected<std::uint64_t, infra::Error>;

// Copies into a temporary sibling and renames it over `dst`, so readers
// never observe a half written destination. Without `replace_existing` the
// sibling is hard-linked into place instead, and an existing `dst` fails
// with ItemExists and stays untouched.
[[nodiscard]] auto copy_file_atomic(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    bool replace_existing = true
) -> std::expected<std::uint64_t, infra::Error>;

} // namespace objcp::adapters::fs
