#pragma once

#include <filesystem>
#include <expected>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"
#include <xxhash.h>

namespace objcp::infra {

// Content checksums for transferred items (xxHash64, seed 0).
class XXHashVerifier {
public:
    // Вычисляет xxHash64 для файла
    static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

    static auto hash_bytes(std::string_view data) -> XXH64_hash_t;

    // 16 lowercase hex digits, as stored in the manifest
    static auto to_hex(XXH64_hash_t hash) -> std::string;

    // Сравнивает хеши двух файлов
    static auto verify_files(const std::filesystem::path& src,
                             const std::filesystem::path& dst)
        -> std::expected<bool, Error>;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace objcp::infra
