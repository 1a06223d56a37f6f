#include "xxhash_verifier.hpp"
#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace objcp::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::NotFound,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state(XXH64_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }

    XXH64_reset(state.get(), 0); // seed = 0

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        XXH64_update(state.get(), buffer.data(), static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::TransferFailed,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::hash_bytes(std::string_view data) -> XXH64_hash_t {
    return XXH64(data.data(), data.size(), 0);
}

auto XXHashVerifier::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", static_cast<unsigned long long>(hash));
}

auto XXHashVerifier::verify_files(const std::filesystem::path& src,
                                  const std::filesystem::path& dst)
    -> std::expected<bool, Error>
{
    auto src_hash = hash_file(src);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }

    auto dst_hash = hash_file(dst);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    bool match = (*src_hash == *dst_hash);

    if (!match) {
        spdlog::warn("Hash mismatch: {} (src: {}) vs {} (dst: {})",
                     src.string(), to_hex(*src_hash),
                     dst.string(), to_hex(*dst_hash));
    }

    return match;
}

} // namespace objcp::infra
