#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace objcp::args_parser {
    struct CLIArgs;
}

namespace objcp::infra {

struct Config {
    // Parallelism
    std::optional<std::uint32_t> threads;     // threads per process
    std::optional<std::uint32_t> processes;   // worker processes (1 = in-process)
    std::optional<std::uint32_t> retries;     // attempts for transient errors
    bool parallel = false;                    // -m

    // Behavior
    bool recursive = false;
    bool continue_on_error = false;
    bool no_clobber = false;
    bool move = false;
    bool print_version = false;
    bool preserve_acl = false;
    bool exclude_symlinks = false;
    bool verify = false;
    bool progress = false;
    bool quiet = false;
    bool debug = false;

    std::optional<std::string> canned_acl;
    std::optional<std::filesystem::path> manifest;

    // Directory that hosts emulated buckets (one sub-directory per bucket)
    std::optional<std::filesystem::path> bucket_root;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    // -m: fills in whatever threads/processes the file and CLI left unset.
    // Call after every merge, so an explicit count always wins.
    void apply_parallel_defaults();

    // Rejects option combinations that make no sense together.
    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.objcp.yaml
///   2. $XDG_CONFIG_HOME/objcp/config.yaml или ~/.config/objcp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Same as above but for one explicit file; a missing file is an error.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const objcp::args_parser::CLIArgs& args) -> Config;

} // namespace objcp::infra
