#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdlib>
#include <thread>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace objcp::infra {

    void Config::merge_with(const Config& other) {
        if (other.threads) threads = other.threads;
        if (other.processes) processes = other.processes;
        if (other.retries) retries = other.retries;
        if (other.parallel) parallel = true;
        if (other.recursive) recursive = true;
        if (other.continue_on_error) continue_on_error = true;
        if (other.no_clobber) no_clobber = true;
        if (other.move) move = true;
        if (other.print_version) print_version = true;
        if (other.preserve_acl) preserve_acl = true;
        if (other.exclude_symlinks) exclude_symlinks = true;
        if (other.verify) verify = true;
        if (other.progress) progress = true;
        if (other.quiet) quiet = true;
        if (other.debug) debug = true;

        if (other.canned_acl) canned_acl = other.canned_acl;
        if (other.manifest) manifest = other.manifest;
        if (other.bucket_root) bucket_root = other.bucket_root;
    }

    void Config::apply_parallel_defaults() {
        if (!parallel) {
            return;
        }
        continue_on_error = true;
        constexpr std::uint32_t kParallelThreads = 5;
        constexpr std::uint32_t kMaxParallelProcesses = 32;
        if (!processes) {
            const auto cpus = std::thread::hardware_concurrency();
            processes = std::clamp<std::uint32_t>(cpus, 1, kMaxParallelProcesses);
        }
        if (!threads) {
            threads = kParallelThreads;
        }
    }

    auto Config::validate() const -> std::expected<void, std::string> {
        if (preserve_acl && canned_acl) {
            return std::unexpected("Specifying both the -p and -a options together is invalid.");
        }
        if (canned_acl && canned_acl->empty()) {
            return std::unexpected("Canned ACL name must not be empty.");
        }
        return {};
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".objcp.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "objcp" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "objcp" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_config(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["threads"]) cfg.threads = config["threads"].as<std::uint32_t>();
            if (config["processes"]) cfg.processes = config["processes"].as<std::uint32_t>();
            if (config["parallel"]) cfg.parallel = config["parallel"].as<bool>();
            if (config["retries"]) cfg.retries = config["retries"].as<std::uint32_t>();

            if (config["recursive"]) cfg.recursive = config["recursive"].as<bool>();
            if (config["continue_on_error"]) cfg.continue_on_error = config["continue_on_error"].as<bool>();
            if (config["no_clobber"]) cfg.no_clobber = config["no_clobber"].as<bool>();
            if (config["print_version"]) cfg.print_version = config["print_version"].as<bool>();
            if (config["preserve_acl"]) cfg.preserve_acl = config["preserve_acl"].as<bool>();
            if (config["exclude_symlinks"]) cfg.exclude_symlinks = config["exclude_symlinks"].as<bool>();
            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

            if (config["canned_acl"]) cfg.canned_acl = config["canned_acl"].as<std::string>();
            if (config["manifest"]) cfg.manifest = config["manifest"].as<std::string>();
            if (config["bucket_root"]) cfg.bucket_root = config["bucket_root"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return parse_config(path);
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    auto load_config_from_file(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        if (!std::filesystem::exists(path)) {
            return std::unexpected(fmt::format("Config file {} does not exist", path.string()));
        }
        return parse_config(path);
    }

    [[nodiscard]]
    auto config_from_cli(const objcp::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.threads = args.threads;
        cfg.processes = args.processes;
        cfg.retries = args.retries;
        cfg.recursive = args.recursive;
        cfg.continue_on_error = args.continue_on_error;
        cfg.no_clobber = args.no_clobber;
        cfg.move = args.move;
        cfg.print_version = args.print_version;
        cfg.preserve_acl = args.preserve_acl;
        cfg.exclude_symlinks = args.exclude_symlinks;
        cfg.verify = args.verify;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        cfg.debug = args.debug;
        cfg.canned_acl = args.canned_acl;
        if (args.manifest) cfg.manifest = *args.manifest;
        if (args.bucket_root) cfg.bucket_root = *args.bucket_root;

        // -m: parallel mode implies continue-on-error
        if (args.parallel) {
            cfg.parallel = true;
            cfg.continue_on_error = true;
        }
        return cfg;
    }

} // namespace objcp::infra
