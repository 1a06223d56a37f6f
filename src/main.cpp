#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <fmt/core.h>

#include "adapters/local_backend/canned_acl.hpp"
#include "adapters/local_backend/local_backend.hpp"
#include "adapters/local_backend/local_enumerator.hpp"
#include "adapters/local_backend/local_store.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/orchestrator/orchestrator.hpp"
#include "extensions/manifest.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>

using ARGS = objcp::args_parser::CLIArgs;
using CONFIG = objcp::infra::Config;

constexpr auto load_from_cli = objcp::infra::config_from_cli;
constexpr auto args_parser = objcp::args_parser::parse_args;

static auto
out_build_verse()
-> void {
    const auto git = objcp::build_info::get_git_info();
    spdlog::debug("objcp {} ({}{}), built {}", git.branch, git.commit_short,
                  git.dirty ? ", dirty" : "", git.timestamp);
}

[[nodiscard]]
static auto
load_config(const ARGS& args)
-> std::expected<CONFIG, std::string> {
    // 1. Файл, 2. CLI поверх него
    auto config = args.config_file
        ? objcp::infra::load_config_from_file(std::filesystem::path(*args.config_file))
        : objcp::infra::load_config_from_file();
    if (!config) {
        return config;
    }
    config->merge_with(load_from_cli(args));
    config->apply_parallel_defaults();
    if (auto valid = config->validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

// -I: one URL per line, blank lines ignored
[[nodiscard]]
static auto
read_sources_from_stdin()
-> std::vector<std::string> {
    std::vector<std::string> sources;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) sources.push_back(std::move(line));
    }
    return sources;
}

[[nodiscard]]
static auto
make_options(const CONFIG& config)
-> objcp::core::OrchestratorOptions {
    objcp::core::CopyOptions copy{
        .mode = config.move ? objcp::core::TransferMode::Move : objcp::core::TransferMode::Copy,
        .continue_on_error = config.continue_on_error,
        .no_clobber = config.no_clobber,
        .print_version = config.print_version,
        .preserve_acl = config.preserve_acl,
        .verify = config.verify,
        .canned_acl = config.canned_acl,
    };
    if (config.retries) {
        copy.retry.max_attempts = static_cast<int>(*config.retries);
    }
    return objcp::core::OrchestratorOptions{
        .copy = std::move(copy),
        .threads = std::max<std::uint32_t>(config.threads.value_or(1), 1),
        .processes = std::max<std::uint32_t>(config.processes.value_or(1), 1),
        .recursive = config.recursive,
        .exclude_symlinks = config.exclude_symlinks,
    };
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        objcp::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return objcp::args_parser::last_parse_exit_code(); // --help или ошибка
        }
        auto args = std::move(*args_opt);

        auto config_res = load_config(args);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        const auto& config = *config_res;

        if (config.debug) {
            spdlog::set_level(spdlog::level::debug);
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }
        out_build_verse();

        if (config.canned_acl && !objcp::adapters::CannedAclApplier::is_known(*config.canned_acl)) {
            spdlog::error("Config error: unknown canned ACL \"{}\"", *config.canned_acl);
            return 1;
        }

        if (args.read_from_stdin) {
            args.sources = read_sources_from_stdin();
        }

        const objcp::adapters::LocalStore store{config.bucket_root};
        objcp::adapters::LocalTransferBackend backend{store};
        objcp::adapters::LocalNameExpander expander{store};
        objcp::adapters::CannedAclApplier acl_applier{store};

        std::unique_ptr<objcp::extensions::ManifestLog> manifest;
        if (config.manifest) {
            auto opened = objcp::extensions::ManifestLog::open(*config.manifest);
            if (!opened) {
                spdlog::error("Cannot open manifest: {}", opened.error().message);
                return opened.error().to_exit_code();
            }
            manifest = std::move(*opened);
        }

        // Стартует сам оркестратор, после возможного fork
        objcp::infra::ProgressMonitor monitor(config.progress, config.quiet);

        objcp::core::Orchestrator orchestrator{make_options(config), expander, backend,
                                               manifest.get(), &acl_applier, &monitor};

        spdlog::debug("Starting copy of {} source(s) to {}", args.sources.size(), args.destination);
        auto result = orchestrator.run(args.sources, args.destination);
        if (!result) {
            const auto error = objcp::infra::log_and_return(std::move(result.error()));
            return error.to_exit_code();
        }

        const auto& stats = *result;
        spdlog::info("Operation completed over {} objects/{:.2f} MiB in {:.2f}s ({:.2f} MiB/s)",
                     stats.items_copied + stats.items_skipped + stats.failure_count,
                     stats.total_bytes / 1024.0 / 1024.0,
                     stats.total_elapsed,
                     stats.throughput / 1024.0 / 1024.0);
        spdlog::debug("Copied: {}, skipped: {}, failed: {}, summed item time: {:.2f}s",
                      stats.items_copied, stats.items_skipped, stats.failure_count,
                      stats.summed_item_elapsed);

        return stats.success ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
