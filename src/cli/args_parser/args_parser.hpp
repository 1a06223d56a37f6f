#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace objcp::args_parser {

struct CLIArgs
{
    std::vector<std::string> sources;          // позиционные аргументы, кроме последнего
    std::string destination;                   // последний позиционный аргумент
    bool recursive{false};                     // -r, -R, --recursive
    bool continue_on_error{false};             // -c
    bool no_clobber{false};                    // -n
    bool move{false};                          // -M, --move
    bool print_version{false};                 // -v
    bool preserve_acl{false};                  // -p
    bool exclude_symlinks{false};              // -e
    bool read_from_stdin{false};               // -I
    bool parallel{false};                      // -m
    bool verify{false};                        // --verify
    bool progress{false};                      // --progress
    bool quiet{false};                         // -q, --quiet
    bool debug{false};                         // --debug
    std::optional<std::string> canned_acl;     // -a NAME
    std::optional<std::string> manifest;       // -L FILE
    std::optional<std::string> bucket_root;    // --bucket-root DIR
    std::optional<std::string> config_file;    // --config FILE
    std::optional<std::uint32_t> threads;      // --threads=N
    std::optional<std::uint32_t> processes;    // --processes=N
    std::optional<std::uint32_t> retries;      // --retries=N
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt after printing help or a usage error.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

/// Exit code to use when parse_args returned std::nullopt.
int last_parse_exit_code();

} // namespace objcp::args_parser
