#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace objcp::args_parser {

namespace {
int g_exit_code = 0;
} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    std::vector<std::string> urls;

    CLI::App app{"objcp - copy files and objects between local storage and buckets"};

    app.add_option("urls", urls, "SRC_URL... DST_URL")->expected(1, -1);
    app.add_flag("-r,-R,--recursive", args.recursive, "Copy directories and buckets recursively");
    app.add_flag("-c,--continue-on-error", args.continue_on_error,
                 "Continue with the remaining items after a failure");
    app.add_flag("-n,--no-clobber", args.no_clobber, "Skip items that already exist at the destination");
    app.add_flag("-M,--move", args.move, "Remove each source after it was copied");
    app.add_flag("-v,--print-version", args.print_version, "Print the version-specific URL of each created object");
    app.add_flag("-p,--preserve-acl", args.preserve_acl, "Carry the source ACL over to the destination");
    app.add_flag("-e,--exclude-symlinks", args.exclude_symlinks, "Do not copy symbolic links");
    app.add_flag("-I,--stdin", args.read_from_stdin, "Read source URLs from stdin, one per line");
    app.add_flag("-m,--parallel", args.parallel, "Run transfers in parallel (implies -c)");
    app.add_flag("--verify", args.verify, "Re-hash source and destination after each transfer");
    app.add_flag("--progress", args.progress, "Show a live progress line");
    app.add_flag("-q,--quiet", args.quiet, "Only log warnings and errors");
    app.add_flag("--debug", args.debug, "Enable debug logging");
    app.add_option("-a,--canned-acl", args.canned_acl, "Apply the named canned ACL to every destination");
    app.add_option("-L,--manifest", args.manifest, "Append per-item results to this manifest and skip items it already records");
    app.add_option("--bucket-root", args.bucket_root, "Directory that hosts the buckets");
    app.add_option("--config", args.config_file, "Read configuration from this YAML file");
    app.add_option("--threads", args.threads, "Worker threads per process")->check(CLI::PositiveNumber);
    app.add_option("--processes", args.processes, "Worker processes")->check(CLI::PositiveNumber);
    app.add_option("--retries", args.retries, "Attempts for transient errors")->check(CLI::PositiveNumber);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        g_exit_code = app.exit(e);
        return std::nullopt;
    }

    if (args.read_from_stdin) {
        if (urls.size() != 1) {
            fmt::print(stderr, "Source URLs cannot be specified with -I option\n");
            g_exit_code = 1;
            return std::nullopt;
        }
        args.destination = urls.back();
        return args;
    }

    if (urls.size() < 2) {
        fmt::print(stderr, "Wrong number of arguments: expected SRC_URL... DST_URL\n");
        g_exit_code = 1;
        return std::nullopt;
    }

    args.destination = urls.back();
    urls.pop_back();
    args.sources = std::move(urls);
    return args;
}

int last_parse_exit_code()
{
    return g_exit_code;
}

} // namespace objcp::args_parser
