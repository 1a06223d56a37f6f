#include <gtest/gtest.h>

#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "test_support.hpp"

using objcp::infra::Config;

TEST(ConfigTest, LoadsYamlFile)
{
    objcp::test::TempDir dir;
    objcp::test::write_file(dir / "objcp.yaml",
        "threads: 6\n"
        "processes: 2\n"
        "continue_on_error: true\n"
        "canned_acl: project-private\n"
        "bucket_root: /srv/buckets\n");

    auto config = objcp::infra::load_config_from_file(dir / "objcp.yaml");
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->threads.value_or(0), 6u);
    EXPECT_EQ(config->processes.value_or(0), 2u);
    EXPECT_TRUE(config->continue_on_error);
    EXPECT_EQ(config->canned_acl.value_or(""), "project-private");
    ASSERT_TRUE(config->bucket_root.has_value());
    EXPECT_EQ(config->bucket_root->string(), "/srv/buckets");
}

TEST(ConfigTest, MissingExplicitFileIsAnError)
{
    objcp::test::TempDir dir;
    EXPECT_FALSE(objcp::infra::load_config_from_file(dir / "absent.yaml").has_value());
}

TEST(ConfigTest, CommandLineOverridesFile)
{
    Config file;
    file.threads = 2;
    file.canned_acl = "private";

    const char* argv[] = {"objcp", "-m", "--threads", "9", "-a", "public-read", "src", "gs://b"};
    auto args = objcp::args_parser::parse_args(8, argv);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->sources, std::vector<std::string>{"src"});
    EXPECT_EQ(args->destination, "gs://b");

    file.merge_with(objcp::infra::config_from_cli(*args));
    EXPECT_EQ(file.threads.value_or(0), 9u);
    EXPECT_EQ(file.canned_acl.value_or(""), "public-read");
    // -m implies continue-on-error
    EXPECT_TRUE(file.continue_on_error);
}

TEST(ConfigTest, ParallelFlagEnablesThreadsAndProcesses)
{
    const char* argv[] = {"objcp", "-m", "src", "gs://b"};
    auto args = objcp::args_parser::parse_args(4, argv);
    ASSERT_TRUE(args.has_value());

    Config config;
    config.merge_with(objcp::infra::config_from_cli(*args));
    config.apply_parallel_defaults();
    EXPECT_TRUE(config.parallel);
    EXPECT_GE(config.processes.value_or(0), 1u);
    EXPECT_LE(config.processes.value_or(0), 32u);
    EXPECT_EQ(config.threads.value_or(0), 5u);
    EXPECT_TRUE(config.continue_on_error);
}

TEST(ConfigTest, ParallelDefaultsKeepExplicitCounts)
{
    Config config;
    config.processes = 3;
    config.parallel = true;
    config.apply_parallel_defaults();
    EXPECT_EQ(config.processes.value_or(0), 3u);
    EXPECT_EQ(config.threads.value_or(0), 5u);

    Config sequential;
    sequential.apply_parallel_defaults();
    EXPECT_FALSE(sequential.processes.has_value());
    EXPECT_FALSE(sequential.threads.has_value());
}

TEST(ConfigTest, PreserveAclConflictsWithCannedAcl)
{
    Config config;
    config.preserve_acl = true;
    config.canned_acl = "private";
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ArgsParserTest, NeedsSourceAndDestination)
{
    const char* argv[] = {"objcp", "only-one"};
    EXPECT_FALSE(objcp::args_parser::parse_args(2, argv).has_value());
    EXPECT_NE(objcp::args_parser::last_parse_exit_code(), 0);
}

TEST(ArgsParserTest, StdinModeTakesOnlyTheDestination)
{
    const char* argv[] = {"objcp", "-I", "-r", "gs://b/prefix/"};
    auto args = objcp::args_parser::parse_args(4, argv);
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->read_from_stdin);
    EXPECT_TRUE(args->recursive);
    EXPECT_TRUE(args->sources.empty());
    EXPECT_EQ(args->destination, "gs://b/prefix/");
}
