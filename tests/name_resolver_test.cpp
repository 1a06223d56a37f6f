#include <gtest/gtest.h>

#include "core/name_resolver/name_resolver.hpp"

using objcp::core::resolve_destination;
using objcp::core::StorageUrl;

namespace {

auto url(const char* text) -> StorageUrl {
    return StorageUrl::parse(text).value();
}

auto resolve(const char* source, const char* expanded, bool names_container, bool multi,
             const char* destination, std::optional<bool> existing) -> std::string {
    return resolve_destination(url(source), url(expanded), names_container, multi,
                               url(destination), existing).url_string();
}

} // namespace

TEST(NameResolverTest, SingleItemIntoExistingContainerKeepsFinalComponent)
{
    EXPECT_EQ(resolve("a/b/c", "a/b/c", false, false, "gs://X", true), "gs://X/c");
    EXPECT_EQ(resolve("a/b/c", "a/b/c", false, false, "out", true), "file://out/c");
}

TEST(NameResolverTest, SingleItemToNonContainerIsTheDestinationItself)
{
    EXPECT_EQ(resolve("a/b/c", "a/b/c", false, false, "gs://X/renamed", false), "gs://X/renamed");
    EXPECT_EQ(resolve("gs://b/o", "gs://b/o", false, false, "copy.txt", false), "file://copy.txt");
}

TEST(NameResolverTest, TrailingSlashMakesDestinationAContainer)
{
    EXPECT_EQ(resolve("a/b/c", "a/b/c", false, false, "gs://X/sub/", false), "gs://X/sub/c");
}

TEST(NameResolverTest, RecursiveCopyMirrorsFromParentOfExpansionRoot)
{
    EXPECT_EQ(resolve("dir1/dir2", "dir1/dir2/a/b/c", true, true, "gs://X", true),
              "gs://X/dir2/a/b/c");
    // Trailing delimiter on the source token changes nothing.
    EXPECT_EQ(resolve("dir1/dir2/", "dir1/dir2/a/b/c", true, true, "gs://X", true),
              "gs://X/dir2/a/b/c");
}

TEST(NameResolverTest, ExistingSubdirectoryNestsTheRootNewOneDoesNot)
{
    EXPECT_EQ(resolve("dir1/dir2", "dir1/dir2/a/b/c", true, true, "gs://X/subdir", true),
              "gs://X/subdir/dir2/a/b/c");
    EXPECT_EQ(resolve("dir1/dir2", "dir1/dir2/a/b/c", true, true, "gs://X/subdir", false),
              "gs://X/subdir/a/b/c");
}

TEST(NameResolverTest, BucketDestinationAlwaysKeepsTheRoot)
{
    EXPECT_EQ(resolve("dir1/dir2", "dir1/dir2/a", true, true, "gs://X", false), "gs://X/dir2/a");
}

TEST(NameResolverTest, BucketSourceMirrorsObjectNames)
{
    EXPECT_EQ(resolve("gs://src", "gs://src/p/q.txt", true, true, "out", true),
              "file://out/p/q.txt");
}

TEST(NameResolverTest, DotDirectoryIsNotRepeatedInTheDestination)
{
    EXPECT_EQ(resolve(".", "./x/y", true, true, "gs://X/dst", true), "gs://X/dst/x/y");
}

TEST(NameResolverTest, WildcardMatchedDirectoryKeepsItsName)
{
    EXPECT_EQ(resolve("gs://b/d*", "gs://b/d1/a", true, true, "out", true), "file://out/d1/a");
}

TEST(NameResolverTest, MultipleIndividualItemsUseFinalComponent)
{
    EXPECT_EQ(resolve("gs://b/*.txt", "gs://b/x/y.txt", false, true, "gs://X/sub", true),
              "gs://X/sub/y.txt");
}

TEST(NameResolverTest, ResolutionIsPure)
{
    const auto first = resolve("dir1/dir2", "dir1/dir2/a/b/c", true, true, "gs://X/subdir", false);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(resolve("dir1/dir2", "dir1/dir2/a/b/c", true, true, "gs://X/subdir", false), first);
    }
}

TEST(NameResolverTest, ShapeOverloadRejectsUnparsableUrl)
{
    const objcp::core::NamingShape shape{
        .source = "ftp://host/file",
        .expanded_source = "ftp://host/file",
        .names_container = false,
        .is_multi_source_request = false,
        .destination_had_existing_container = std::nullopt,
    };
    auto res = resolve_destination(shape, url("gs://X"));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, objcp::infra::ErrorCode::InvalidArgument);
}
