#include <gtest/gtest.h>

#include "core/storage_url/storage_url.hpp"

using objcp::core::StorageUrl;
using objcp::infra::ErrorCode;

TEST(StorageUrlTest, BarePathIsLocal)
{
    auto url = StorageUrl::parse("some/dir/file.txt");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->kind(), objcp::core::BackendKind::LocalFile);
    EXPECT_EQ(url->object_name(), "some/dir/file.txt");
    EXPECT_EQ(url->url_string(), "file://some/dir/file.txt");
}

TEST(StorageUrlTest, FileSchemeIsLocal)
{
    auto url = StorageUrl::parse("file:///tmp/x");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->is_file());
    EXPECT_EQ(url->object_name(), "/tmp/x");
}

TEST(StorageUrlTest, CloudShapes)
{
    auto provider = StorageUrl::parse("gs://").value();
    EXPECT_TRUE(provider.is_provider());
    EXPECT_TRUE(provider.names_container_shape());

    auto bucket = StorageUrl::parse("gs://bucket").value();
    EXPECT_TRUE(bucket.is_bucket());
    EXPECT_TRUE(bucket.names_container_shape());
    EXPECT_EQ(bucket.url_string(), "gs://bucket/");

    auto object = StorageUrl::parse("s3://bucket/a/b").value();
    EXPECT_TRUE(object.is_object());
    EXPECT_EQ(object.kind(), objcp::core::BackendKind::RemoteObject);
    EXPECT_EQ(object.scheme(), "s3");
    EXPECT_EQ(object.bucket(), "bucket");
    EXPECT_EQ(object.object_name(), "a/b");
    EXPECT_FALSE(object.names_container_shape());

    EXPECT_TRUE(StorageUrl::parse("gs://bucket/a/").value().names_container_shape());
}

TEST(StorageUrlTest, GenerationSuffix)
{
    auto url = StorageUrl::parse("gs://b/obj#1700000000123").value();
    EXPECT_TRUE(url.has_generation());
    EXPECT_EQ(url.generation().value_or(0), 1700000000123);
    EXPECT_EQ(url.object_name(), "obj");
    EXPECT_EQ(url.url_string(), "gs://b/obj#1700000000123");
    EXPECT_EQ(url.versionless_url_string(), "gs://b/obj");
    EXPECT_FALSE(url.without_generation().has_generation());

    // Not a number: part of the name.
    auto named = StorageUrl::parse("gs://b/notes#draft").value();
    EXPECT_FALSE(named.has_generation());
    EXPECT_EQ(named.object_name(), "notes#draft");
}

TEST(StorageUrlTest, WithObjectNameKeepsGeneration)
{
    auto url = StorageUrl::parse("gs://b/obj#5").value().with_object_name("other");
    EXPECT_EQ(url.url_string(), "gs://b/other#5");
}

TEST(StorageUrlTest, Wildcards)
{
    EXPECT_TRUE(StorageUrl::parse("gs://b/*.txt").value().contains_wildcard());
    EXPECT_TRUE(StorageUrl::parse("dir/file?").value().contains_wildcard());
    EXPECT_TRUE(objcp::core::contains_wildcard("a/[ab]"));
    EXPECT_FALSE(StorageUrl::parse("gs://b/plain").value().contains_wildcard());
}

TEST(StorageUrlTest, RejectsMalformedInput)
{
    EXPECT_EQ(StorageUrl::parse("").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(StorageUrl::parse("ftp://host/x").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(StorageUrl::parse("file://").error().code, ErrorCode::InvalidArgument);
}

TEST(StorageUrlTest, Equality)
{
    EXPECT_EQ(StorageUrl::parse("gs://b/o").value(), StorageUrl::cloud("gs", "b", "o"));
    EXPECT_NE(StorageUrl::parse("gs://b/o#1").value(), StorageUrl::cloud("gs", "b", "o"));
}
