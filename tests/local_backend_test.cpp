#include <gtest/gtest.h>

#include <sys/stat.h>

#include "adapters/fs.hpp"
#include "adapters/local_backend/canned_acl.hpp"
#include "adapters/local_backend/local_backend.hpp"
#include "infra/hash/xxhash_verifier.hpp"
#include "test_support.hpp"

using namespace objcp;
using adapters::LocalStore;
using adapters::LocalTransferBackend;
using adapters::TransferOptions;
using core::StorageUrl;
using infra::ErrorCode;

namespace {

auto url(const std::string& text) -> StorageUrl {
    return StorageUrl::parse(text).value();
}

struct LocalBackendTest : ::testing::Test {
    test::TempDir dir;
    std::filesystem::path root = dir / "buckets";
    LocalStore store{root};
    LocalTransferBackend backend{store};

    void SetUp() override {
        std::filesystem::create_directories(root / "src");
        std::filesystem::create_directories(root / "dst");
    }
};

auto mode_of(const std::filesystem::path& path) -> mode_t {
    struct stat sb{};
    ::stat(path.c_str(), &sb);
    return sb.st_mode & 0777;
}

} // namespace

TEST(CopyStrategyTest, SelectedBySize)
{
    EXPECT_EQ(adapters::fs::select_strategy(10), adapters::fs::CopyStrategy::Buffered);
    EXPECT_EQ(adapters::fs::select_strategy(5 * 1024 * 1024), adapters::fs::CopyStrategy::MMap);
    EXPECT_EQ(adapters::fs::select_strategy(200ull * 1024 * 1024), adapters::fs::CopyStrategy::Uring);
}

TEST(CopyStrategyTest, EveryStrategyCopiesTheSameBytes)
{
    test::TempDir dir;
    std::string content(300 * 1024 + 17, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i * 31);
    test::write_file(dir / "src.bin", content);

    for (auto* copy : {&adapters::fs::copy_file_buffered, &adapters::fs::copy_file_mmap,
                       &adapters::fs::copy_file_uring}) {
        const auto dst = dir / "dst.bin";
        auto copied = copy(dir / "src.bin", dst);
        ASSERT_TRUE(copied.has_value()) << copied.error().message;
        EXPECT_EQ(*copied, content.size());
        EXPECT_EQ(test::read_file(dst), content);
        std::filesystem::remove(dst);
    }
}

TEST(CopyStrategyTest, EmptyFile)
{
    test::TempDir dir;
    test::write_file(dir / "empty", "");
    auto copied = adapters::fs::copy_file_atomic(dir / "empty", dir / "copy");
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(*copied, 0u);
    EXPECT_TRUE(std::filesystem::exists(dir / "copy"));
}

TEST(CopyStrategyTest, NoReplaceKeepsDestinationThatAppearedFirst)
{
    test::TempDir dir;
    test::write_file(dir / "src", "new content");
    test::write_file(dir / "dst", "written by another worker");

    auto copied = adapters::fs::copy_file_atomic(dir / "src", dir / "dst", false);
    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, infra::ErrorCode::ItemExists);
    EXPECT_EQ(test::read_file(dir / "dst"), "written by another worker");

    std::size_t entries = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        ++entries;
    }
    EXPECT_EQ(entries, 2u);
}

TEST(CopyStrategyTest, NoReplacePublishesNewDestination)
{
    test::TempDir dir;
    test::write_file(dir / "src", "payload");
    auto copied = adapters::fs::copy_file_atomic(dir / "src", dir / "dst", false);
    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_EQ(test::read_file(dir / "dst"), "payload");
}

TEST_F(LocalBackendTest, UploadsFileIntoBucket)
{
    test::write_file(dir / "local.txt", "hello objects");
    auto result = backend.transfer(StorageUrl::local((dir / "local.txt").string()),
                                   url("gs://dst/nested/key.txt"), TransferOptions{});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->bytes_transferred, 13u);
    EXPECT_EQ(test::read_file(root / "dst" / "nested" / "key.txt"), "hello objects");
    EXPECT_TRUE(result->result_url.has_generation());
    ASSERT_TRUE(result->checksum.has_value());
    EXPECT_EQ(result->checksum->size(), 16u);
}

TEST_F(LocalBackendTest, DownloadsObjectToFile)
{
    test::write_file(root / "src" / "obj", "payload");
    const auto target = dir / "out" / "obj";
    auto result = backend.transfer(url("gs://src/obj"), StorageUrl::local(target.string()), TransferOptions{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(test::read_file(target), "payload");
    EXPECT_FALSE(result->result_url.has_generation());
}

TEST_F(LocalBackendTest, MissingSourceIsNotFound)
{
    auto result = backend.transfer(url("gs://src/missing"), url("gs://dst/x"), TransferOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(LocalBackendTest, MissingDestinationBucketIsNotFound)
{
    test::write_file(root / "src" / "obj", "x");
    auto result = backend.transfer(url("gs://src/obj"), url("gs://nobucket/obj"), TransferOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(LocalBackendTest, NoClobberReportsItemExists)
{
    test::write_file(root / "src" / "obj", "new");
    test::write_file(root / "dst" / "obj", "old");
    auto result = backend.transfer(url("gs://src/obj"), url("gs://dst/obj"),
                                   TransferOptions{.no_clobber = true});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ItemExists);
    EXPECT_EQ(test::read_file(root / "dst" / "obj"), "old");
}

TEST_F(LocalBackendTest, StaleGenerationIsNotFound)
{
    test::write_file(root / "src" / "obj", "x");
    auto result = backend.transfer(url("gs://src/obj#1"), url("gs://dst/obj"), TransferOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(LocalBackendTest, VerifyAndChecksumMatchContent)
{
    test::write_file(root / "src" / "obj", "verify me");
    auto result = backend.transfer(url("gs://src/obj"), url("gs://dst/obj"), TransferOptions{.verify = true});
    ASSERT_TRUE(result.has_value());
    auto expected = infra::XXHashVerifier::hash_file(root / "src" / "obj");
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(*result->checksum, infra::XXHashVerifier::to_hex(*expected));
    EXPECT_EQ(*expected, infra::XXHashVerifier::hash_bytes("verify me"));
}

TEST_F(LocalBackendTest, PreserveAclCarriesPermissions)
{
    test::write_file(root / "src" / "obj", "x");
    ::chmod((root / "src" / "obj").c_str(), 0640);
    auto result = backend.transfer(url("gs://src/obj"), url("gs://dst/obj"),
                                   TransferOptions{.preserve_acl = true});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(mode_of(root / "dst" / "obj"), 0640u);
}

TEST_F(LocalBackendTest, RemoveDeletesObjectAndEmptyPrefixes)
{
    test::write_file(root / "src" / "a" / "b" / "obj", "x");
    ASSERT_TRUE(backend.remove("src", "a/b/obj", std::nullopt, "gs").has_value());
    EXPECT_FALSE(std::filesystem::exists(root / "src" / "a"));
    EXPECT_TRUE(std::filesystem::exists(root / "src"));

    auto again = backend.remove("src", "a/b/obj", std::nullopt, "gs");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(LocalBackendTest, VersioningStateFollowsMarkerFile)
{
    auto plain = backend.get_versioning_state(url("gs://dst"));
    ASSERT_TRUE(plain.has_value());
    EXPECT_FALSE(plain->enabled);

    test::write_file(root / "dst" / ".versioning", "Enabled\n");
    auto versioned = backend.get_versioning_state(url("gs://dst"));
    ASSERT_TRUE(versioned.has_value());
    EXPECT_TRUE(versioned->enabled);

    auto missing = backend.get_versioning_state(url("gs://nobucket"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(LocalBackendTest, CloudUrlsNeedABucketRoot)
{
    LocalTransferBackend rootless{LocalStore{std::nullopt}};
    auto result = rootless.get_versioning_state(url("gs://dst"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Configuration);
}

TEST_F(LocalBackendTest, ObjectNamesCannotEscapeTheBucket)
{
    auto path = store.path_for(url("gs://dst/../src/obj"));
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, ErrorCode::InvalidArgument);
}

TEST_F(LocalBackendTest, CannedAclSetsMode)
{
    test::write_file(root / "dst" / "obj", "x");
    adapters::CannedAclApplier applier{store};
    const core::NamingShape destination{.expanded_source = "gs://dst/obj"};

    ASSERT_TRUE(applier.apply(destination, "private").has_value());
    EXPECT_EQ(mode_of(root / "dst" / "obj"), 0600u);
    ASSERT_TRUE(applier.apply(destination, "public-read").has_value());
    EXPECT_EQ(mode_of(root / "dst" / "obj"), 0644u);

    auto unknown = applier.apply(destination, "world-writable");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::Configuration);
    EXPECT_FALSE(adapters::CannedAclApplier::is_known("world-writable"));
    EXPECT_TRUE(adapters::CannedAclApplier::is_known("bucket-owner-full-control"));
}
