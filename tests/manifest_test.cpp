#include <gtest/gtest.h>
#include <fstream>

#include "extensions/manifest.hpp"
#include "test_support.hpp"

using objcp::extensions::ManifestLog;
using objcp::extensions::ManifestResult;

TEST(ManifestTest, CsvQuotingOnlyWhenNeeded)
{
    EXPECT_EQ(objcp::extensions::csv_escape("plain"), "plain");
    EXPECT_EQ(objcp::extensions::csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(objcp::extensions::csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(ManifestTest, CsvParseHandlesQuotedSeparatorsAndNewlines)
{
    const auto rows = objcp::extensions::csv_parse("a,\"b,c\",\"line1\nline2\"\nx,\"q\"\"q\",\n");
    ASSERT_EQ(rows.size(), 2u);
    ASSERT_EQ(rows[0].size(), 3u);
    EXPECT_EQ(rows[0][1], "b,c");
    EXPECT_EQ(rows[0][2], "line1\nline2");
    ASSERT_EQ(rows[1].size(), 3u);
    EXPECT_EQ(rows[1][1], "q\"q");
    EXPECT_EQ(rows[1][2], "");
}

TEST(ManifestTest, TimestampsAreUtcWithMicroseconds)
{
    using namespace std::chrono;
    const system_clock::time_point tp = sys_days{2024y / 3 / 9} + 13h + 5min + 7s + 42us;
    const auto text = objcp::extensions::format_timestamp(tp);
    EXPECT_EQ(text, "2024-03-09T13:05:07.000042Z");
    auto parsed = objcp::extensions::parse_timestamp(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(*parsed == tp);
}

TEST(ManifestTest, WritesHeaderOnceAndOneRowPerSource)
{
    objcp::test::TempDir dir;
    const auto path = dir / "manifest.csv";

    auto log = ManifestLog::open(path);
    ASSERT_TRUE(log.has_value());
    (*log)->begin("file://a", "gs://b/a");
    (*log)->record_checksum("file://a", "deadbeef");
    ASSERT_TRUE((*log)->record_outcome("file://a", 10, ManifestResult::Ok).has_value());
    // Same source again within the run: ignored.
    ASSERT_TRUE((*log)->record_outcome("file://a", 0, ManifestResult::Error, "late").has_value());
    ASSERT_TRUE((*log)->record_outcome("file://c", 0, ManifestResult::Skip, "Skipping existing item: gs://b/c").has_value());

    const auto rows = objcp::extensions::csv_parse(objcp::test::read_file(path));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0][0], "Source");
    EXPECT_EQ(rows[0][4], "Md5");
    EXPECT_EQ(rows[1][0], "file://a");
    EXPECT_EQ(rows[1][1], "gs://b/a");
    EXPECT_EQ(rows[1][4], "deadbeef");
    EXPECT_EQ(rows[1][7], "10");
    EXPECT_EQ(rows[1][8], "OK");
    EXPECT_EQ(rows[2][8], "skip");
}

TEST(ManifestTest, ReopenedManifestKnowsHandledItems)
{
    objcp::test::TempDir dir;
    const auto path = dir / "manifest.csv";
    {
        auto log = ManifestLog::open(path).value();
        ASSERT_TRUE(log->record_outcome("gs://b/ok", 5, ManifestResult::Ok).has_value());
        ASSERT_TRUE(log->record_outcome("gs://b/skipped", 0, ManifestResult::Skip).has_value());
        ASSERT_TRUE(log->record_outcome("gs://b/failed", 0, ManifestResult::Error, "boom, twice").has_value());
    }

    auto log = ManifestLog::open(path).value();
    EXPECT_TRUE(log->was_already_handled("gs://b/ok"));
    EXPECT_TRUE(log->was_already_handled("gs://b/skipped"));
    EXPECT_FALSE(log->was_already_handled("gs://b/failed"));
    EXPECT_FALSE(log->was_already_handled("gs://b/never"));

    auto failed = log->previous_entry("gs://b/failed");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->description, "boom, twice");
}

TEST(ManifestTest, LastRowOfASourceWins)
{
    objcp::test::TempDir dir;
    const auto path = dir / "manifest.csv";
    {
        auto log = ManifestLog::open(path).value();
        ASSERT_TRUE(log->record_outcome("gs://b/x", 0, ManifestResult::Error, "first run").has_value());
    }
    {
        auto log = ManifestLog::open(path).value();
        EXPECT_FALSE(log->was_already_handled("gs://b/x"));
        ASSERT_TRUE(log->record_outcome("gs://b/x", 3, ManifestResult::Ok).has_value());
    }
    auto log = ManifestLog::open(path).value();
    EXPECT_TRUE(log->was_already_handled("gs://b/x"));
    EXPECT_EQ(log->previous_entry("gs://b/x")->bytes_transferred, 3u);
}

TEST(ManifestTest, TruncatedTailIsIgnored)
{
    objcp::test::TempDir dir;
    const auto path = dir / "manifest.csv";
    {
        auto log = ManifestLog::open(path).value();
        ASSERT_TRUE(log->record_outcome("gs://b/done", 1, ManifestResult::Ok).has_value());
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "gs://b/partial,gs://c/partial,2024";
    }
    auto log = ManifestLog::open(path);
    ASSERT_TRUE(log.has_value());
    EXPECT_TRUE((*log)->was_already_handled("gs://b/done"));
    EXPECT_FALSE((*log)->was_already_handled("gs://b/partial"));
}

TEST(ManifestTest, CompleteLengthStopsBeforeTornRow)
{
    using objcp::extensions::csv_complete_length;
    EXPECT_EQ(csv_complete_length(""), 0u);
    EXPECT_EQ(csv_complete_length("a,b\n"), 4u);
    EXPECT_EQ(csv_complete_length("a,b\nc,d"), 4u);
    EXPECT_EQ(csv_complete_length("a,\"x\ny\"\n"), 8u);
    EXPECT_EQ(csv_complete_length("a,b\nc,\"open\nstill open\n"), 4u);
}

TEST(ManifestTest, RowsAppendedAfterTornRowSurviveReopen)
{
    objcp::test::TempDir dir;
    const auto path = dir / "manifest.csv";
    {
        auto log = ManifestLog::open(path).value();
        ASSERT_TRUE(log->record_outcome("gs://b/done", 1, ManifestResult::Ok).has_value());
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "gs://b/partial,gs://c/partial,2024";
    }
    {
        auto log = ManifestLog::open(path).value();
        ASSERT_TRUE(log->record_outcome("gs://b/next", 2, ManifestResult::Ok).has_value());
    }
    auto log = ManifestLog::open(path).value();
    EXPECT_TRUE(log->was_already_handled("gs://b/done"));
    EXPECT_TRUE(log->was_already_handled("gs://b/next"));
    EXPECT_FALSE(log->was_already_handled("gs://b/partial"));
    EXPECT_EQ(objcp::extensions::csv_parse(objcp::test::read_file(path)).size(), 3u);
}

TEST(ManifestTest, RowsAppendedAfterTornQuotedFieldSurviveReopen)
{
    objcp::test::TempDir dir;
    const auto path = dir / "manifest.csv";
    {
        auto log = ManifestLog::open(path).value();
        ASSERT_TRUE(log->record_outcome("gs://b/a", 1, ManifestResult::Ok).has_value());
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "gs://b/x,gs://c/x,2024-01-01T00:00:00.000000Z,,,,0,0,error,\"Transfer failed, retry\n";
    }
    {
        auto log = ManifestLog::open(path).value();
        ASSERT_TRUE(log->record_outcome("gs://b/n1", 1, ManifestResult::Ok).has_value());
        ASSERT_TRUE(log->record_outcome("gs://b/n2", 1, ManifestResult::Skip, "exists, \"kept\"").has_value());
    }
    auto log = ManifestLog::open(path).value();
    EXPECT_TRUE(log->was_already_handled("gs://b/a"));
    EXPECT_TRUE(log->was_already_handled("gs://b/n1"));
    EXPECT_TRUE(log->was_already_handled("gs://b/n2"));
    EXPECT_FALSE(log->previous_entry("gs://b/x").has_value());
}

TEST(ManifestTest, TornRowWrittenAfterOpenIsDroppedOnAppend)
{
    objcp::test::TempDir dir;
    const auto path = dir / "manifest.csv";
    auto log = ManifestLog::open(path).value();
    ASSERT_TRUE(log->record_outcome("gs://b/first", 1, ManifestResult::Ok).has_value());
    {
        std::ofstream out(path, std::ios::app);
        out << "gs://b/other-run,gs://c/other";
    }
    ASSERT_TRUE(log->record_outcome("gs://b/second", 1, ManifestResult::Ok).has_value());

    auto reopened = ManifestLog::open(path).value();
    EXPECT_TRUE(reopened->was_already_handled("gs://b/first"));
    EXPECT_TRUE(reopened->was_already_handled("gs://b/second"));
}
