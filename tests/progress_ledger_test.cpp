#include <gtest/gtest.h>

#include "core/ledger/path_set.hpp"
#include "core/ledger/progress_ledger.hpp"
#include "test_utils.hpp"

using rcopy::core::PathSet;
using rcopy::core::ProgressLedger;
using rcopy::testing::TempDir;
using rcopy::testing::read_lines;
using rcopy::testing::write_file;

TEST(PathSetTest, CaseInsensitiveByDefault)
{
    PathSet set;
    EXPECT_TRUE(set.insert("/src/Photos/IMG_0001.JPG"));
    EXPECT_TRUE(set.contains("/src/photos/img_0001.jpg"));
    EXPECT_FALSE(set.insert("/SRC/PHOTOS/IMG_0001.jpg"));
    EXPECT_EQ(set.size(), 1u);
}

TEST(PathSetTest, CaseSensitiveWhenRequested)
{
    PathSet set(true);
    set.insert("/src/a.txt");
    EXPECT_FALSE(set.contains("/src/A.txt"));
    EXPECT_TRUE(set.contains("/src/a.txt"));
}

TEST(ProgressLedgerTest, MissingFileLoadsEmptySet)
{
    TempDir dir;
    ProgressLedger ledger(dir / ".copy_progress.log");

    auto done = ledger.load();
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(done->empty());
    EXPECT_FALSE(std::filesystem::exists(ledger.path()));
}

TEST(ProgressLedgerTest, RecordSuccessCreatesAndAppends)
{
    TempDir dir;
    ProgressLedger ledger(dir / ".copy_progress.log");

    ASSERT_TRUE(ledger.record_success("/src/a.txt").has_value());
    ASSERT_TRUE(ledger.record_success("/src/sub/b.txt").has_value());

    auto lines = read_lines(ledger.path());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "/src/a.txt");
    EXPECT_EQ(lines[1], "/src/sub/b.txt");
}

TEST(ProgressLedgerTest, LoadSkipsBlankLinesAndCollapsesDuplicates)
{
    TempDir dir;
    const auto path = dir / ".copy_progress.log";
    write_file(path, "/src/a.txt\n\n/src/A.TXT\r\n/src/b.txt\n/src/a.txt\n");

    ProgressLedger ledger(path);
    auto done = ledger.load();
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->size(), 2u);
    EXPECT_TRUE(done->contains("/src/a.txt"));
    EXPECT_TRUE(done->contains("/src/B.txt"));
    EXPECT_FALSE(done->contains(""));
}

TEST(ProgressLedgerTest, DuplicateAppendsAreTolerated)
{
    TempDir dir;
    ProgressLedger ledger(dir / ".copy_progress.log", false);

    ASSERT_TRUE(ledger.record_success("/src/a.txt").has_value());
    ASSERT_TRUE(ledger.record_success("/src/a.txt").has_value());

    EXPECT_EQ(read_lines(ledger.path()).size(), 2u);
    auto done = ledger.load();
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->size(), 1u);
}

TEST(ProgressLedgerTest, UnwritableLocationIsReported)
{
    TempDir dir;
    ProgressLedger ledger(dir / "missing" / "dir" / ".copy_progress.log");

    auto res = ledger.record_success("/src/a.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, rcopy::infra::ErrorCode::LedgerIOFailed);
}
