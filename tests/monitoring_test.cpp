#include <gtest/gtest.h>

#include "infra/monitoring/monitoring.hpp"

#include <string>

using rcopy::infra::ProgressMonitor;

TEST(ProgressMonitorTest, FormatsCountsAndPercentage)
{
    auto line = ProgressMonitor::format_line(1, 4, "IMG_0001.JPG", 120);
    EXPECT_NE(line.find("1/4 (25%)"), std::string::npos) << line;
    EXPECT_NE(line.find("Processing: IMG_0001.JPG"), std::string::npos) << line;
}

TEST(ProgressMonitorTest, TruncatesLongNamesFromTheLeft)
{
    const std::string name(200, 'n');
    auto line = ProgressMonitor::format_line(2, 2, name + "_tail.mov", 100);
    EXPECT_NE(line.find("..."), std::string::npos);
    EXPECT_TRUE(line.ends_with("_tail.mov"));
    EXPECT_EQ(line.find(name), std::string::npos);
}

TEST(ProgressMonitorTest, EmptyTotalRendersNothing)
{
    EXPECT_TRUE(ProgressMonitor::format_line(0, 0, "x", 80).empty());
}

TEST(ProgressMonitorTest, DisabledMonitorStillCountsFailures)
{
    ProgressMonitor monitor(false);
    EXPECT_FALSE(monitor.is_enabled());

    monitor.update(1, 3, "a", true);
    monitor.update(2, 3, "b", false);
    monitor.update(3, 3, "c", true);

    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_files, 3u);
    EXPECT_EQ(stats.total_files, 3u);
    EXPECT_EQ(stats.failed_files, 1u);
}
