#include <gtest/gtest.h>

#include "cli/report/report.hpp"

#include <string>

using rcopy::cli::format_report;
using rcopy::core::SessionMode;
using rcopy::core::SessionReport;

TEST(ReportTest, CopyReportShowsTotalsAndErrorLogPointer)
{
    SessionReport r;
    r.mode = SessionMode::Copy;
    r.error_log = "/backup/.copy_errors.log";
    r.discovered = 10;
    r.skipped = 4;
    r.attempted = 6;
    r.copied = 5;
    r.failed = 1;

    auto text = format_report(r);
    EXPECT_NE(text.find("Copy operation finished."), std::string::npos);
    EXPECT_NE(text.find("Total files in source:      10"), std::string::npos);
    EXPECT_NE(text.find("Skipped (already copied):   4"), std::string::npos);
    EXPECT_NE(text.find("Successfully copied now:    5"), std::string::npos);
    EXPECT_NE(text.find("Errors during this session: 1"), std::string::npos);
    EXPECT_NE(text.find("/backup/.copy_errors.log"), std::string::npos);
}

TEST(ReportTest, CopyReportWithoutFailuresHasNoErrorLogPointer)
{
    SessionReport r;
    r.error_log = "/backup/.copy_errors.log";
    r.discovered = 2;
    r.skipped = 2;
    r.nothing_to_do = true;

    auto text = format_report(r);
    EXPECT_EQ(text.find("/backup/.copy_errors.log"), std::string::npos);
    EXPECT_NE(text.find("All files were already copied."), std::string::npos);
}

TEST(ReportTest, RetryReportNothingToDo)
{
    SessionReport r;
    r.mode = SessionMode::Retry;
    r.nothing_to_do = true;

    EXPECT_NE(format_report(r).find("Nothing to retry"), std::string::npos);
}

TEST(ReportTest, RetryReportSuccessAndRemaining)
{
    SessionReport ok;
    ok.mode = SessionMode::Retry;
    ok.attempted = 3;
    ok.copied = 3;
    EXPECT_NE(format_report(ok).find("Success! All previously failed files have been copied."), std::string::npos);

    SessionReport partial = ok;
    partial.copied = 2;
    partial.failed = 1;
    partial.error_log = "/backup/.copy_errors.log";
    auto text = format_report(partial);
    EXPECT_NE(text.find("Still failing:              1"), std::string::npos);
    EXPECT_NE(text.find("still listed in: /backup/.copy_errors.log"), std::string::npos);
}

TEST(ReportTest, InterruptedRunIsMarked)
{
    SessionReport r;
    r.interrupted = true;
    r.discovered = 3;
    r.attempted = 1;
    r.copied = 1;
    r.not_attempted = 2;

    auto text = format_report(r);
    EXPECT_NE(text.find("Copy operation interrupted."), std::string::npos);
    EXPECT_NE(text.find("Not attempted (stopped):    2"), std::string::npos);
}
