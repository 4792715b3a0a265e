#include <gtest/gtest.h>

#include <cstdint>
#include <iostream>
#include <string>

#include "progress.hpp"

TEST(ProgressTest, EmptyFileIsComplete) { EXPECT_DOUBLE_EQ(progress_percent(0, 0), 100.0); }

TEST(ProgressTest, PercentOfTotal) {
    EXPECT_DOUBLE_EQ(progress_percent(0, 200), 0.0);
    EXPECT_DOUBLE_EQ(progress_percent(50, 200), 25.0);
    EXPECT_DOUBLE_EQ(progress_percent(200, 200), 100.0);
}

TEST(ProgressTest, HundredOnlyAtCompletion) {
    const std::uint64_t total = 102400;
    for (std::uint64_t done = 0; done < total; done += 1023) {
        EXPECT_LT(progress_percent(done, total), 100.0);
    }
    EXPECT_LT(progress_percent(total - 1, total), 100.0);
    EXPECT_DOUBLE_EQ(progress_percent(total, total), 100.0);
}

TEST(ProgressTest, MonotonicForIncreasingCounts) {
    const std::uint64_t total = (std::uint64_t{1} << 40) + 17;
    double last = -1.0;
    for (std::uint64_t done = 0; done <= total; done += total / 97) {
        const double pct = progress_percent(done, total);
        EXPECT_GE(pct, last);
        last = pct;
    }
}

TEST(ProgressTest, ConsoleProgressIsSilentWhenQuiet) {
    Log::set_level(Log::Level::Quiet);
    testing::internal::CaptureStdout();
    ConsoleProgress bar;
    bar(10, 100);
    bar(100, 100);
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");
}

TEST(ProgressTest, ConsoleProgressPrintsBytes) {
    Log::set_level(Log::Level::Info);
    testing::internal::CaptureStdout();
    ConsoleProgress bar;
    bar(512, 1024);
    const std::string out = testing::internal::GetCapturedStdout();
    Log::set_level(Log::Level::Quiet);
    EXPECT_NE(out.find("50.0%"), std::string::npos);
    EXPECT_NE(out.find("(512/1024 bytes)"), std::string::npos);
}

TEST(ProgressTest, HugeTotalsStayBelowHundred) {
    const std::uint64_t total = std::uint64_t{1} << 60;
    EXPECT_LT(progress_percent(total - 1, total), 100.0);
    EXPECT_LT(progress_percent(total - 1000, total), 100.0);
    EXPECT_DOUBLE_EQ(progress_percent(total, total), 100.0);
}

TEST(ProgressTest, ConsoleProgressNeverShowsHundredEarly) {
    Log::set_level(Log::Level::Info);
    testing::internal::CaptureStdout();
    ConsoleProgress bar;
    bar(999999, 1000000);
    const std::string out = testing::internal::GetCapturedStdout();
    Log::set_level(Log::Level::Quiet);
    EXPECT_EQ(out.find("100.0%"), std::string::npos);
    EXPECT_NE(out.find("99.9%"), std::string::npos);
}

TEST(ProgressTest, ConsoleProgressLeavesStreamFormatAlone) {
    Log::set_level(Log::Level::Info);
    const auto flags = std::cout.flags();
    const auto precision = std::cout.precision();
    testing::internal::CaptureStdout();
    ConsoleProgress bar;
    bar(1, 3);
    std::cout << 2.5;
    const std::string out = testing::internal::GetCapturedStdout();
    Log::set_level(Log::Level::Quiet);
    EXPECT_EQ(std::cout.flags(), flags);
    EXPECT_EQ(std::cout.precision(), precision);
    EXPECT_NE(out.find("bytes)2.5"), std::string::npos);
}
