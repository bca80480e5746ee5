#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>

TEST(TimeUtils, FormatElapsedNegative) {
    EXPECT_EQ(format_elapsed(-1), "-");
}

TEST(TimeUtils, FormatElapsedMilliseconds) {
    EXPECT_EQ(format_elapsed(0), "0ms");
    EXPECT_EQ(format_elapsed(350), "350ms");
}

TEST(TimeUtils, FormatElapsedSeconds) {
    EXPECT_EQ(format_elapsed(8400), "8.4s");
    EXPECT_EQ(format_elapsed(45000), "45.0s");
}

TEST(TimeUtils, FormatElapsedMinutes) {
    EXPECT_EQ(format_elapsed((5 * 60 + 30) * 1000), "5m30s");
}

TEST(TimeUtils, FormatElapsedHours) {
    EXPECT_EQ(format_elapsed((2 * 3600 + 15 * 60) * 1000LL), "2h15m");
}

// ── string helpers ──────────────────────────────────────────

TEST(Utils, SplitWhitespaceCollapsesRuns) {
    auto parts = split_whitespace("  npm \t install   express ");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "npm");
    EXPECT_EQ(parts[1], "install");
    EXPECT_EQ(parts[2], "express");
}

TEST(Utils, SplitWhitespaceEmpty) {
    EXPECT_TRUE(split_whitespace("").empty());
    EXPECT_TRUE(split_whitespace("   \t ").empty());
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("abc", 7), 7);
    EXPECT_EQ(safe_stoi("12s", -1), -1);
    EXPECT_EQ(safe_stoi(""), 0);
}

TEST(Utils, JoinArgs) {
    EXPECT_EQ(join_args({"git", "status"}), "git status");
    EXPECT_EQ(join_args({}), "");
}
