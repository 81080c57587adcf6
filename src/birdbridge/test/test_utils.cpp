/**
 * @file test_utils.cpp
 * @brief Unit tests for time formatting and string helpers.
 */

#include <gtest/gtest.h>
#include "test_support.hpp"
#include "utils.hpp"

using namespace std::chrono;

// Epoch plus milliseconds formats as UTC with three fraction digits
TEST(UtilsTest, Iso8601FormatsUtcWithMillis) {
    SystemTime t = system_clock::from_time_t(0) + milliseconds(123);
    EXPECT_EQ(to_iso8601(t), "1970-01-01T00:00:00.123Z");
}

// Formatting and parsing agree to the millisecond
TEST(UtilsTest, Iso8601ParsesWhatItFormats) {
    SystemTime t = system_clock::from_time_t(1718454600) + milliseconds(250);
    auto parsed = parse_iso8601(to_iso8601(t));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(duration_cast<milliseconds>(parsed->time_since_epoch()).count(),
              duration_cast<milliseconds>(t.time_since_epoch()).count());
}

// Timestamps without a fraction are accepted
TEST(UtilsTest, Iso8601WithoutFraction) {
    auto parsed = parse_iso8601("2024-06-15T12:30:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(system_clock::to_time_t(*parsed), 1718454600);
}

TEST(UtilsTest, Iso8601RejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("").has_value());
}

// A zone offset is applied rather than read as UTC
TEST(UtilsTest, Iso8601AppliesOffset) {
    auto utc = parse_iso8601("2025-08-16T12:32:10Z");
    ASSERT_TRUE(utc.has_value());

    auto east = parse_iso8601("2025-08-16T14:32:10+02:00");
    ASSERT_TRUE(east.has_value());
    EXPECT_EQ(*east, *utc);

    auto west = parse_iso8601("2025-08-16T07:02:10.000-0530");
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(*west, *utc);

    auto bare = parse_iso8601("2025-08-16T12:32:10");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(*bare, *utc);
}

TEST(UtilsTest, Iso8601RejectsTrailingText) {
    EXPECT_FALSE(parse_iso8601("2025-08-16T14:32:10junk").has_value());
    EXPECT_FALSE(parse_iso8601("2025-08-16T14:32:10.5Z extra").has_value());
    EXPECT_FALSE(parse_iso8601("2025-08-16T14:32:10+2").has_value());
    EXPECT_FALSE(parse_iso8601("2025-08-16T14:32:10+25:00").has_value());
}

// Tests run with TZ=UTC, so the local date matches the UTC date
TEST(UtilsTest, LocalDateAndTm) {
    SystemTime t = system_clock::from_time_t(1718454600);
    EXPECT_EQ(local_date(t), "2024-06-15");
    std::tm tm = local_tm(t);
    EXPECT_EQ(tm.tm_hour, 12);
    EXPECT_EQ(tm.tm_wday, 6);  // Saturday
}

TEST(UtilsTest, SplitKeepsEmptyFields) {
    auto parts = split("a,,b,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST(UtilsTest, TrimAndLower) {
    EXPECT_EQ(trim("  Blue Jay \t\r\n"), "Blue Jay");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("Northern CARDINAL"), "northern cardinal");
}

TEST(UtilsTest, UrlDecode) {
    EXPECT_EQ(url_decode("Blue%20Jay"), "Blue Jay");
    EXPECT_EQ(url_decode("a+b"), "a b");
    EXPECT_EQ(url_decode("100%"), "100%");
}

TEST(UtilsTest, QueryParam) {
    std::string q = "q=jay&limit=5&name=Blue%20Jay&flag";
    EXPECT_EQ(query_param(q, "q"), "jay");
    EXPECT_EQ(query_param(q, "limit"), "5");
    EXPECT_EQ(query_param(q, "name"), "Blue Jay");
    EXPECT_EQ(query_param(q, "flag"), "");
    EXPECT_EQ(query_param(q, "missing"), "");
}

TEST(UtilsTest, RandomTokenIsBase36) {
    std::string a = random_token(6);
    std::string b = random_token(6);
    EXPECT_EQ(a.size(), 6u);
    for (char c : a) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z')) << c;
    }
    EXPECT_NE(a + random_token(10), b + random_token(10));
}

// Nested directories are created in one call
TEST(UtilsTest, EnsureDirCreatesParents) {
    TempDir tmp;
    std::string nested = tmp.file("a/b/c");
    EXPECT_TRUE(ensure_dir(nested));
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_TRUE(ensure_dir(nested));
}
