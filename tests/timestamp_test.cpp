#include <chrono>

#include <gtest/gtest.h>

#include "tasks/timestamp.hpp"

namespace filecron::tasks {
namespace {

// 2026-01-01T02:00:00Z
constexpr long long kNewYearTenAmShanghai = 1767232800;

std::chrono::system_clock::time_point AtEpochSeconds(long long seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

TEST(TimestampTest, OffsetFormsDenoteTheSameInstant) {
    const auto shanghai = ParseTimestamp("2026-01-01T10:00:00+08:00");
    const auto utc = ParseTimestamp("2026-01-01T02:00:00Z");
    const auto compact_offset = ParseTimestamp("2026-01-01T02:00:00+0000");
    const auto new_york = ParseTimestamp("2025-12-31T21:00:00-05:00");
    ASSERT_TRUE(shanghai.has_value());
    ASSERT_TRUE(utc.has_value());
    ASSERT_TRUE(compact_offset.has_value());
    ASSERT_TRUE(new_york.has_value());

    EXPECT_EQ(shanghai->instant, AtEpochSeconds(kNewYearTenAmShanghai));
    EXPECT_EQ(utc->instant, shanghai->instant);
    EXPECT_EQ(compact_offset->instant, shanghai->instant);
    EXPECT_EQ(new_york->instant, shanghai->instant);

    EXPECT_EQ(shanghai->offset_minutes, 480);
    EXPECT_EQ(shanghai->offset_token, "+08:00");
    EXPECT_EQ(utc->offset_minutes, 0);
    EXPECT_EQ(utc->offset_token, "Z");
    EXPECT_EQ(new_york->offset_minutes, -300);
}

TEST(TimestampTest, MissingOffsetUsesDefaultZone) {
    const auto parsed = ParseTimestamp("2026-01-01T10:00:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->instant, AtEpochSeconds(kNewYearTenAmShanghai));
    EXPECT_EQ(parsed->offset_minutes, kDefaultOffsetMinutes);
    EXPECT_TRUE(parsed->offset_token.empty());
}

TEST(TimestampTest, SecondsAreOptional) {
    const auto parsed = ParseTimestamp("2026-01-01T10:00+08:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->instant, AtEpochSeconds(kNewYearTenAmShanghai));
}

TEST(TimestampTest, FractionalSecondsKeepMilliseconds) {
    const auto parsed = ParseTimestamp("2026-01-01T02:00:00.25Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->instant, AtEpochSeconds(kNewYearTenAmShanghai) + std::chrono::milliseconds(250));
}

TEST(TimestampTest, CompactShorthandIsNormalized) {
    EXPECT_EQ(NormalizeScheduledTime("2026-01-01-10:00").value(), "2026-01-01T10:00:00+08:00");
    EXPECT_EQ(NormalizeScheduledTime("  2026-01-01T10:00:00Z ").value(), "2026-01-01T10:00:00Z");
    EXPECT_FALSE(NormalizeScheduledTime("tomorrow").has_value());
    EXPECT_FALSE(NormalizeScheduledTime("").has_value());

    const auto parsed = ParseTimestamp("2026-01-01-10:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->instant, AtEpochSeconds(kNewYearTenAmShanghai));
    EXPECT_EQ(parsed->offset_token, "+08:00");
}

TEST(TimestampTest, RejectsOutOfRangeFields) {
    EXPECT_FALSE(ParseTimestamp("2026-02-29T10:00:00Z").has_value());
    EXPECT_TRUE(ParseTimestamp("2024-02-29T10:00:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2100-02-29T10:00:00Z").has_value());
    EXPECT_TRUE(ParseTimestamp("2000-02-29T10:00:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-13-01T10:00:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-04-31T10:00:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01T24:00:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01T10:60:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01T10:00:61Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01T10:00:00+24:00").has_value());
}

TEST(TimestampTest, RejectsInstantsTheClockCannotRepresent) {
    EXPECT_FALSE(ParseTimestamp("2300-01-01T00:00:00+08:00").has_value());
    EXPECT_FALSE(ParseTimestamp("9999-12-31T23:59:59Z").has_value());
    EXPECT_FALSE(ParseTimestamp("1600-01-01T00:00:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2300-01-01-10:00").has_value());

    const auto far = ParseTimestamp("2200-01-01T00:00:00Z");
    ASSERT_TRUE(far.has_value());
    EXPECT_GT(far->instant, AtEpochSeconds(kNewYearTenAmShanghai));
    const auto early = ParseTimestamp("1700-01-01T00:00:00Z");
    ASSERT_TRUE(early.has_value());
    EXPECT_LT(early->instant, AtEpochSeconds(0));
}

TEST(TimestampTest, RejectsMalformedText) {
    EXPECT_FALSE(ParseTimestamp("not a time").has_value());
    EXPECT_FALSE(ParseTimestamp("2026/01/01T10:00:00Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01T10:00:00+8").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01T10:00:00Z trailing").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01T10:00:00.Z").has_value());
    EXPECT_FALSE(ParseTimestamp("2026-01-01 10:00:00").has_value());
}

TEST(TimestampTest, CivilConversionHandlesDatesBeforeEpoch) {
    EXPECT_EQ(DaysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(DaysFromCivil(1969, 12, 31), -1);

    const auto civil = CivilFromLocalSeconds(-1);
    EXPECT_EQ(civil.year, 1969);
    EXPECT_EQ(civil.month, 12u);
    EXPECT_EQ(civil.day, 31u);
    EXPECT_EQ(civil.hour, 23u);
    EXPECT_EQ(civil.minute, 59u);
    EXPECT_EQ(civil.second, 59u);
}

TEST(TimestampTest, FormatLocalUsesTheTimestampOffset) {
    const auto parsed = ParseTimestamp("2026-01-01T02:00:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(FormatLocal(*parsed), "2026-01-01 02:00:00");

    auto shifted = *parsed;
    shifted.offset_minutes = 480;
    EXPECT_EQ(FormatLocal(shifted), "2026-01-01 10:00:00");
}

TEST(TimestampTest, FormatIsoAppendsTokenVerbatim) {
    EXPECT_EQ(FormatIso(AtEpochSeconds(kNewYearTenAmShanghai), 480, "+08:00"), "2026-01-01T10:00:00+08:00");
    EXPECT_EQ(FormatIso(AtEpochSeconds(kNewYearTenAmShanghai), -330, "-0530"), "2025-12-31T20:30:00-0530");
}

TEST(RecurrenceRenewalTest, AddsIntervalInTheSameOffset) {
    EXPECT_EQ(AdvanceTimestamp("2026-01-01T10:00:00+08:00", 60).value(), "2026-01-01T10:01:00+08:00");
}

TEST(RecurrenceRenewalTest, CrossesDayMonthAndYearBoundaries) {
    EXPECT_EQ(AdvanceTimestamp("2025-12-31T23:59:30-0530", 45).value(), "2026-01-01T00:00:15-0530");
    EXPECT_EQ(AdvanceTimestamp("2026-02-28T23:00:00Z", 3600).value(), "2026-03-01T00:00:00Z");
    EXPECT_EQ(AdvanceTimestamp("2024-02-28T12:00:00+08:00", 86400).value(), "2024-02-29T12:00:00+08:00");
}

TEST(RecurrenceRenewalTest, MissingTokenRendersDefaultOffset) {
    EXPECT_EQ(AdvanceTimestamp("2026-01-01T10:00:00", 60).value(), "2026-01-01T10:01:00+08:00");
    EXPECT_EQ(AdvanceTimestamp("2026-01-01-10:00", 30).value(), "2026-01-01T10:00:30+08:00");
}

TEST(RecurrenceRenewalTest, DropsFractionalSeconds) {
    EXPECT_EQ(AdvanceTimestamp("2026-01-01T10:00:00.900+08:00", 1).value(), "2026-01-01T10:00:01+08:00");
}

TEST(RecurrenceRenewalTest, RejectsNonPositiveIntervalAndBadInput) {
    EXPECT_FALSE(AdvanceTimestamp("2026-01-01T10:00:00+08:00", 0).has_value());
    EXPECT_FALSE(AdvanceTimestamp("2026-01-01T10:00:00+08:00", -5).has_value());
    EXPECT_FALSE(AdvanceTimestamp("garbage", 60).has_value());
}

TEST(RecurrenceRenewalTest, RejectsIntervalsPastTheClockRange) {
    EXPECT_FALSE(AdvanceTimestamp("2026-01-01T10:00:00+08:00", 10000000000LL).has_value());
    EXPECT_FALSE(AdvanceTimestamp("2262-01-01T00:00:00Z", 366LL * 86400).has_value());
    EXPECT_FALSE(AdvanceTimestamp("1700-01-01T00:00:00Z", 9223372036LL * 2).has_value());
    EXPECT_EQ(AdvanceTimestamp("2200-01-01T00:00:00Z", 86400).value(), "2200-01-02T00:00:00Z");
}

}  // namespace
}  // namespace filecron::tasks
