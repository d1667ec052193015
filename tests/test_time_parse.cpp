#include <gtest/gtest.h>

#include "time_parse.hpp"

#include <ctime>

using namespace timeparse;

// 2025-03-12 is a Wednesday
static std::tm wednesday() {
    std::tm day{};
    day.tm_year = 2025 - 1900;
    day.tm_mon  = 2;
    day.tm_mday = 12;
    day.tm_hour = 12;
    day.tm_isdst = -1;
    std::mktime(&day);
    return day;
}

TEST(DurationParse, SumsHoursAndMinutes) {
    EXPECT_EQ(parseDuration("1 hour 30 minutes"), 5400);
    EXPECT_EQ(parseDuration("2 hours"), 7200);
    EXPECT_EQ(parseDuration("5 min 30 sec"), 330);
    EXPECT_EQ(parseDuration("90 seconds"), 90);
}

TEST(DurationParse, BareNumberIsMinutes) {
    EXPECT_EQ(parseDuration("45"), 2700);
    EXPECT_EQ(parseDuration("  10 "), 600);
}

TEST(DurationParse, NothingParseableIsZero) {
    EXPECT_EQ(parseDuration(""), 0);
    EXPECT_EQ(parseDuration("a while"), 0);
}

TEST(DurationParse, HugeNumbersDoNotOverflow) {
    EXPECT_GT(parseDuration("99999999999999999999 hours"), 0);
}

TEST(FormatRemaining, PicksLargestUnit) {
    EXPECT_EQ(formatRemaining(3900), "1h 5m 0s");
    EXPECT_EQ(formatRemaining(300), "5m 0s");
    EXPECT_EQ(formatRemaining(42), "42s");
    EXPECT_EQ(formatRemaining(-3), "0s");
}

TEST(NormalizeTime, TwelveHourClock) {
    EXPECT_EQ(normalizeTime("7am"), "07:00");
    EXPECT_EQ(normalizeTime("7:30 pm"), "19:30");
    EXPECT_EQ(normalizeTime("12am"), "00:00");
    EXPECT_EQ(normalizeTime("12pm"), "12:00");
}

TEST(NormalizeTime, TwentyFourHourClock) {
    EXPECT_EQ(normalizeTime("14:30"), "14:30");
    EXPECT_EQ(normalizeTime("0930"), "09:30");
}

TEST(NormalizeTime, UnrecognizedTextComesBack) {
    EXPECT_EQ(normalizeTime("noon"), "noon");
    EXPECT_EQ(normalizeTime("25:00"), "25:00");
}

TEST(ParseDate, RelativeWords) {
    const auto today = wednesday();
    EXPECT_EQ(parseDate("today", today), "2025-03-12");
    EXPECT_EQ(parseDate("", today), "2025-03-12");
    EXPECT_EQ(parseDate("Tomorrow", today), "2025-03-13");
}

TEST(ParseDate, WeekdaysAreStrictlyAhead) {
    const auto today = wednesday();
    EXPECT_EQ(parseDate("friday", today), "2025-03-14");
    EXPECT_EQ(parseDate("wednesday", today), "2025-03-19");
    EXPECT_EQ(parseDate("monday", today), "2025-03-17");
    EXPECT_EQ(parseDate("next friday", today), "2025-03-21");
}

TEST(ParseDate, IsoDatesPassThrough) {
    const auto today = wednesday();
    EXPECT_EQ(parseDate("2025-12-25", today), "2025-12-25");
    // Invalid day falls back to today
    EXPECT_EQ(parseDate("2025-02-30", today), "2025-03-12");
}

TEST(ParseDate, UnknownTextIsToday) {
    EXPECT_EQ(parseDate("someday", wednesday()), "2025-03-12");
}

TEST(AddMinutes, RollsOverMidnight) {
    EXPECT_EQ(addMinutes("2025-03-12 23:30:00", 60), "2025-03-13 00:30:00");
    EXPECT_EQ(addMinutes("2025-03-12 09:00:00", 45), "2025-03-12 09:45:00");
    EXPECT_FALSE(addMinutes("2025-03-12 noon:00", 60).has_value());
}
