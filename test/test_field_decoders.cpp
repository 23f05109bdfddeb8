#include <gtest/gtest.h>

#include <functional>

#include "nmea0183_decoder/field_cursor.hpp"
#include "nmea0183_decoder/field_decoders.hpp"

using namespace nmea0183_decoder;

static ErrorKind kindOf(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const ParseError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ParseError";
    return ErrorKind::Malformed;
}

TEST(ParseInteger, DigitRuns) {
    EXPECT_EQ(parseInteger<uint32_t>("07", "x"), 7u);
    EXPECT_EQ(parseInteger<uint16_t>("65535", "x"), 65535u);
    EXPECT_THROW(parseInteger<uint16_t>("65536", "x"), ParseError);
    EXPECT_THROW(parseInteger<uint8_t>("", "x"), ParseError);
    EXPECT_THROW(parseInteger<uint8_t>("+5", "x"), ParseError);
    EXPECT_THROW(parseInteger<uint32_t>("1a", "x"), ParseError);
    EXPECT_THROW(parseInteger<uint32_t>(" 1", "x"), ParseError);
}

TEST(ParseDouble, Formats) {
    EXPECT_DOUBLE_EQ(parseDouble("1.8", "x"), 1.8);
    EXPECT_DOUBLE_EQ(parseDouble("-46.9", "x"), -46.9);
    EXPECT_DOUBLE_EQ(parseDouble("000.5", "x"), 0.5);
    EXPECT_DOUBLE_EQ(parseDouble("12", "x"), 12.0);
    EXPECT_DOUBLE_EQ(parseDouble("1e2", "x"), 100.0);
    EXPECT_THROW(parseDouble("", "x"), ParseError);
    EXPECT_THROW(parseDouble("1.8M", "x"), ParseError);
    EXPECT_THROW(parseDouble("nan", "x"), ParseError);
    EXPECT_THROW(parseDouble("inf", "x"), ParseError);
    EXPECT_THROW(parseDouble(".", "x"), ParseError);
    EXPECT_EQ(kindOf([] { parseDouble("abc", "x"); }), ErrorKind::InvalidField);
}

TEST(ParseTimeOfDay, WholeSeconds) {
    TimeOfDay t = parseTimeOfDay("125619");
    EXPECT_EQ(t.hour, 12);
    EXPECT_EQ(t.minute, 56);
    EXPECT_EQ(t.second, 19);
    EXPECT_EQ(t.nanosecond, 0u);
}

TEST(ParseTimeOfDay, FractionalSeconds) {
    TimeOfDay t = parseTimeOfDay("125619.5");
    EXPECT_EQ(t.second, 19);
    EXPECT_EQ(t.nanosecond, 500000000u);

    t = parseTimeOfDay("225446.33");
    EXPECT_EQ(t.second, 46);
    EXPECT_EQ(t.nanosecond, 330000000u);
}

TEST(ParseTimeOfDay, FractionRoundingStaysInSecond) {
    // Rounds to 1e9 ns; must not carry into the next second
    TimeOfDay t = parseTimeOfDay("125959.9999999999");
    EXPECT_EQ(t.second, 59);
    EXPECT_EQ(t.nanosecond, 999999999u);
}

TEST(ParseTimeOfDay, OutOfRange) {
    EXPECT_THROW(parseTimeOfDay("245446"), ParseError);
    EXPECT_THROW(parseTimeOfDay("126019"), ParseError);
    EXPECT_THROW(parseTimeOfDay("125960"), ParseError);
    EXPECT_THROW(parseTimeOfDay("1256-1"), ParseError);
    EXPECT_THROW(parseTimeOfDay("1256"), ParseError);
    EXPECT_THROW(parseTimeOfDay("1x5619"), ParseError);
}

TEST(ParseDate, TwoDigitYearKept) {
    Date d = parseDate("191194");
    EXPECT_EQ(d.day, 19);
    EXPECT_EQ(d.month, 11);
    EXPECT_EQ(d.year, 94);
}

TEST(ParseDate, CoarseRangeCheck) {
    EXPECT_THROW(parseDate("191394"), ParseError);
    EXPECT_THROW(parseDate("190094"), ParseError);
    EXPECT_THROW(parseDate("001194"), ParseError);
    EXPECT_THROW(parseDate("321194"), ParseError);
    EXPECT_THROW(parseDate("19119"), ParseError);
    // No per-month check: 31st of February passes.
    Date d = parseDate("310224");
    EXPECT_EQ(d.day, 31);
    EXPECT_EQ(d.month, 2);
}

TEST(ParseLatLon, Hemispheres) {
    EXPECT_NEAR(parseLatitude("4807.038", "N"), 48.0 + 7.038 / 60.0, 1e-9);
    EXPECT_NEAR(parseLongitude("01131.324", "E"), 11.0 + 31.324 / 60.0, 1e-9);
    EXPECT_NEAR(parseLatitude("4916.45", "S"), -(49.0 + 16.45 / 60.0), 1e-9);
    EXPECT_NEAR(parseLongitude("12311.12", "W"), -(123.0 + 11.12 / 60.0), 1e-9);
}

TEST(ParseLatLon, Invalid) {
    EXPECT_THROW(parseLatitude("4807.038", "E"), ParseError);
    EXPECT_THROW(parseLatitude("4807.038", ""), ParseError);
    EXPECT_THROW(parseLongitude("01131.324", "N"), ParseError);
    EXPECT_THROW(parseLatitude("48", "N"), ParseError);
    EXPECT_THROW(parseLatitude("", "N"), ParseError);
    EXPECT_THROW(parseLatitude("48-7.0", "N"), ParseError);
}

TEST(FieldCursor, SplitsFields) {
    FieldCursor f("a,,b,");
    EXPECT_EQ(f.remaining(), 4u);
    EXPECT_EQ(f.peek(), "a");
    EXPECT_EQ(f.next("first"), "a");
    EXPECT_EQ(f.next("second"), "");
    EXPECT_FALSE(f.restIsEmpty());
    EXPECT_EQ(f.next("third"), "b");
    EXPECT_TRUE(f.restIsEmpty());
    EXPECT_EQ(f.next("fourth"), "");
    EXPECT_TRUE(f.atEnd());
    EXPECT_EQ(f.remaining(), 0u);
    EXPECT_EQ(f.nextOrEmpty(), "");
    EXPECT_EQ(kindOf([&f] { f.next("fifth"); }), ErrorKind::InvalidField);
}

TEST(FieldCursor, OptionalNumbers) {
    FieldCursor f("07,,1.8,");
    EXPECT_EQ(f.optionalInteger<uint32_t>("sats"), std::optional<uint32_t>(7));
    EXPECT_EQ(f.optionalInteger<uint32_t>("sats"), std::nullopt);
    auto hdop = f.optionalFloat("hdop");
    ASSERT_TRUE(hdop.has_value());
    EXPECT_FLOAT_EQ(*hdop, 1.8f);
    EXPECT_EQ(f.optionalFloat("alt"), std::nullopt);
    // Past the end reads as empty for optional fields.
    EXPECT_EQ(f.optionalFloat("geoid"), std::nullopt);
}

TEST(FieldCursor, RequiredChar) {
    FieldCursor f("A,AD,");
    EXPECT_EQ(f.requiredChar("status", "ADV"), 'A');
    EXPECT_THROW(f.requiredChar("status", "ADV"), ParseError);
    EXPECT_THROW(f.requiredChar("status", "ADV"), ParseError);
}

TEST(FieldCursor, NoFixLatLon) {
    FieldCursor f(",,,,0");
    EXPECT_EQ(f.optionalLatLon(), std::nullopt);
    EXPECT_EQ(f.next("quality"), "0");
}

TEST(FieldCursor, PartialLatLonFails) {
    FieldCursor f("4807.038,,01131.324,E");
    EXPECT_THROW(f.optionalLatLon(), ParseError);

    FieldCursor g(",,,");
    EXPECT_THROW(g.requiredLatLon(), ParseError);
}
