/**
 * @file test_unit_parser.cpp
 * @brief Unit tests for radius and coordinate parsing
 */

#include <gtest/gtest.h>

#include "core/UnitParser.hpp"

using namespace geoenrich;

class UnitParserTest : public ::testing::Test {
protected:
    UnitParser parser_;
};

// =============================================================================
// Radius
// =============================================================================

TEST_F(UnitParserTest, BareNumberIsMiles) {
    EXPECT_DOUBLE_EQ(5.0, parser_.parse_radius_miles("5"));
    EXPECT_DOUBLE_EQ(2.5, parser_.parse_radius_miles(" 2.5 "));
}

TEST_F(UnitParserTest, UnitSuffixesConvertToMiles) {
    EXPECT_DOUBLE_EQ(5.0, parser_.parse_radius_miles("5mi"));
    EXPECT_NEAR(8000.0 / 1609.34, parser_.parse_radius_miles("8km"), 1e-9);
    EXPECT_NEAR(2000 * 0.3048 / 1609.34, parser_.parse_radius_miles("2000ft"), 1e-9);
    EXPECT_NEAR(1500.0 / 1609.34, parser_.parse_radius_miles("1500 m"), 1e-9);
    EXPECT_NEAR(1760 * 0.9144 / 1609.34, parser_.parse_radius_miles("1760yd"), 1e-9);
}

TEST_F(UnitParserTest, ExplicitUnitIsReported) {
    auto parsed = parser_.parse_distance("3 km", DistanceUnit::MILES, DistanceUnit::METERS);
    EXPECT_DOUBLE_EQ(3000.0, parsed.value);
    EXPECT_EQ(DistanceUnit::KILOMETERS, parsed.original_unit);
    EXPECT_TRUE(parsed.had_explicit_unit);
}

TEST_F(UnitParserTest, BadInputThrows) {
    EXPECT_THROW(parser_.parse_radius_miles(""), UnitParseError);
    EXPECT_THROW(parser_.parse_radius_miles("miles"), UnitParseError);
    EXPECT_THROW(parser_.parse_radius_miles("5 furlongs"), UnitParseError);
}

TEST(UnitConversionTest, MileIsDefinedInMeters) {
    EXPECT_DOUBLE_EQ(1609.34, UnitParser::convert_distance(1.0, DistanceUnit::MILES, DistanceUnit::METERS));
    EXPECT_EQ("mi", UnitParser::unit_to_string(UnitParser::parse_unit_string("Miles")));
}

// =============================================================================
// Coordinates
// =============================================================================

TEST_F(UnitParserTest, DecimalDegrees) {
    EXPECT_DOUBLE_EQ(29.7604, parser_.parse_latitude("29.7604"));
    EXPECT_DOUBLE_EQ(-95.3698, parser_.parse_longitude("-95.3698"));
}

TEST_F(UnitParserTest, DegreesMinutesSecondsWithHemisphere) {
    EXPECT_NEAR(43.5, parser_.parse_latitude("43°30'00\"N"), 1e-9);
    EXPECT_NEAR(-71.25, parser_.parse_longitude("71d15'W"), 1e-9);
}

TEST_F(UnitParserTest, OutOfRangeRejected) {
    EXPECT_THROW(parser_.parse_latitude("91"), UnitParseError);
    EXPECT_THROW(parser_.parse_longitude("-180.5"), UnitParseError);
    EXPECT_THROW(parser_.parse_latitude("north"), UnitParseError);
}

TEST_F(UnitParserTest, CoordinatePair) {
    auto [lat, lon] = parser_.parse_coordinate_pair("43.0, -71.5");
    EXPECT_DOUBLE_EQ(43.0, lat);
    EXPECT_DOUBLE_EQ(-71.5, lon);
}
