/**
 * @file test_input_validator.cpp
 * @brief Unit tests for query validation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/InputValidator.hpp"

#include <cmath>
#include <limits>

using namespace geoenrich;
using ::testing::HasSubstr;

class InputValidatorTest : public ::testing::Test {
protected:
    QuerySpec spec(double lat, double lon, double radius) const {
        QuerySpec q;
        q.origin = Coordinate(lat, lon);
        q.radius_miles = radius;
        return q;
    }

    InputValidator validator_;
};

TEST_F(InputValidatorTest, ValidQueryPassesUnchanged) {
    auto result = validator_.validate(spec(43.0, -71.5, 3.0), 5.0);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_DOUBLE_EQ(3.0, result.sanitized.radius_miles);
    EXPECT_EQ("", result.format_error_message());
}

TEST_F(InputValidatorTest, RadiusAboveCapIsClamped) {
    auto result = validator_.validate(spec(43.0, -71.5, 25.0), 10.0);
    EXPECT_TRUE(result.is_valid);
    ASSERT_EQ(1u, result.warnings.size());
    EXPECT_DOUBLE_EQ(10.0, result.sanitized.radius_miles);
}

TEST_F(InputValidatorTest, NonPositiveRadiusRejected) {
    EXPECT_FALSE(validator_.validate(spec(43.0, -71.5, 0.0), 5.0).is_valid);
    EXPECT_FALSE(validator_.validate(spec(43.0, -71.5, -1.0), 5.0).is_valid);
    EXPECT_FALSE(validator_.validate(spec(43.0, -71.5, std::numeric_limits<double>::quiet_NaN()), 5.0).is_valid);
}

TEST_F(InputValidatorTest, OriginOutOfRangeRejected) {
    auto result = validator_.validate(spec(95.0, -71.5, 1.0), 5.0);
    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.format_error_message(), HasSubstr("outside the valid range"));
}

TEST_F(InputValidatorTest, NoQueryModeRejected) {
    QuerySpec q = spec(43.0, -71.5, 1.0);
    q.want_containing = false;
    q.want_nearby = false;
    EXPECT_FALSE(validator_.validate(q, 5.0).is_valid);
}

TEST_F(InputValidatorTest, ConflictsAreAccumulated) {
    QuerySpec q = spec(-100.0, 200.0, -2.0);
    q.want_containing = false;
    q.want_nearby = false;
    auto result = validator_.validate(q, 5.0);
    EXPECT_EQ(3u, result.conflicts.size());
    EXPECT_THAT(result.format_error_message(), HasSubstr("Problem 3"));
}
