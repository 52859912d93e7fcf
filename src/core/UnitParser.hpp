/**
 * @file UnitParser.hpp
 * @brief Distance units, radius strings and coordinate parsing
 */

#pragma once

#include "EnrichmentErrors.hpp"
#include <string>
#include <utility>

namespace geoenrich {

/**
 * @brief Exception thrown when unit parsing fails
 */
class UnitParseError : public EnrichmentError {
public:
    explicit UnitParseError(const std::string& message)
        : EnrichmentError("Unit parsing error: " + message) {}
};

/**
 * @brief Unit types for search distances
 */
enum class DistanceUnit {
    METERS,      // m
    KILOMETERS,  // km
    FEET,        // ft
    MILES,       // mi
    YARDS        // yd
};

/**
 * @brief Result of parsing a value with units
 */
struct ParsedValue {
    double value;               // Numeric value in the requested canonical unit
    DistanceUnit original_unit; // Unit that was parsed
    bool had_explicit_unit;     // Whether unit was explicitly specified

    ParsedValue(double v, DistanceUnit u, bool explicit_unit = false)
        : value(v), original_unit(u), had_explicit_unit(explicit_unit) {}
};

/**
 * @brief Parses radii and coordinates given on the command line or in batch files
 *
 * Supports:
 * - Distance: "5", "5mi", "8km", "2000ft", "1500m"
 * - Coordinates: "43.0" (decimal degrees) or "43°00'00"N" (DMS)
 *
 * Examples:
 *   --radius 8km
 *   --lat 29°45'46"N --lon 95°22'08"W
 */
class UnitParser {
public:
    UnitParser() = default;

    // ========================================================================
    // DISTANCE PARSING
    // ========================================================================

    /**
     * @brief Parse a distance value with optional unit suffix
     *
     * @param input String to parse (e.g., "200", "5km", "10mi")
     * @param default_unit Unit to use if no suffix is provided
     * @param canonical_unit Unit of the returned value
     *
     * Examples:
     *   parse_distance("5km", METERS, METERS) -> 5000.0
     *   parse_distance("10mi", METERS, METERS) -> 16093.4
     */
    ParsedValue parse_distance(const std::string& input,
                               DistanceUnit default_unit,
                               DistanceUnit canonical_unit) const;

    /**
     * @brief Parse a search radius; bare numbers are miles
     * @return Radius in miles
     */
    double parse_radius_miles(const std::string& input) const {
        return parse_distance(input, DistanceUnit::MILES, DistanceUnit::MILES).value;
    }

    // ========================================================================
    // COORDINATE PARSING
    // ========================================================================

    /**
     * @brief Parse a latitude coordinate (decimal or DMS)
     *
     * Decimal examples:
     *   "29.7629" -> 29.7629
     *
     * DMS examples:
     *   "29°45'46"N" -> 29.762778
     *   "29d45m46sN" -> 29.762778
     */
    double parse_latitude(const std::string& input) const;

    /**
     * @brief Parse a longitude coordinate (decimal or DMS)
     *
     *   "-95.3698" -> -95.3698
     *   "95°22'08"W" -> -95.368889
     */
    double parse_longitude(const std::string& input) const;

    /**
     * @brief Parse a coordinate pair "lat,lon"
     * @return Pair of (latitude, longitude) in decimal degrees
     */
    std::pair<double, double> parse_coordinate_pair(const std::string& input) const;

    // ========================================================================
    // UNIT CONVERSION
    // ========================================================================

    static double convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit);

    /**
     * @brief Get conversion factor to meters (1 mi = 1609.34 m)
     */
    static double to_meters_factor(DistanceUnit unit);

    /**
     * @brief Parse unit string to DistanceUnit enum
     * @throws UnitParseError if unit string is not recognized
     */
    static DistanceUnit parse_unit_string(const std::string& unit_str);

    static std::string unit_to_string(DistanceUnit unit);

private:
    /**
     * @brief Split numeric value and unit suffix
     *
     *   "200" -> ("200", "")
     *   "10.5mi" -> ("10.5", "mi")
     */
    std::pair<std::string, std::string> split_value_and_unit(const std::string& input) const;

    /**
     * @brief Parse DMS (degrees/minutes/seconds) format
     *
     * Supported formats:
     *   - 29°45'46"N (Unicode degree symbol)
     *   - 29d45m46sN (ASCII letters)
     *   - 29 45 46 N (space-separated)
     *
     * A trailing S or W makes the value negative.
     */
    double parse_dms(const std::string& input, double limit, const std::string& axis) const;

    /**
     * @brief Decimal or DMS degrees with |value| <= limit
     */
    double parse_degrees(const std::string& input, double limit, const std::string& axis) const;

    bool is_dms_format(const std::string& input) const;
};

} // namespace geoenrich
