/**
 * @file UnitParser.cpp
 * @brief Radius and coordinate parsing
 */

#include "UnitParser.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <vector>

namespace geoenrich {

namespace {

struct UnitEntry {
    DistanceUnit unit;
    const char* symbol;
    const char* name;
    double meters;
};

// 1 mi = 1609.34 m matches the distance engine's metres-per-mile
constexpr std::array<UnitEntry, 5> UNIT_TABLE = {{
    {DistanceUnit::METERS,     "m",  "meters",     1.0},
    {DistanceUnit::KILOMETERS, "km", "kilometers", 1000.0},
    {DistanceUnit::FEET,       "ft", "feet",       0.3048},
    {DistanceUnit::MILES,      "mi", "miles",      1609.34},
    {DistanceUnit::YARDS,      "yd", "yards",      0.9144}
}};

const UnitEntry& entry_for(DistanceUnit unit) {
    for (const auto& entry : UNIT_TABLE) {
        if (entry.unit == unit) {
            return entry;
        }
    }
    throw UnitParseError("Unknown distance unit");
}

std::string trimmed(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\n\r");
    return input.substr(first, last - first + 1);
}

} // namespace

// ============================================================================
// UNIT CONVERSION
// ============================================================================

double UnitParser::to_meters_factor(DistanceUnit unit) {
    return entry_for(unit).meters;
}

double UnitParser::convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit) {
    if (from_unit == to_unit) {
        return value;
    }
    return value * to_meters_factor(from_unit) / to_meters_factor(to_unit);
}

DistanceUnit UnitParser::parse_unit_string(const std::string& unit_str) {
    std::string lower = unit_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : UNIT_TABLE) {
        if (lower == entry.symbol || lower == entry.name) {
            return entry.unit;
        }
    }
    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. Supported units: m, km, ft, mi, yd");
}

std::string UnitParser::unit_to_string(DistanceUnit unit) {
    return entry_for(unit).symbol;
}

// ============================================================================
// DISTANCE PARSING
// ============================================================================

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) const {
    const std::string text = trimmed(input);
    if (text.empty()) {
        throw UnitParseError("Empty input string");
    }

    // Optional sign, digits, optional fraction
    size_t pos = 0;
    if (text[pos] == '+' || text[pos] == '-') {
        ++pos;
    }
    const size_t digits_start = pos;
    while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
        ++pos;
    }
    const std::string number = text.substr(0, pos);
    if (std::count(number.begin(), number.end(), '.') > 1 ||
        std::none_of(number.begin() + static_cast<std::ptrdiff_t>(digits_start), number.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }

    return {number, trimmed(text.substr(pos))};
}

ParsedValue UnitParser::parse_distance(const std::string& input,
                                       DistanceUnit default_unit,
                                       DistanceUnit canonical_unit) const {
    auto [value_str, unit_str] = split_value_and_unit(input);

    double value = 0.0;
    try {
        value = std::stod(value_str);
    } catch (const std::logic_error&) {
        throw UnitParseError("Invalid numeric value: '" + value_str + "'");
    }

    const bool had_explicit_unit = !unit_str.empty();
    const DistanceUnit source_unit = had_explicit_unit ? parse_unit_string(unit_str) : default_unit;

    return ParsedValue(convert_distance(value, source_unit, canonical_unit), source_unit, had_explicit_unit);
}

// ============================================================================
// COORDINATE PARSING
// ============================================================================

bool UnitParser::is_dms_format(const std::string& input) const {
    if (input.find("°") != std::string::npos) {
        return true;
    }
    if (input.find_first_of("d'\"") != std::string::npos) {
        return true;
    }
    const char last = input.empty() ? '\0' : input.back();
    return last == 'N' || last == 'S' || last == 'E' || last == 'W';
}

double UnitParser::parse_dms(const std::string& input, double limit, const std::string& axis) const {
    std::string work = trimmed(input);

    char hemisphere = '\0';
    if (!work.empty() && std::string("NSEW").find(work.back()) != std::string::npos) {
        hemisphere = work.back();
        work.pop_back();
    }

    // Degree sign is multi-byte UTF-8
    for (size_t pos = work.find("°"); pos != std::string::npos; pos = work.find("°", pos)) {
        work.replace(pos, std::string("°").size(), " ");
    }
    std::replace_if(work.begin(), work.end(),
                    [](char c) { return c == 'd' || c == 'm' || c == 's' || c == '\'' || c == '"'; }, ' ');

    // Up to three numbers and nothing else
    std::istringstream iss(work);
    std::vector<std::string> tokens;
    for (std::string token; iss >> token;) {
        tokens.push_back(token);
    }
    if (tokens.empty() || tokens.size() > 3) {
        throw UnitParseError("Invalid DMS format: '" + input + "'");
    }
    double parts[3] = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < tokens.size(); ++i) {
        size_t consumed = 0;
        try {
            parts[i] = std::stod(tokens[i], &consumed);
        } catch (const std::logic_error&) {
            throw UnitParseError("Invalid DMS format: '" + input + "'");
        }
        if (consumed != tokens[i].size()) {
            throw UnitParseError("Invalid DMS format: '" + input + "'");
        }
    }

    const double degrees = parts[0];
    const double minutes = parts[1];
    const double seconds = parts[2];
    if (minutes < 0 || minutes >= 60) {
        throw UnitParseError("Invalid minutes value: " + std::to_string(minutes));
    }
    if (seconds < 0 || seconds >= 60) {
        throw UnitParseError("Invalid seconds value: " + std::to_string(seconds));
    }

    double decimal = std::abs(degrees) + minutes / 60.0 + seconds / 3600.0;
    const bool negative = hemisphere ? (hemisphere == 'S' || hemisphere == 'W') : std::signbit(degrees);
    if (negative) {
        decimal = -decimal;
    }

    if (std::abs(decimal) > limit) {
        throw UnitParseError(axis + " out of range: " + std::to_string(decimal));
    }
    return decimal;
}

double UnitParser::parse_degrees(const std::string& input, double limit, const std::string& axis) const {
    const std::string text = trimmed(input);
    if (is_dms_format(text)) {
        return parse_dms(text, limit, axis);
    }

    double value = 0.0;
    size_t consumed = 0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw UnitParseError("Invalid " + axis + " format: '" + input + "'");
    }
    if (consumed != text.size()) {
        throw UnitParseError("Invalid " + axis + " format: '" + input + "'");
    }
    if (!std::isfinite(value) || std::abs(value) > limit) {
        throw UnitParseError(axis + " out of range: " + text);
    }
    return value;
}

double UnitParser::parse_latitude(const std::string& input) const {
    return parse_degrees(input, 90.0, "Latitude");
}

double UnitParser::parse_longitude(const std::string& input) const {
    return parse_degrees(input, 180.0, "Longitude");
}

std::pair<double, double> UnitParser::parse_coordinate_pair(const std::string& input) const {
    const size_t comma = input.find(',');
    if (comma == std::string::npos) {
        throw UnitParseError("Coordinate pair must be separated by comma: '" + input + "'");
    }
    return {parse_latitude(input.substr(0, comma)), parse_longitude(input.substr(comma + 1))};
}

} // namespace geoenrich
