#pragma once

/**
 * @file geo_enrichment.hpp
 * @brief Main header for the geospatial proximity enrichment engine
 *
 * Shared data model for answering "what does dataset X contain at or near
 * point P within radius R" across independently operated feature services.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace geoenrich {

// ============================================================================
// Constants
// ============================================================================

constexpr double EARTH_RADIUS_MILES = 3958.8;
constexpr double METERS_PER_MILE = 1609.34;
constexpr double WEB_MERCATOR_EXTENT = 20037508.34;  // half circumference (m)

// ============================================================================
// Coordinates and geometry
// ============================================================================

/**
 * @brief Geographic coordinate in WGS84 degrees
 */
struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;

    Coordinate() = default;
    Coordinate(double latitude, double longitude) : lat(latitude), lon(longitude) {}

    bool is_valid() const {
        return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
    }

    bool operator==(const Coordinate& other) const {
        return lat == other.lat && lon == other.lon;
    }
};

/**
 * @brief Coordinate pair exactly as served (x = easting/longitude, y = northing/latitude)
 *
 * The reference system is unknown until GeometryNormalizer inspects it.
 */
struct Position {
    double x = 0.0;
    double y = 0.0;

    Position() = default;
    Position(double px, double py) : x(px), y(py) {}
};

enum class GeometryKind {
    POINT,
    POLYLINE,
    POLYGON
};

using Path = std::vector<Coordinate>;
using Ring = std::vector<Coordinate>;

struct PointGeometry {
    Coordinate point;
};

struct PolylineGeometry {
    std::vector<Path> paths;
};

/**
 * @brief Polygon rings, possibly of several member polygons
 *
 * Each member starts with its outer boundary and continues with its holes.
 * member_starts holds the index of every member's outer ring; when it is
 * empty the whole list is one polygon with rings[0] as the outer boundary.
 */
struct PolygonGeometry {
    std::vector<Ring> rings;
    std::vector<size_t> member_starts;

    /// Rings grouped per member polygon
    std::vector<std::vector<Ring>> members() const;
};

/**
 * @brief Canonical geometry in (lat, lon) degrees
 */
using Geometry = std::variant<PointGeometry, PolylineGeometry, PolygonGeometry>;

GeometryKind geometry_kind(const Geometry& geometry);
std::string geometry_kind_name(GeometryKind kind);

/**
 * @brief Geometry as parsed from a response, before CRS normalization
 *
 * For POINT the single position is parts[0][0]. For POLYLINE each part is
 * a path, for POLYGON each part is a ring. A multi-part polygon lists the
 * index of each member's outer ring in member_starts.
 */
struct RawGeometry {
    GeometryKind kind = GeometryKind::POINT;
    std::vector<std::vector<Position>> parts;
    std::vector<size_t> member_starts;
};

// ============================================================================
// Features
// ============================================================================

/**
 * @brief One feature from one fetched page; discarded after classification
 */
struct RawFeature {
    nlohmann::json attributes = nlohmann::json::object();
    std::optional<RawGeometry> geometry;
    std::string source_id;
};

/**
 * @brief Attribute bag of an annotated feature
 *
 * Canonical fields are resolved through the dataset's field-alias table;
 * the complete attribute set as served is kept in extra.
 */
struct FeatureAttributes {
    std::map<std::string, nlohmann::json> canonical;
    nlohmann::json extra = nlohmann::json::object();

    std::optional<std::string> get_string(const std::string& canonical_field) const;
};

/**
 * @brief Feature annotated with its relation to the query origin
 *
 * distance_miles is 0 whenever is_containing is true.
 */
struct AnnotatedFeature {
    std::optional<std::string> identity;
    Geometry geometry;
    FeatureAttributes attributes;
    double distance_miles = 0.0;
    bool is_containing = false;
    std::string source_id;
};

/**
 * @brief Per-request query parameters
 */
struct QuerySpec {
    Coordinate origin;
    double radius_miles = 5.0;
    bool want_containing = true;
    bool want_nearby = true;
};

/**
 * @brief Merged result for one source
 *
 * nearby is ascending by distance_miles. No two entries across containing
 * and nearby share a non-null identity.
 */
struct ResultSet {
    std::vector<AnnotatedFeature> containing;
    std::vector<AnnotatedFeature> nearby;

    size_t dropped_features = 0;             // geometry errors
    std::optional<std::string> source_error; // partial failure, results kept

    size_t total() const { return containing.size() + nearby.size(); }
};

// ============================================================================
// Metrics
// ============================================================================

/**
 * @brief Orchestrator performance counters
 */
struct PerformanceMetrics {
    std::uint64_t total_queries = 0;
    std::chrono::milliseconds total_time{0};
    std::chrono::milliseconds average_time{0};
    std::uint64_t parallel_queries = 0;
};

} // namespace geoenrich
