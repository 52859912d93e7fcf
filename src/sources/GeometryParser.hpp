/**
 * @file GeometryParser.hpp
 * @brief Reads ESRI JSON and GeoJSON geometry objects into RawGeometry
 */

#pragma once

#include "geo_enrichment.hpp"
#include <optional>

#include <nlohmann/json.hpp>

namespace geoenrich {

/**
 * @brief Geometry decoding for feature-service responses
 *
 * ESRI JSON: {x,y}, {points:[...]}, {paths:[...]}, {rings:[...]}.
 * GeoJSON: Point, MultiPoint (first point), LineString, MultiLineString,
 * Polygon, MultiPolygon (member polygons kept apart through member_starts).
 * Coordinates are kept exactly as served; no CRS handling happens here.
 */
class GeometryParser {
public:
    /**
     * @brief Decode one geometry object
     * @return nullopt for a JSON null or absent geometry
     * @throws GeometryError for malformed or unsupported geometry
     */
    static std::optional<RawGeometry> parse(const nlohmann::json& geometry);

private:
    static RawGeometry parse_esri(const nlohmann::json& geometry);
    static RawGeometry parse_geojson(const nlohmann::json& geometry);

    static Position parse_position(const nlohmann::json& position);
    static std::vector<Position> parse_position_list(const nlohmann::json& positions);
};

} // namespace geoenrich
