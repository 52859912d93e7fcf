/**
 * @file GeometryNormalizer.hpp
 * @brief Coordinate reference system detection and conversion to WGS84 degrees
 */

#pragma once

#include "geo_enrichment.hpp"

namespace geoenrich {

enum class CoordinateSystem {
    GEOGRAPHIC,    // WGS84 degrees
    WEB_MERCATOR   // EPSG:3857-style meters
};

/**
 * @brief Converts raw service geometries into canonical (lat, lon) degrees
 *
 * Detection is a magnitude heuristic: any coordinate with |x| > 180 or
 * |y| > 90 marks the whole geometry as projected. It is ambiguous for
 * projected coordinates within a few hundred meters of the origin.
 */
class GeometryNormalizer {
public:
    static CoordinateSystem detect_crs(const RawGeometry& geometry);

    /**
     * @brief Inverse spherical Web Mercator
     */
    static Coordinate to_wgs84(double x, double y);

    /**
     * @brief Forward spherical Web Mercator
     */
    static Position from_wgs84(const Coordinate& coordinate);

    /**
     * @brief Convert every position of every path/ring to degrees
     *
     * Empty parts are discarded. Rings keep their order, so each member
     * polygon still starts with its outer boundary; member_starts is
     * re-indexed over the kept rings.
     *
     * @throws GeometryError if no usable coordinates remain, an outer ring
     *         has fewer than 3 positions, or a coordinate is not finite
     */
    static Geometry normalize(const RawGeometry& geometry);

    static std::string crs_name(CoordinateSystem crs);
};

} // namespace geoenrich
