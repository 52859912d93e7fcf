/**
 * @file DistanceEngine.hpp
 * @brief Great-circle distances from a point to points, polylines and polygons
 */

#pragma once

#include "geo_enrichment.hpp"

namespace geoenrich {

/**
 * @brief Distance and containment primitives
 *
 * All distances are statute miles on a sphere of radius EARTH_RADIUS_MILES.
 * Segment projection is planar in degree space, which is adequate at
 * municipal to regional scale. Results are never rounded here.
 */
class DistanceEngine {
public:
    /**
     * @brief Great-circle distance (haversine)
     */
    static double haversine(const Coordinate& a, const Coordinate& b);

    /**
     * @brief Distance from p to the segment s1-s2
     *
     * p is projected onto the line through s1 and s2 with t clamped to [0,1].
     * A zero-length segment yields the nearer endpoint distance.
     */
    static double point_to_segment(const Coordinate& p, const Coordinate& s1, const Coordinate& s2);

    /**
     * @brief Minimum distance over all segments of all paths
     *
     * A single-position path counts as a point. Returns infinity when paths
     * hold no positions.
     */
    static double point_to_polyline(const Coordinate& p, const std::vector<Path>& paths);

    /**
     * @brief Ray-casting containment test
     *
     * True when p is inside rings[0] and inside none of the holes rings[1..].
     */
    static bool point_in_polygon(const Coordinate& p, const std::vector<Ring>& rings);

    /**
     * @brief 0 if p is inside the polygon, otherwise the nearest edge distance
     *        over every edge of every ring (holes included)
     */
    static double distance_to_polygon_boundary(const Coordinate& p, const std::vector<Ring>& rings);

    /**
     * @brief Containment in any member polygon
     */
    static bool point_in_polygon(const Coordinate& p, const PolygonGeometry& polygon);

    /**
     * @brief 0 when some member contains p, else the minimum over all members
     */
    static double distance_to_polygon_boundary(const Coordinate& p, const PolygonGeometry& polygon);

    /**
     * @brief Distance to any canonical geometry; polygons report 0 when containing
     */
    static double distance_to_geometry(const Coordinate& p, const Geometry& geometry);

private:
    static bool point_in_ring(const Coordinate& p, const Ring& ring);
    static double point_to_ring_edges(const Coordinate& p, const Ring& ring);
};

} // namespace geoenrich
