/**
 * @file DistanceEngine.cpp
 * @brief Implementation of distance and containment primitives
 */

#include "DistanceEngine.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace geoenrich {

namespace {

constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
constexpr double DEGENERATE_SEGMENT_EPSILON = 1e-12;  // squared degrees

} // namespace

double DistanceEngine::haversine(const Coordinate& a, const Coordinate& b) {
    const double dlat = (b.lat - a.lat) * DEG_TO_RAD;
    const double dlon = (b.lon - a.lon) * DEG_TO_RAD;

    const double sin_dlat = std::sin(dlat / 2.0);
    const double sin_dlon = std::sin(dlon / 2.0);
    double h = sin_dlat * sin_dlat +
               std::cos(a.lat * DEG_TO_RAD) * std::cos(b.lat * DEG_TO_RAD) * sin_dlon * sin_dlon;
    h = std::clamp(h, 0.0, 1.0);

    return EARTH_RADIUS_MILES * 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double DistanceEngine::point_to_segment(const Coordinate& p, const Coordinate& s1, const Coordinate& s2) {
    const double dx = s2.lon - s1.lon;
    const double dy = s2.lat - s1.lat;
    const double length_sq = dx * dx + dy * dy;

    if (length_sq < DEGENERATE_SEGMENT_EPSILON) {
        return std::min(haversine(p, s1), haversine(p, s2));
    }

    double t = ((p.lon - s1.lon) * dx + (p.lat - s1.lat) * dy) / length_sq;
    t = std::clamp(t, 0.0, 1.0);

    const Coordinate closest(s1.lat + t * dy, s1.lon + t * dx);
    return haversine(p, closest);
}

double DistanceEngine::point_to_polyline(const Coordinate& p, const std::vector<Path>& paths) {
    double best = std::numeric_limits<double>::infinity();

    for (const auto& path : paths) {
        if (path.size() == 1) {
            best = std::min(best, haversine(p, path.front()));
            continue;
        }
        for (size_t i = 1; i < path.size(); ++i) {
            best = std::min(best, point_to_segment(p, path[i - 1], path[i]));
        }
    }

    return best;
}

bool DistanceEngine::point_in_ring(const Coordinate& p, const Ring& ring) {
    bool inside = false;
    const size_t n = ring.size();
    if (n < 3) {
        return false;
    }

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const double xi = ring[i].lon, yi = ring[i].lat;
        const double xj = ring[j].lon, yj = ring[j].lat;

        const bool crosses = ((yi > p.lat) != (yj > p.lat)) &&
                             (p.lon < (xj - xi) * (p.lat - yi) / (yj - yi) + xi);
        if (crosses) {
            inside = !inside;
        }
    }

    return inside;
}

bool DistanceEngine::point_in_polygon(const Coordinate& p, const std::vector<Ring>& rings) {
    if (rings.empty() || !point_in_ring(p, rings.front())) {
        return false;
    }

    for (size_t i = 1; i < rings.size(); ++i) {
        if (point_in_ring(p, rings[i])) {
            return false;
        }
    }

    return true;
}

double DistanceEngine::point_to_ring_edges(const Coordinate& p, const Ring& ring) {
    double best = std::numeric_limits<double>::infinity();
    const size_t n = ring.size();
    if (n == 1) {
        return haversine(p, ring.front());
    }

    // Closing edge included; a duplicated closing vertex yields a zero-length
    // segment, which point_to_segment handles
    for (size_t i = 0; i < n; ++i) {
        best = std::min(best, point_to_segment(p, ring[i], ring[(i + 1) % n]));
    }
    return best;
}

double DistanceEngine::distance_to_polygon_boundary(const Coordinate& p, const std::vector<Ring>& rings) {
    if (point_in_polygon(p, rings)) {
        return 0.0;
    }

    double best = std::numeric_limits<double>::infinity();
    for (const auto& ring : rings) {
        best = std::min(best, point_to_ring_edges(p, ring));
    }
    return best;
}

bool DistanceEngine::point_in_polygon(const Coordinate& p, const PolygonGeometry& polygon) {
    for (const auto& member : polygon.members()) {
        if (point_in_polygon(p, member)) {
            return true;
        }
    }
    return false;
}

double DistanceEngine::distance_to_polygon_boundary(const Coordinate& p, const PolygonGeometry& polygon) {
    double best = std::numeric_limits<double>::infinity();
    for (const auto& member : polygon.members()) {
        best = std::min(best, distance_to_polygon_boundary(p, member));
        if (best == 0.0) {
            break;
        }
    }
    return best;
}

double DistanceEngine::distance_to_geometry(const Coordinate& p, const Geometry& geometry) {
    if (const auto* point = std::get_if<PointGeometry>(&geometry)) {
        return haversine(p, point->point);
    }
    if (const auto* line = std::get_if<PolylineGeometry>(&geometry)) {
        return point_to_polyline(p, line->paths);
    }
    return distance_to_polygon_boundary(p, std::get<PolygonGeometry>(geometry));
}

} // namespace geoenrich
