/**
 * @file GeometryNormalizer.cpp
 * @brief Implementation of CRS detection and Web Mercator inversion
 */

#include "GeometryNormalizer.hpp"
#include "EnrichmentErrors.hpp"
#include <algorithm>
#include <cmath>

namespace geoenrich {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double DEG_TO_RAD = PI / 180.0;

std::vector<Coordinate> convert_part(const std::vector<Position>& part, CoordinateSystem crs) {
    std::vector<Coordinate> coords;
    coords.reserve(part.size());
    for (const auto& pos : part) {
        if (!std::isfinite(pos.x) || !std::isfinite(pos.y)) {
            throw GeometryError("non-finite coordinate");
        }
        if (crs == CoordinateSystem::WEB_MERCATOR) {
            coords.push_back(GeometryNormalizer::to_wgs84(pos.x, pos.y));
        } else {
            coords.emplace_back(pos.y, pos.x);
        }
    }
    return coords;
}

} // namespace

CoordinateSystem GeometryNormalizer::detect_crs(const RawGeometry& geometry) {
    for (const auto& part : geometry.parts) {
        for (const auto& pos : part) {
            if (std::abs(pos.x) > 180.0 || std::abs(pos.y) > 90.0) {
                return CoordinateSystem::WEB_MERCATOR;
            }
        }
    }
    return CoordinateSystem::GEOGRAPHIC;
}

Coordinate GeometryNormalizer::to_wgs84(double x, double y) {
    double lon = x / WEB_MERCATOR_EXTENT * 180.0;
    double lat = RAD_TO_DEG * (2.0 * std::atan(std::exp(y / WEB_MERCATOR_EXTENT * PI)) - PI / 2.0);
    return Coordinate(lat, lon);
}

Position GeometryNormalizer::from_wgs84(const Coordinate& coordinate) {
    double x = coordinate.lon * WEB_MERCATOR_EXTENT / 180.0;
    double y = std::log(std::tan((90.0 + coordinate.lat) * DEG_TO_RAD / 2.0)) / PI * WEB_MERCATOR_EXTENT;
    return Position(x, y);
}

Geometry GeometryNormalizer::normalize(const RawGeometry& geometry) {
    const CoordinateSystem crs = detect_crs(geometry);

    // kept_before[i] is the number of non-empty parts ahead of raw part i
    std::vector<std::vector<Coordinate>> parts;
    std::vector<size_t> kept_before;
    kept_before.reserve(geometry.parts.size() + 1);
    for (const auto& raw_part : geometry.parts) {
        kept_before.push_back(parts.size());
        if (raw_part.empty()) {
            continue;
        }
        parts.push_back(convert_part(raw_part, crs));
    }
    kept_before.push_back(parts.size());

    if (parts.empty()) {
        throw GeometryError("geometry has no coordinates");
    }

    switch (geometry.kind) {
        case GeometryKind::POINT:
            return PointGeometry{parts.front().front()};

        case GeometryKind::POLYLINE:
            return PolylineGeometry{std::move(parts)};

        case GeometryKind::POLYGON: {
            PolygonGeometry polygon;
            for (size_t i = 0; i < geometry.member_starts.size(); ++i) {
                const size_t raw_begin = std::min(geometry.member_starts[i], geometry.parts.size());
                const size_t raw_end = (i + 1 < geometry.member_starts.size())
                    ? std::min(geometry.member_starts[i + 1], geometry.parts.size())
                    : geometry.parts.size();
                // Members whose rings were all empty vanish
                if (kept_before[raw_begin] < kept_before[raw_end]) {
                    polygon.member_starts.push_back(kept_before[raw_begin]);
                }
            }
            polygon.rings = std::move(parts);

            for (const auto& member : polygon.members()) {
                if (member.front().size() < 3) {
                    throw GeometryError("polygon outer ring has " +
                                        std::to_string(member.front().size()) + " positions");
                }
            }
            return polygon;
        }
    }

    throw GeometryError("unknown geometry kind");
}

std::string GeometryNormalizer::crs_name(CoordinateSystem crs) {
    switch (crs) {
        case CoordinateSystem::GEOGRAPHIC:   return "EPSG:4326";
        case CoordinateSystem::WEB_MERCATOR: return "EPSG:3857";
    }
    return "unknown";
}

} // namespace geoenrich
