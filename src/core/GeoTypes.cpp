/**
 * @file GeoTypes.cpp
 * @brief Helpers for the shared data model
 */

#include "geo_enrichment.hpp"

#include <algorithm>

namespace geoenrich {

GeometryKind geometry_kind(const Geometry& geometry) {
    if (std::holds_alternative<PointGeometry>(geometry)) {
        return GeometryKind::POINT;
    }
    if (std::holds_alternative<PolylineGeometry>(geometry)) {
        return GeometryKind::POLYLINE;
    }
    return GeometryKind::POLYGON;
}

std::string geometry_kind_name(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::POINT:    return "point";
        case GeometryKind::POLYLINE: return "polyline";
        case GeometryKind::POLYGON:  return "polygon";
    }
    return "unknown";
}

std::vector<std::vector<Ring>> PolygonGeometry::members() const {
    if (member_starts.empty()) {
        return {rings};
    }

    std::vector<std::vector<Ring>> grouped;
    grouped.reserve(member_starts.size());
    for (size_t i = 0; i < member_starts.size(); ++i) {
        const size_t begin = std::min(member_starts[i], rings.size());
        const size_t end = (i + 1 < member_starts.size())
            ? std::min(member_starts[i + 1], rings.size())
            : rings.size();
        if (begin < end) {
            grouped.emplace_back(rings.begin() + static_cast<std::ptrdiff_t>(begin),
                                 rings.begin() + static_cast<std::ptrdiff_t>(end));
        }
    }
    return grouped;
}

std::optional<std::string> FeatureAttributes::get_string(const std::string& canonical_field) const {
    auto it = canonical.find(canonical_field);
    if (it == canonical.end() || it->second.is_null()) {
        return std::nullopt;
    }
    if (it->second.is_string()) {
        return it->second.get<std::string>();
    }
    return it->second.dump();
}

} // namespace geoenrich
