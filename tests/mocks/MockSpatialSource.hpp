/**
 * @file MockSpatialSource.hpp
 * @brief gmock SpatialSource and raw feature builders
 */

#pragma once

#include <gmock/gmock.h>

#include "core/SpatialSource.hpp"

#include <string>
#include <vector>

namespace geoenrich {
namespace test {

class MockSpatialSource : public SpatialSource {
public:
    MOCK_METHOD(SourcePage, query, (const SourceQuery& query), (override));
    MOCK_METHOD(std::string, id, (), (const, override));
};

// =============================================================================
// Raw feature builders (geographic x = lon, y = lat)
// =============================================================================

inline RawFeature raw_point(const std::string& object_id, double lat, double lon,
                            const std::string& name = "") {
    RawFeature feature;
    feature.attributes = {{"OBJECTID", object_id}};
    if (!name.empty()) {
        feature.attributes["NAME"] = name;
    }
    feature.geometry = RawGeometry{GeometryKind::POINT, {{Position(lon, lat)}}};
    return feature;
}

/**
 * @brief Axis-aligned square polygon centred on (lat, lon)
 */
inline RawFeature raw_square(const std::string& object_id, double lat, double lon,
                             double half_size_deg) {
    RawFeature feature;
    feature.attributes = {{"OBJECTID", object_id}};
    feature.geometry = RawGeometry{GeometryKind::POLYGON, {{
        Position(lon - half_size_deg, lat - half_size_deg),
        Position(lon - half_size_deg, lat + half_size_deg),
        Position(lon + half_size_deg, lat + half_size_deg),
        Position(lon + half_size_deg, lat - half_size_deg),
        Position(lon - half_size_deg, lat - half_size_deg)
    }}};
    return feature;
}

inline std::vector<RawFeature> raw_points(size_t count, const std::string& prefix = "f") {
    std::vector<RawFeature> features;
    features.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        features.push_back(raw_point(prefix + std::to_string(i), 43.0, -71.5));
    }
    return features;
}

} // namespace test
} // namespace geoenrich
