/**
 * @file ResultClassifier.cpp
 * @brief Implementation of per-feature classification
 */

#include "ResultClassifier.hpp"
#include "DistanceEngine.hpp"
#include "EnrichmentErrors.hpp"
#include "GeometryNormalizer.hpp"

namespace geoenrich {

ResultClassifier::ResultClassifier()
    : identity_fields_(default_identity_fields()) {
}

ResultClassifier::ResultClassifier(std::vector<std::string> identity_fields, FieldAliasTable aliases)
    : identity_fields_(std::move(identity_fields)), aliases_(std::move(aliases)) {
    if (identity_fields_.empty()) {
        identity_fields_ = default_identity_fields();
    }
}

const std::vector<std::string>& ResultClassifier::default_identity_fields() {
    static const std::vector<std::string> fields = {
        "objectId", "OBJECTID", "FID", "GLOBALID",
        "objectid", "ESRI_OID", "GlobalID", "OBJECTID_1", "id"
    };
    return fields;
}

std::optional<std::string> ResultClassifier::derive_identity(const nlohmann::json& attributes) const {
    if (!attributes.is_object()) {
        return std::nullopt;
    }

    for (const auto& field : identity_fields_) {
        auto it = attributes.find(field);
        if (it == attributes.end() || it->is_null()) {
            continue;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        return it->dump();
    }
    return std::nullopt;
}

AnnotatedFeature ResultClassifier::classify(const Coordinate& origin, const RawFeature& feature) const {
    if (!feature.geometry.has_value()) {
        throw GeometryError("feature has no geometry");
    }

    AnnotatedFeature annotated;
    annotated.geometry = GeometryNormalizer::normalize(*feature.geometry);
    annotated.identity = derive_identity(feature.attributes);
    annotated.source_id = feature.source_id;
    annotated.attributes.extra = feature.attributes;
    annotated.attributes.canonical = aliases_.resolve_all(feature.attributes);

    if (const auto* polygon = std::get_if<PolygonGeometry>(&annotated.geometry)) {
        annotated.is_containing = DistanceEngine::point_in_polygon(origin, *polygon);
        annotated.distance_miles = annotated.is_containing
            ? 0.0
            : DistanceEngine::distance_to_polygon_boundary(origin, *polygon);
    } else {
        annotated.is_containing = false;
        annotated.distance_miles = DistanceEngine::distance_to_geometry(origin, annotated.geometry);
    }

    return annotated;
}

bool ResultClassifier::within_radius(const AnnotatedFeature& feature, double radius_miles) {
    return feature.is_containing || feature.distance_miles <= radius_miles;
}

} // namespace geoenrich
