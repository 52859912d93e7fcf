/**
 * @file ResultClassifier.hpp
 * @brief Annotates raw features with identity, distance and containment
 */

#pragma once

#include "FieldAliasTable.hpp"
#include "geo_enrichment.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geoenrich {

class ResultClassifier {
public:
    ResultClassifier();
    ResultClassifier(std::vector<std::string> identity_fields, FieldAliasTable aliases);

    /**
     * @brief Normalize the feature's geometry and measure it against origin
     *
     * Points use haversine, polylines the nearest segment, polygons the
     * containment test and then the nearest edge. A containing polygon has
     * distance 0.
     *
     * @throws GeometryError if the geometry is missing or malformed
     */
    AnnotatedFeature classify(const Coordinate& origin, const RawFeature& feature) const;

    /**
     * @brief Nearby inclusion rule: within the radius, or containing
     */
    static bool within_radius(const AnnotatedFeature& feature, double radius_miles);

    /**
     * @brief First non-null identity attribute in priority order, stringified
     */
    std::optional<std::string> derive_identity(const nlohmann::json& attributes) const;

    /**
     * @brief objectId, OBJECTID, FID, GLOBALID, then common service variants
     */
    static const std::vector<std::string>& default_identity_fields();

    const FieldAliasTable& aliases() const { return aliases_; }

private:
    std::vector<std::string> identity_fields_;
    FieldAliasTable aliases_;
};

} // namespace geoenrich
