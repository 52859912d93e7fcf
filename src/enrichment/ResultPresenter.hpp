/**
 * @file ResultPresenter.hpp
 * @brief Serialization of result sets into output-map entries
 */

#pragma once

#include "../sources/DatasetCatalog.hpp"
#include "geo_enrichment.hpp"

#include <nlohmann/json.hpp>

namespace geoenrich {

/**
 * @brief Presentation boundary: the only place distances are rounded
 */
class ResultPresenter {
public:
    /**
     * @brief Round to a number of decimals (half away from zero)
     */
    static double round_to(double value, int decimals);

    static nlohmann::json geometry_to_json(const Geometry& geometry);

    static nlohmann::json feature_to_json(const AnnotatedFeature& feature, const std::string& label_field);

    /**
     * @brief Keys <id>_containing, _nearby, _count, _containing_count,
     *        _nearby_count, _radius_miles, _summary and, for partial results,
     *        _error
     */
    static nlohmann::json present(const DatasetConfig& dataset, const ResultSet& result, double radius_miles);

    static std::string summarize(const DatasetConfig& dataset, const ResultSet& result, double radius_miles);

    /**
     * @brief Display label: the dataset's label field, else identity, else "unnamed"
     */
    static std::string feature_label(const AnnotatedFeature& feature, const std::string& label_field);
};

} // namespace geoenrich
