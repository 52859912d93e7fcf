/**
 * @file ResultPresenter.cpp
 * @brief Result set to JSON conversion
 */

#include "ResultPresenter.hpp"
#include <cmath>
#include <sstream>

namespace geoenrich {

namespace {

nlohmann::json coordinates_to_json(const std::vector<Coordinate>& coords) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& c : coords) {
        list.push_back({{"lat", c.lat}, {"lon", c.lon}});
    }
    return list;
}

std::string format_miles(double miles) {
    std::ostringstream oss;
    oss << ResultPresenter::round_to(miles, 2);
    return oss.str();
}

} // namespace

double ResultPresenter::round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

nlohmann::json ResultPresenter::geometry_to_json(const Geometry& geometry) {
    nlohmann::json out;
    out["type"] = geometry_kind_name(geometry_kind(geometry));

    if (const auto* point = std::get_if<PointGeometry>(&geometry)) {
        out["point"] = {{"lat", point->point.lat}, {"lon", point->point.lon}};
    } else if (const auto* line = std::get_if<PolylineGeometry>(&geometry)) {
        out["paths"] = nlohmann::json::array();
        for (const auto& path : line->paths) {
            out["paths"].push_back(coordinates_to_json(path));
        }
    } else {
        const auto& polygon = std::get<PolygonGeometry>(geometry);
        out["rings"] = nlohmann::json::array();
        for (const auto& ring : polygon.rings) {
            out["rings"].push_back(coordinates_to_json(ring));
        }
        if (polygon.member_starts.size() > 1) {
            out["member_starts"] = polygon.member_starts;
        }
    }
    return out;
}

std::string ResultPresenter::feature_label(const AnnotatedFeature& feature, const std::string& label_field) {
    if (auto label = feature.attributes.get_string(label_field)) {
        return *label;
    }
    if (feature.identity) {
        return *feature.identity;
    }
    return "unnamed";
}

nlohmann::json ResultPresenter::feature_to_json(const AnnotatedFeature& feature, const std::string& label_field) {
    nlohmann::json out;
    out["identity"] = feature.identity ? nlohmann::json(*feature.identity) : nlohmann::json(nullptr);
    out["source_id"] = feature.source_id;
    out["label"] = feature_label(feature, label_field);
    out["distance_miles"] = round_to(feature.distance_miles, 2);
    out["is_containing"] = feature.is_containing;

    nlohmann::json canonical = nlohmann::json::object();
    for (const auto& [field, value] : feature.attributes.canonical) {
        canonical[field] = value;
    }
    out["fields"] = std::move(canonical);
    out["attributes"] = feature.attributes.extra;
    out["geometry"] = geometry_to_json(feature.geometry);
    return out;
}

std::string ResultPresenter::summarize(const DatasetConfig& dataset, const ResultSet& result, double radius_miles) {
    std::ostringstream oss;
    if (!result.containing.empty()) {
        oss << "Location is within " << feature_label(result.containing.front(), dataset.label_field);
        if (result.containing.size() > 1) {
            oss << " (+" << (result.containing.size() - 1) << " more)";
        }
        oss << "; ";
    }

    if (result.nearby.empty()) {
        oss << "No " << dataset.label << " features found within " << format_miles(radius_miles) << " miles";
    } else {
        oss << "Found " << result.nearby.size() << " " << dataset.label << " features within "
            << format_miles(radius_miles) << " miles (nearest "
            << format_miles(result.nearby.front().distance_miles) << " mi)";
    }
    return oss.str();
}

nlohmann::json ResultPresenter::present(const DatasetConfig& dataset, const ResultSet& result, double radius_miles) {
    const std::string& id = dataset.id;
    nlohmann::json values = nlohmann::json::object();

    nlohmann::json containing = nlohmann::json::array();
    for (const auto& feature : result.containing) {
        containing.push_back(feature_to_json(feature, dataset.label_field));
    }
    nlohmann::json nearby = nlohmann::json::array();
    for (const auto& feature : result.nearby) {
        nearby.push_back(feature_to_json(feature, dataset.label_field));
    }

    values[id + "_containing"] = std::move(containing);
    values[id + "_nearby"] = std::move(nearby);
    values[id + "_count"] = result.total();
    values[id + "_containing_count"] = result.containing.size();
    values[id + "_nearby_count"] = result.nearby.size();
    values[id + "_radius_miles"] = radius_miles;
    values[id + "_summary"] = summarize(dataset, result, radius_miles);

    if (result.source_error) {
        values[id + "_error"] = *result.source_error;
    }
    return values;
}

} // namespace geoenrich
