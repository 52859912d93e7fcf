/**
 * @file ArcGisFeatureSource.cpp
 * @brief ArcGIS REST query construction and response decoding
 */

#include "ArcGisFeatureSource.hpp"
#include "GeometryParser.hpp"
#include "../core/EnrichmentErrors.hpp"
#include <iomanip>
#include <sstream>

namespace geoenrich {

ArcGisFeatureSource::ArcGisFeatureSource(std::string id, std::string layer_url,
                                         std::shared_ptr<ResilientFetcher> fetcher)
    : id_(std::move(id)), layer_url_(std::move(layer_url)), fetcher_(std::move(fetcher)),
      logger_("ArcGisFeatureSource") {
    if (!fetcher_) {
        throw ConfigurationError("source '" + id_ + "' has no fetcher");
    }
}

std::string ArcGisFeatureSource::build_query_url(const SourceQuery& query) const {
    nlohmann::json point = {
        {"x", query.origin.lon},
        {"y", query.origin.lat},
        {"spatialReference", {{"wkid", 4326}}}
    };

    std::ostringstream url;
    url << layer_url_ << "/query"
        << "?f=json"
        << "&where=" << ResilientFetcher::url_encode("1=1")
        << "&outFields=*"
        << "&geometry=" << ResilientFetcher::url_encode(point.dump())
        << "&geometryType=esriGeometryPoint"
        << "&spatialRel=esriSpatialRelIntersects";

    if (query.buffer_meters && *query.buffer_meters > 0.0) {
        std::ostringstream meters;
        meters << std::fixed << std::setprecision(2) << *query.buffer_meters;
        url << "&distance=" << meters.str() << "&units=esriSRUnit_Meter";
    }

    url << "&inSR=4326&outSR=4326&returnGeometry=true"
        << "&resultRecordCount=" << query.page_size
        << "&resultOffset=" << query.offset;

    return url.str();
}

SourcePage ArcGisFeatureSource::parse_response(const nlohmann::json& body) const {
    if (!body.is_object()) {
        throw ParseError(id_ + ": response is not a JSON object");
    }

    if (auto err = body.find("error"); err != body.end() && !err->is_null()) {
        std::string message = err->is_object() ? err->value("message", err->dump()) : err->dump();
        std::optional<long> code;
        if (err->is_object() && err->contains("code") && (*err)["code"].is_number_integer()) {
            code = (*err)["code"].get<long>();
        }
        throw NetworkError(id_ + ": service error: " + message, code);
    }

    auto features = body.find("features");
    if (features == body.end() || !features->is_array()) {
        throw ParseError(id_ + ": response has no features array");
    }

    SourcePage page;
    page.has_more = body.value("exceededTransferLimit", false);
    page.features.reserve(features->size());

    for (const auto& entry : *features) {
        RawFeature feature;
        feature.source_id = id_;

        if (entry.contains("attributes") && entry["attributes"].is_object()) {
            feature.attributes = entry["attributes"];
        } else if (entry.contains("properties") && entry["properties"].is_object()) {
            feature.attributes = entry["properties"];
        }

        // Malformed geometry is left empty; the classifier drops the feature
        if (entry.contains("geometry")) {
            try {
                feature.geometry = GeometryParser::parse(entry["geometry"]);
            } catch (const GeometryError& e) {
                logger_.debug(id_ + ": " + e.what());
            }
        }

        page.features.push_back(std::move(feature));
    }

    return page;
}

SourcePage ArcGisFeatureSource::query(const SourceQuery& query) {
    const std::string url = build_query_url(query);
    logger_.debug(id_ + " query offset " + std::to_string(query.offset));
    return parse_response(fetcher_->fetch_json(url));
}

} // namespace geoenrich
