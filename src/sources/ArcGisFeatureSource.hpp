/**
 * @file ArcGisFeatureSource.hpp
 * @brief SpatialSource over an ArcGIS REST feature/map service layer
 */

#pragma once

#include "../core/Logger.hpp"
#include "../core/ResilientFetcher.hpp"
#include "../core/SpatialSource.hpp"
#include <memory>
#include <string>

namespace geoenrich {

/**
 * @brief Queries "<layer url>/query" with a point geometry
 *
 * Requests are always made in EPSG:4326 (inSR/outSR); services that ignore
 * outSR are handled downstream by GeometryNormalizer. A JSON body carrying
 * an "error" object is a failed request even with HTTP 200.
 */
class ArcGisFeatureSource : public SpatialSource {
public:
    ArcGisFeatureSource(std::string id, std::string layer_url, std::shared_ptr<ResilientFetcher> fetcher);

    SourcePage query(const SourceQuery& query) override;
    std::string id() const override { return id_; }

    /**
     * @brief Full query URL for one page
     */
    std::string build_query_url(const SourceQuery& query) const;

    /**
     * @brief Decode a query response into a page
     * @throws NetworkError for an embedded service error
     * @throws ParseError when "features" is missing or not an array
     */
    SourcePage parse_response(const nlohmann::json& body) const;

private:
    std::string id_;
    std::string layer_url_;
    std::shared_ptr<ResilientFetcher> fetcher_;
    Logger logger_;
};

} // namespace geoenrich
