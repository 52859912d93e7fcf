/**
 * @file CensusTask.hpp
 * @brief FIPS codes and census geography names from the US Census geocoder
 */

#pragma once

#include "EnrichmentTask.hpp"
#include "../core/ResilientFetcher.hpp"
#include <memory>

namespace geoenrich {

class CensusTask : public EnrichmentTask {
public:
    struct Options {
        std::string geocoder_url = "https://geocoding.geo.census.gov/geocoder/geographies/coordinates";
        std::string benchmark = "Public_AR_Current";
        std::string vintage = "Current_Current";
    };

    explicit CensusTask(std::shared_ptr<ResilientFetcher> fetcher);
    CensusTask(std::shared_ptr<ResilientFetcher> fetcher, Options options);

    std::string id() const override { return "fips"; }

    TaskOutput run(const EnrichmentRequest& request) override;

    std::string build_url(const Coordinate& origin) const;

    /**
     * @brief Extract fips_*, state_*, county_*, census_tract_*, census_block_*
     *        and city_* keys
     *
     * Locations outside the US yield an empty object. The fips_* codes are
     * only set when state, county, tract and block are all present.
     */
    static nlohmann::json parse_response(const nlohmann::json& body);

private:
    std::shared_ptr<ResilientFetcher> fetcher_;
    Options options_;
};

} // namespace geoenrich
