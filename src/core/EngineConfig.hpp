/**
 * @file EngineConfig.hpp
 * @brief Immutable engine settings injected at construction
 */

#pragma once

#include "ResilientFetcher.hpp"
#include "SpatialQueryPaginator.hpp"
#include <chrono>

namespace geoenrich {

/**
 * @brief Engine-wide defaults; per-dataset values in DatasetConfig override paging and radius
 */
struct EngineConfig {
    FetchOptions fetch;
    SpatialQueryPaginator::Options paging;          // page_size 2000, max_offset 50000
    std::chrono::milliseconds batch_delay{1100};
    double default_radius_miles = 5.0;
    double default_radius_cap_miles = 5.0;
    bool default_enrichments = true;                 // weather, terrain, census
};

} // namespace geoenrich
