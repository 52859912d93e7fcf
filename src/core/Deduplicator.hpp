/**
 * @file Deduplicator.hpp
 * @brief Merges containing and nearby results by identity
 */

#pragma once

#include "geo_enrichment.hpp"
#include <vector>

namespace geoenrich {

/**
 * @brief Identity-keyed merge of the two query results of one source
 *
 * Containing features are added first and always win: a nearby feature whose
 * identity is already present is discarded. Nearby features flagged as
 * containing move to the containing list. Features without identity are
 * never considered duplicates. The nearby list is stably sorted by
 * distance, so ties keep fetch order.
 */
class Deduplicator {
public:
    static ResultSet merge(std::vector<AnnotatedFeature> containing,
                           std::vector<AnnotatedFeature> nearby);
};

} // namespace geoenrich
