/**
 * @file SpatialSource.hpp
 * @brief Abstract paged feature-service collaborator
 */

#pragma once

#include "geo_enrichment.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geoenrich {

enum class SpatialRelation {
    INTERSECTS
};

/**
 * @brief One page request against a feature service
 *
 * Containment mode supplies the origin with INTERSECTS and no buffer;
 * proximity mode adds a buffer distance in meters.
 */
struct SourceQuery {
    Coordinate origin;
    SpatialRelation spatial_rel = SpatialRelation::INTERSECTS;
    std::optional<double> buffer_meters;
    long offset = 0;
    long page_size = 2000;
};

/**
 * @brief One page of results
 */
struct SourcePage {
    std::vector<RawFeature> features;
    bool has_more = false;
};

/**
 * @brief Paged spatial query endpoint
 *
 * Implementations are stateless between calls: the offset in SourceQuery is
 * the only pagination state.
 */
class SpatialSource {
public:
    virtual ~SpatialSource() = default;

    /**
     * @brief Fetch one page
     * @throws NetworkError, ParseError on request failure
     */
    virtual SourcePage query(const SourceQuery& query) = 0;

    /**
     * @brief Stable source identifier, used for sourceId and error keys
     */
    virtual std::string id() const = 0;
};

} // namespace geoenrich
