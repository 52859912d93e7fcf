/**
 * @file ProximityEngine.hpp
 * @brief Containing and nearby queries against one spatial source
 */

#pragma once

#include "Logger.hpp"
#include "ResultClassifier.hpp"
#include "SpatialQueryPaginator.hpp"
#include "SpatialSource.hpp"
#include <vector>

namespace geoenrich {

/**
 * @brief Runs paginated queries, classifies the features and merges them
 *
 * Stateless apart from its configuration; one instance may serve concurrent
 * callers as long as each passes its own source.
 */
class ProximityEngine {
public:
    ProximityEngine(ResultClassifier classifier, SpatialQueryPaginator::Options paging);

    /**
     * @brief Features within radius_miles of origin, containing ones first
     *
     * A failure on the first page is rethrown; a later failure keeps the
     * partial result and sets ResultSet::source_error.
     */
    ResultSet query_proximity(const Coordinate& origin, double radius_miles, SpatialSource& source) const;

    /**
     * @brief Features that intersect origin; all carry distance 0
     */
    std::vector<AnnotatedFeature> query_containing(const Coordinate& origin, SpatialSource& source) const;

    /**
     * @brief Run the containing and/or nearby query a QuerySpec asks for and merge
     */
    ResultSet query(const QuerySpec& spec, SpatialSource& source) const;

private:
    struct Collected {
        std::vector<AnnotatedFeature> features;
        size_t dropped = 0;
        std::optional<std::string> error;
    };

    ResultClassifier classifier_;
    SpatialQueryPaginator paginator_;
    Logger logger_;

    Collected collect(const Coordinate& origin, SpatialSource& source,
                      std::optional<double> buffer_meters) const;
};

} // namespace geoenrich
