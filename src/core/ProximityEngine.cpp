/**
 * @file ProximityEngine.cpp
 * @brief Implementation of the per-source query pipeline
 */

#include "ProximityEngine.hpp"
#include "Deduplicator.hpp"
#include "EnrichmentErrors.hpp"
#include <exception>

namespace geoenrich {

ProximityEngine::ProximityEngine(ResultClassifier classifier, SpatialQueryPaginator::Options paging)
    : classifier_(std::move(classifier)), paginator_(paging), logger_("ProximityEngine") {
}

ProximityEngine::Collected ProximityEngine::collect(const Coordinate& origin, SpatialSource& source,
                                                    std::optional<double> buffer_meters) const {
    SourceQuery base;
    base.origin = origin;
    base.spatial_rel = SpatialRelation::INTERSECTS;
    base.buffer_meters = buffer_meters;

    PaginationResult pages = paginator_.paginate(source, base);
    if (pages.failed_on_first_page && pages.failure) {
        std::rethrow_exception(pages.failure);
    }

    Collected collected;
    collected.error = pages.error;
    collected.features.reserve(pages.features.size());

    for (const auto& raw : pages.features) {
        try {
            collected.features.push_back(classifier_.classify(origin, raw));
        } catch (const GeometryError& e) {
            ++collected.dropped;
            logger_.warning(source.id() + ": dropped feature: " + e.what());
        }
    }

    return collected;
}

std::vector<AnnotatedFeature> ProximityEngine::query_containing(const Coordinate& origin,
                                                                SpatialSource& source) const {
    Collected collected = collect(origin, source, std::nullopt);
    if (collected.error) {
        logger_.warning(source.id() + ": containing query incomplete: " + *collected.error);
    }

    // Server-side intersects already decided containment
    for (auto& feature : collected.features) {
        feature.is_containing = true;
        feature.distance_miles = 0.0;
    }
    return Deduplicator::merge(std::move(collected.features), {}).containing;
}

ResultSet ProximityEngine::query_proximity(const Coordinate& origin, double radius_miles,
                                           SpatialSource& source) const {
    QuerySpec spec;
    spec.origin = origin;
    spec.radius_miles = radius_miles;
    return query(spec, source);
}

ResultSet ProximityEngine::query(const QuerySpec& spec, SpatialSource& source) const {
    std::vector<AnnotatedFeature> containing;
    std::vector<AnnotatedFeature> nearby;
    size_t dropped = 0;
    std::optional<std::string> error;

    if (spec.want_containing) {
        Collected collected = collect(spec.origin, source, std::nullopt);
        for (auto& feature : collected.features) {
            feature.is_containing = true;
            feature.distance_miles = 0.0;
        }
        containing = std::move(collected.features);
        dropped += collected.dropped;
        error = collected.error;
    }

    if (spec.want_nearby) {
        Collected collected = collect(spec.origin, source, spec.radius_miles * METERS_PER_MILE);
        for (auto& feature : collected.features) {
            if (ResultClassifier::within_radius(feature, spec.radius_miles)) {
                nearby.push_back(std::move(feature));
            }
        }
        dropped += collected.dropped;
        if (!error) {
            error = collected.error;
        }
    }

    ResultSet result = Deduplicator::merge(std::move(containing), std::move(nearby));
    result.dropped_features = dropped;
    result.source_error = error;

    logger_.detailed(source.id() + ": " + std::to_string(result.containing.size()) + " containing, " +
                     std::to_string(result.nearby.size()) + " nearby within " +
                     std::to_string(spec.radius_miles) + " mi");
    return result;
}

} // namespace geoenrich
