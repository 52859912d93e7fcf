/**
 * @file SpatialQueryPaginator.cpp
 * @brief Implementation of offset-based paging
 */

#include "SpatialQueryPaginator.hpp"
#include "EnrichmentErrors.hpp"
#include <stdexcept>

namespace geoenrich {

SpatialQueryPaginator::SpatialQueryPaginator()
    : SpatialQueryPaginator(Options{}) {
}

SpatialQueryPaginator::SpatialQueryPaginator(Options options)
    : options_(options), logger_("SpatialQueryPaginator") {
    if (options_.page_size <= 0) {
        throw ConfigurationError("page size must be positive, got " +
                                 std::to_string(options_.page_size));
    }
    if (options_.max_offset < 0) {
        throw ConfigurationError("max offset must not be negative");
    }
}

PaginationResult SpatialQueryPaginator::paginate(SpatialSource& source, const SourceQuery& base) const {
    PaginationResult result;
    SourceQuery query = base;
    query.page_size = options_.page_size;
    query.offset = 0;

    const std::string source_id = source.id();

    while (true) {
        SourcePage page;
        try {
            ++result.pages_requested;
            page = source.query(query);
        } catch (const std::exception& e) {
            result.error = e.what();
            result.failure = std::current_exception();
            result.failed_on_first_page = (query.offset == 0);
            logger_.warning(source_id + " page at offset " + std::to_string(query.offset) +
                            " failed, keeping " + std::to_string(result.features.size()) +
                            " features: " + e.what());
            break;
        }

        const long returned = static_cast<long>(page.features.size());
        logger_.debug(source_id + " offset " + std::to_string(query.offset) + ": " +
                      std::to_string(returned) + " features" +
                      (page.has_more ? " (more available)" : ""));

        for (auto& feature : page.features) {
            if (feature.source_id.empty()) {
                feature.source_id = source_id;
            }
            result.features.push_back(std::move(feature));
        }

        const bool more = returned > 0 && (page.has_more || returned >= options_.page_size);
        if (!more) {
            break;
        }

        const long next_offset = query.offset + options_.page_size;
        if (next_offset > options_.max_offset) {
            PaginationSafetyError bound(source_id, next_offset, options_.max_offset);
            result.error = bound.what();
            result.safety_bound_hit = true;
            logger_.warning(bound.what());
            break;
        }
        query.offset = next_offset;
    }

    logger_.detailed(source_id + ": " + std::to_string(result.features.size()) + " features in " +
                     std::to_string(result.pages_requested) + " pages");
    return result;
}

} // namespace geoenrich
