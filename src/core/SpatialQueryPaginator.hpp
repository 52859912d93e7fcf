/**
 * @file SpatialQueryPaginator.hpp
 * @brief Offset-based paging over a SpatialSource
 */

#pragma once

#include "Logger.hpp"
#include "SpatialSource.hpp"
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace geoenrich {

/**
 * @brief Accumulated pages of one paginated query
 *
 * error is set when paging stopped early (request failure or the offset
 * safety bound); features then holds everything fetched before the stop.
 */
struct PaginationResult {
    std::vector<RawFeature> features;
    size_t pages_requested = 0;
    std::optional<std::string> error;
    std::exception_ptr failure;  // set when a page request threw
    bool safety_bound_hit = false;
    bool failed_on_first_page = false;
};

class SpatialQueryPaginator {
public:
    struct Options {
        long page_size = 2000;
        long max_offset = 50000;
    };

    SpatialQueryPaginator();
    explicit SpatialQueryPaginator(Options options);

    /**
     * @brief Request pages until the source runs dry
     *
     * Starting at offset 0, the offset advances by page_size while a page is
     * non-empty and either reports has_more or is full. The loop stops before
     * requesting an offset beyond max_offset, so at most
     * ceil(max_offset / page_size) + 1 pages are requested. Exceptions thrown
     * by the source are recorded in the result, never propagated.
     *
     * @param base Query template; its offset and page_size are overwritten
     */
    PaginationResult paginate(SpatialSource& source, const SourceQuery& base) const;

    const Options& options() const { return options_; }

private:
    Options options_;
    Logger logger_;
};

} // namespace geoenrich
