/**
 * @file BatchEnricher.hpp
 * @brief Sequential enrichment of many locations against rate-limited services
 */

#pragma once

#include "EnrichmentOrchestrator.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace geoenrich {

struct BatchLocation {
    Coordinate origin;
    std::string label;
};

/**
 * @brief Outcome for one location; error is set instead of aborting the batch
 */
struct BatchEntry {
    BatchLocation location;
    nlohmann::json values = nlohmann::json::object();
    std::map<std::string, ResultSet> result_sets;
    std::optional<std::string> error;
};

/**
 * @brief Enriches locations strictly one after another
 *
 * Consecutive requests are separated by at least the configured delay; a
 * location that fails records its error and the batch continues.
 */
class BatchEnricher {
public:
    struct Options {
        std::chrono::milliseconds delay{1100};
    };

    /**
     * @brief Progress after each location (1-based current, total, estimated ms remaining)
     */
    using ProgressCallback = std::function<void(size_t, size_t, std::chrono::milliseconds)>;
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    BatchEnricher(EnrichmentOrchestrator& orchestrator, Options options);

    std::vector<BatchEntry> run(const std::vector<BatchLocation>& locations,
                                const std::map<std::string, double>& radius_by_type,
                                const std::vector<std::string>& selected_types,
                                const ProgressCallback& progress = {}) const;

    /**
     * @brief Replace the inter-request sleep (tests)
     */
    void set_sleep_function(SleepFunction sleep) { sleep_ = std::move(sleep); }

    /**
     * @brief Read "lat,lon[,label]" lines; blank lines and '#' comments are skipped
     *
     * Coordinates may be decimal or DMS.
     *
     * @throws ConfigurationError if the file cannot be opened
     * @throws UnitParseError for an unparseable line (message names the line)
     */
    static std::vector<BatchLocation> load_locations(const std::string& filename);

private:
    EnrichmentOrchestrator& orchestrator_;
    Options options_;
    SleepFunction sleep_;
};

} // namespace geoenrich
