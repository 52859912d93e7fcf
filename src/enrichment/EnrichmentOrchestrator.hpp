/**
 * @file EnrichmentOrchestrator.hpp
 * @brief Concurrent fan-out of enrichment tasks for one location
 */

#pragma once

#include "EnrichmentTask.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/Logger.hpp"
#include "../sources/DatasetCatalog.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace geoenrich {

/**
 * @brief Aggregated output of one enrich call
 *
 * values is the flat output map; result_sets holds the merged features of
 * every dataset task that succeeded, keyed by dataset id.
 */
struct EnrichmentReport {
    nlohmann::json values = nlohmann::json::object();
    std::map<std::string, ResultSet> result_sets;
};

/**
 * @brief Runs one task per selected dataset plus the always-on tasks
 *
 * All tasks of a call are launched together and joined before returning.
 * A task failure becomes a "<error_key>" string in the output and never
 * affects its siblings; enrich() does not throw. The orchestrator never
 * retries; retries happen per HTTP call inside ResilientFetcher. The only
 * state shared between calls is the performance counter.
 */
class EnrichmentOrchestrator {
public:
    explicit EnrichmentOrchestrator(EngineConfig config = {});

    /**
     * @brief Register a dataset task for every catalog entry plus weather,
     *        terrain and census (when enabled in config) over one fetcher
     */
    EnrichmentOrchestrator(const DatasetCatalog& catalog, std::shared_ptr<ResilientFetcher> fetcher,
                           EngineConfig config = {});

    /**
     * @brief Register a task selectable by its id()
     */
    void register_task(std::shared_ptr<EnrichmentTask> task);

    /**
     * @brief Register a task that runs on every call
     */
    void register_always_on(std::shared_ptr<EnrichmentTask> task);

    /**
     * @brief Enrich one location
     * @param origin Query point
     * @param radius_by_type Radius in miles per dataset id; missing ids use the dataset default
     * @param selected_types Dataset ids to query; unknown ids yield "<id>_error"
     */
    nlohmann::json enrich(const Coordinate& origin,
                          const std::map<std::string, double>& radius_by_type,
                          const std::vector<std::string>& selected_types);

    EnrichmentReport enrich_detailed(const Coordinate& origin,
                                     const std::map<std::string, double>& radius_by_type,
                                     const std::vector<std::string>& selected_types);

    PerformanceMetrics metrics() const;
    void reset_metrics();
    std::string format_metrics() const;

    std::vector<std::string> available_types() const;
    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::map<std::string, std::shared_ptr<EnrichmentTask>> tasks_;
    std::vector<std::shared_ptr<EnrichmentTask>> always_on_;
    Logger logger_;

    mutable std::mutex metrics_mutex_;
    PerformanceMetrics metrics_;

    void record(std::chrono::milliseconds elapsed, size_t launched);
};

} // namespace geoenrich
