/**
 * @file EnrichmentTask.hpp
 * @brief One isolated unit of work launched by the orchestrator
 */

#pragma once

#include "geo_enrichment.hpp"
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace geoenrich {

struct EnrichmentRequest {
    Coordinate origin;
    std::optional<double> radius_miles;  // unset: the task's default
};

/**
 * @brief Values a task contributes to the aggregated output map
 *
 * result_set is filled by dataset tasks so callers can export features.
 */
struct TaskOutput {
    nlohmann::json values = nlohmann::json::object();
    std::optional<ResultSet> result_set;
};

/**
 * @brief Base class for dataset and always-on enrichments
 *
 * run() may throw; the orchestrator turns any exception into an
 * error_key() entry. Implementations must not share mutable state between
 * concurrent run() calls.
 */
class EnrichmentTask {
public:
    virtual ~EnrichmentTask() = default;

    virtual std::string id() const = 0;

    virtual std::string error_key() const { return id() + "_error"; }

    virtual TaskOutput run(const EnrichmentRequest& request) = 0;
};

} // namespace geoenrich
