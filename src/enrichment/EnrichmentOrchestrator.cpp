/**
 * @file EnrichmentOrchestrator.cpp
 * @brief Concurrent fan-out of enrichment tasks for one location
 */

#include "EnrichmentOrchestrator.hpp"
#include "CensusTask.hpp"
#include "DatasetEnrichmentTask.hpp"
#include "TerrainTask.hpp"
#include "WeatherTask.hpp"
#include "../core/EnrichmentErrors.hpp"
#include <future>
#include <sstream>
#include <system_error>

namespace geoenrich {

namespace {

struct LaunchedTask {
    std::string id;
    std::string error_key;
    std::future<TaskOutput> future;
};

} // namespace

EnrichmentOrchestrator::EnrichmentOrchestrator(EngineConfig config)
    : config_(std::move(config)), logger_("EnrichmentOrchestrator") {
}

EnrichmentOrchestrator::EnrichmentOrchestrator(const DatasetCatalog& catalog,
                                               std::shared_ptr<ResilientFetcher> fetcher,
                                               EngineConfig config)
    : EnrichmentOrchestrator(std::move(config)) {
    if (!fetcher) {
        throw ConfigurationError("orchestrator requires a fetcher");
    }

    for (const auto& dataset : catalog.datasets()) {
        register_task(std::make_shared<DatasetEnrichmentTask>(dataset, fetcher));
    }

    if (config_.default_enrichments) {
        register_always_on(std::make_shared<WeatherTask>(fetcher));
        register_always_on(std::make_shared<TerrainTask>(fetcher));
        register_always_on(std::make_shared<CensusTask>(fetcher));
    }
}

void EnrichmentOrchestrator::register_task(std::shared_ptr<EnrichmentTask> task) {
    if (!task) {
        throw ConfigurationError("cannot register an empty task");
    }
    const std::string id = task->id();
    if (!tasks_.emplace(id, std::move(task)).second) {
        throw ConfigurationError("duplicate enrichment type '" + id + "'");
    }
}

void EnrichmentOrchestrator::register_always_on(std::shared_ptr<EnrichmentTask> task) {
    if (!task) {
        throw ConfigurationError("cannot register an empty task");
    }
    always_on_.push_back(std::move(task));
}

std::vector<std::string> EnrichmentOrchestrator::available_types() const {
    std::vector<std::string> types;
    for (const auto& [id, task] : tasks_) {
        types.push_back(id);
    }
    return types;
}

nlohmann::json EnrichmentOrchestrator::enrich(const Coordinate& origin,
                                              const std::map<std::string, double>& radius_by_type,
                                              const std::vector<std::string>& selected_types) {
    return enrich_detailed(origin, radius_by_type, selected_types).values;
}

EnrichmentReport EnrichmentOrchestrator::enrich_detailed(const Coordinate& origin,
                                                         const std::map<std::string, double>& radius_by_type,
                                                         const std::vector<std::string>& selected_types) {
    const auto start = std::chrono::steady_clock::now();
    EnrichmentReport report;
    std::vector<LaunchedTask> launched;

    auto launch = [&](const std::shared_ptr<EnrichmentTask>& task, std::optional<double> radius) {
        EnrichmentRequest request{origin, radius};
        LaunchedTask entry;
        entry.id = task->id();
        entry.error_key = task->error_key();
        try {
            // Each task owns its request copy; the shared_ptr keeps the task alive until joined
            entry.future = std::async(std::launch::async, [task, request]() {
                return task->run(request);
            });
        } catch (const std::system_error& e) {
            logger_.error("Could not start " + entry.id + ": " + e.what());
            report.values[entry.error_key] = e.what();
            return;
        }
        launched.push_back(std::move(entry));
    };

    for (const auto& type : selected_types) {
        auto it = tasks_.find(type);
        if (it == tasks_.end()) {
            logger_.warning("Unknown enrichment type '" + type + "'");
            report.values[type + "_error"] = "Unknown enrichment type: " + type;
            continue;
        }
        std::optional<double> radius;
        if (auto r = radius_by_type.find(type); r != radius_by_type.end()) {
            radius = r->second;
        }
        launch(it->second, radius);
    }
    for (const auto& task : always_on_) {
        launch(task, std::nullopt);
    }

    logger_.detailed("Launched " + std::to_string(launched.size()) + " tasks for (" +
                     std::to_string(origin.lat) + ", " + std::to_string(origin.lon) + ")");

    // Join every task before touching results; failures stay local to their key
    for (auto& entry : launched) {
        try {
            TaskOutput output = entry.future.get();
            for (auto it = output.values.begin(); it != output.values.end(); ++it) {
                report.values[it.key()] = it.value();
            }
            if (output.result_set) {
                report.result_sets[entry.id] = std::move(*output.result_set);
            }
        } catch (const std::exception& e) {
            logger_.error(entry.id + " failed: " + e.what());
            report.values[entry.error_key] = e.what();
        } catch (...) {
            logger_.error(entry.id + " failed with a non-standard exception");
            report.values[entry.error_key] = "Unknown error";
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    record(elapsed, launched.size());
    logger_.info("Enrichment finished in " + std::to_string(elapsed.count()) + " ms");

    return report;
}

void EnrichmentOrchestrator::record(std::chrono::milliseconds elapsed, size_t launched) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.total_queries += 1;
    metrics_.total_time += elapsed;
    metrics_.average_time = std::chrono::milliseconds(
        metrics_.total_time.count() / static_cast<long long>(metrics_.total_queries));
    metrics_.parallel_queries += launched;
}

PerformanceMetrics EnrichmentOrchestrator::metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void EnrichmentOrchestrator::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = PerformanceMetrics{};
}

std::string EnrichmentOrchestrator::format_metrics() const {
    const PerformanceMetrics snapshot = metrics();
    std::ostringstream oss;
    oss << "Enrichment performance:\n"
        << "  Total enrichments: " << snapshot.total_queries << "\n"
        << "  Tasks launched:    " << snapshot.parallel_queries << "\n"
        << "  Total time:        " << snapshot.total_time.count() << " ms\n"
        << "  Average time:      " << snapshot.average_time.count() << " ms";
    return oss.str();
}

} // namespace geoenrich
