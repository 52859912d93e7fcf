/**
 * @file main.cpp
 * @brief Main entry point for geo-enrich
 *
 * Enriches a point (or a batch of points) with the features of public GIS
 * services that contain it or lie within a radius, plus weather, terrain
 * and census geography, and prints the result map as JSON.
 */

#include "geo_enrichment.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/CurlHttpClient.hpp"
#include "core/EnrichmentErrors.hpp"
#include "core/Logger.hpp"
#include "core/ResilientFetcher.hpp"
#include "enrichment/BatchEnricher.hpp"
#include "enrichment/EnrichmentOrchestrator.hpp"
#include "export/ResultExporter.hpp"
#include "sources/DatasetCatalog.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

using namespace geoenrich;

namespace {

/**
 * @brief Print the catalog as an id / label / cap table
 */
void print_datasets(const DatasetCatalog& catalog) {
    std::cout << "Available datasets (" << catalog.size() << "):\n";
    for (const auto& dataset : catalog.datasets()) {
        std::cout << "  " << dataset.id << "\n"
                  << "      " << dataset.label
                  << " (default " << dataset.default_radius_miles << " mi, cap "
                  << dataset.radius_cap_miles << " mi)\n";
    }
}

std::map<std::string, double> radius_map(const CliSettings& settings,
                                         const std::vector<std::string>& selected) {
    std::map<std::string, double> radius_by_type;
    if (settings.radius_miles) {
        for (const auto& type : selected) {
            radius_by_type[type] = *settings.radius_miles;
        }
    }
    return radius_by_type;
}

void print_json(const nlohmann::json& value, bool pretty) {
    std::cout << (pretty ? value.dump(2) : value.dump()) << std::endl;
}

bool export_features(const std::vector<AnnotatedFeature>& features, const std::string& filename) {
    ResultExporter exporter;
    if (!exporter.export_features(features, filename)) {
        std::cerr << "Error: export to " << filename << " failed\n";
        return false;
    }
    std::cerr << "Exported " << features.size() << " features to " << filename << "\n";
    return true;
}

std::vector<AnnotatedFeature> flatten(const std::map<std::string, ResultSet>& result_sets) {
    std::vector<AnnotatedFeature> features;
    for (const auto& [id, result] : result_sets) {
        features.insert(features.end(), result.containing.begin(), result.containing.end());
        features.insert(features.end(), result.nearby.begin(), result.nearby.end());
    }
    return features;
}

int run_single(EnrichmentOrchestrator& orchestrator, const CliSettings& settings,
               const std::vector<std::string>& selected) {
    EnrichmentReport report = orchestrator.enrich_detailed(
        *settings.origin, radius_map(settings, selected), selected);

    print_json(report.values, settings.pretty);

    if (settings.export_path && !export_features(flatten(report.result_sets), *settings.export_path)) {
        return 1;
    }
    return 0;
}

int run_batch(EnrichmentOrchestrator& orchestrator, const CliSettings& settings,
              const std::vector<std::string>& selected) {
    Logger logger("BatchEnricher");
    const auto locations = BatchEnricher::load_locations(*settings.batch_file);
    if (locations.empty()) {
        std::cerr << "Error: no locations in " << *settings.batch_file << "\n";
        return 1;
    }

    BatchEnricher::Options options;
    options.delay = orchestrator.config().batch_delay;
    BatchEnricher batch(orchestrator, options);

    auto progress = [&logger](size_t current, size_t total, std::chrono::milliseconds remaining) {
        logger.info("Processed " + std::to_string(current) + "/" + std::to_string(total) +
                    ", about " + std::to_string(remaining.count() / 1000) + "s remaining");
    };
    const auto entries = batch.run(locations, radius_map(settings, selected), selected, progress);

    nlohmann::json output = nlohmann::json::array();
    std::vector<AnnotatedFeature> features;
    size_t failures = 0;
    for (const auto& entry : entries) {
        nlohmann::json item = {
            {"label", entry.location.label},
            {"lat", entry.location.origin.lat},
            {"lon", entry.location.origin.lon}
        };
        if (entry.error) {
            item["error"] = *entry.error;
            ++failures;
        } else {
            item["enrichment"] = entry.values;
            auto flat = flatten(entry.result_sets);
            features.insert(features.end(), flat.begin(), flat.end());
        }
        output.push_back(std::move(item));
    }
    print_json(output, settings.pretty);

    if (failures > 0) {
        logger.warning(std::to_string(failures) + " of " + std::to_string(entries.size()) +
                       " locations failed");
    }
    if (settings.export_path && !export_features(features, *settings.export_path)) {
        return 1;
    }
    return 0;
}

} // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return 0;  // Help was shown or parsing failed
        }
        const CliSettings& settings = cli.settings();

        const DatasetCatalog catalog = DatasetCatalog::load_from_file(settings.catalog_path);

        if (settings.list_datasets) {
            print_datasets(catalog);
            return 0;
        }

        std::vector<std::string> selected = settings.datasets;
        if (selected.empty()) {
            selected = catalog.ids();
        }
        for (const auto& id : selected) {
            if (!catalog.contains(id)) {
                std::cerr << "Warning: '" << id << "' is not in the catalog\n";
            }
        }

        if (cli.is_dry_run()) {
            cli.print_config();
            std::cerr << "Dry run mode - configuration validated successfully\n";
            return 0;
        }

        auto fetcher = std::make_shared<ResilientFetcher>(
            std::make_shared<CurlHttpClient>(), cli.engine_config().fetch);
        EnrichmentOrchestrator orchestrator(catalog, fetcher, cli.engine_config());

        const int status = settings.batch_file
            ? run_batch(orchestrator, settings, selected)
            : run_single(orchestrator, settings, selected);

        if (settings.show_metrics) {
            std::cerr << orchestrator.format_metrics() << "\n";
        }
        return status;

    } catch (const EnrichmentError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
