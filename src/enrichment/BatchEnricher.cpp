/**
 * @file BatchEnricher.cpp
 * @brief Sequential batch enrichment
 */

#include "BatchEnricher.hpp"
#include "../core/EnrichmentErrors.hpp"
#include "../core/Logger.hpp"
#include "../core/UnitParser.hpp"
#include <fstream>
#include <thread>

namespace geoenrich {

BatchEnricher::BatchEnricher(EnrichmentOrchestrator& orchestrator, Options options)
    : orchestrator_(orchestrator),
      options_(options),
      sleep_([](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }) {
}

std::vector<BatchEntry> BatchEnricher::run(const std::vector<BatchLocation>& locations,
                                           const std::map<std::string, double>& radius_by_type,
                                           const std::vector<std::string>& selected_types,
                                           const ProgressCallback& progress) const {
    Logger logger("BatchEnricher");
    std::vector<BatchEntry> entries;
    entries.reserve(locations.size());

    const auto start = std::chrono::steady_clock::now();
    logger.info("Enriching " + std::to_string(locations.size()) + " locations");

    for (size_t i = 0; i < locations.size(); ++i) {
        if (i > 0 && options_.delay.count() > 0) {
            sleep_(options_.delay);
        }

        BatchEntry entry;
        entry.location = locations[i];

        if (!locations[i].origin.is_valid()) {
            entry.error = "Invalid coordinates";
            logger.warning("Skipping location " + std::to_string(i + 1) + ": invalid coordinates");
        } else {
            try {
                EnrichmentReport report = orchestrator_.enrich_detailed(
                    locations[i].origin, radius_by_type, selected_types);
                entry.values = std::move(report.values);
                entry.result_sets = std::move(report.result_sets);
            } catch (const std::exception& e) {
                entry.error = e.what();
                logger.error("Location " + std::to_string(i + 1) + " failed: " + e.what());
            }
        }
        entries.push_back(std::move(entry));

        if (progress) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            const size_t done = i + 1;
            const auto remaining = std::chrono::milliseconds(
                elapsed.count() / static_cast<long long>(done) *
                static_cast<long long>(locations.size() - done));
            progress(done, locations.size(), remaining);
        }
    }

    return entries;
}

std::vector<BatchLocation> BatchEnricher::load_locations(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open batch file " + filename);
    }

    UnitParser parser;
    std::vector<BatchLocation> locations;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t first = line.find(',');
        if (first == std::string::npos) {
            throw UnitParseError(filename + ":" + std::to_string(line_number) + ": expected lat,lon");
        }
        size_t second = line.find(',', first + 1);

        BatchLocation location;
        try {
            location.origin.lat = parser.parse_latitude(line.substr(0, first));
            location.origin.lon = parser.parse_longitude(
                line.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1));
        } catch (const UnitParseError& e) {
            throw UnitParseError(filename + ":" + std::to_string(line_number) + ": " + e.what());
        }
        if (second != std::string::npos) {
            location.label = line.substr(second + 1);
            location.label.erase(0, location.label.find_first_not_of(" \t"));
        }
        locations.push_back(std::move(location));
    }

    return locations;
}

} // namespace geoenrich
