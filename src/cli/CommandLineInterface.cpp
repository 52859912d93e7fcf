/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "../core/EnrichmentErrors.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace geoenrich {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("geo-enrich",
        "GEO-ENRICH - Proximity enrichment of a point against public GIS services\n"
        "\n"
        "Queries the configured feature services for features containing the point\n"
        "and features within a radius, merges and ranks them by distance, and adds\n"
        "current weather, terrain and census geography for the location.");

    // Location options
    parser.add_option("lat", "", "Latitude in decimal degrees or DMS");
    parser.add_option("lon", "", "Longitude in decimal degrees or DMS");
    parser.add_option("location", "l", "Coordinate pair \"lat,lon\"");
    parser.add_option("radius", "r", "Search radius, bare numbers are miles (5, 8km, 2000ft)");
    parser.add_option("datasets", "d", "Comma separated dataset ids (default: every catalog dataset)");

    // Inputs
    parser.add_option("catalog", "", "Dataset catalog JSON file", false, "config/datasets.json");
    parser.add_option("config", "c", "Engine settings file (key=value)");
    parser.add_option("batch", "b", "File of \"lat,lon[,label]\" lines to enrich in sequence");

    // Outputs
    parser.add_option("export", "e", "Write annotated features to .geojson, .gpkg or .shp");
    parser.add_flag("compact", "", "Print JSON on a single line");
    parser.add_flag("metrics", "", "Print performance metrics to stderr");

    // Engine overrides
    parser.add_flag("no-defaults", "", "Skip the weather, terrain and census enrichments");
    parser.add_flag("no-proxies", "", "Request services directly only");
    parser.add_option("timeout", "", "Per-request timeout in seconds");
    parser.add_option("batch-delay", "", "Delay between batch locations in milliseconds");

    // Logging
    parser.add_flag("silent", "s", "Suppress all log output (same as --log-level 0)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "0=SILENT, 1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "facility levels as \"3,ResilientFetcher=5\"");
    parser.add_option("log-file", "", "Also append log output to this file");

    parser.add_flag("list-datasets", "", "List catalog datasets and exit");
    parser.add_flag("dry-run", "", "Parse arguments and validate without querying");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "geo-enrich v" << GEOENRICH_VERSION << std::endl;
        std::cout << "Built with libcurl, nlohmann/json, GDAL" << std::endl;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            return false;
        }
        settings_.config_path = config_file.value();
    }

    configure_logging(parser);

    if (auto value = parser.get("catalog")) {
        settings_.catalog_path = value.value();
    }
    if (auto value = parser.get("datasets")) {
        settings_.datasets = split_list(value.value());
    }
    if (auto value = parser.get("batch")) {
        settings_.batch_file = value.value();
    }
    if (auto value = parser.get("export")) {
        settings_.export_path = value.value();
    }

    settings_.list_datasets = parser.get_flag("list-datasets");
    settings_.dry_run = parser.get_flag("dry-run");
    settings_.show_metrics = parser.get_flag("metrics");
    settings_.pretty = !parser.get_flag("compact");

    if (parser.get_flag("no-defaults")) {
        engine_config_.default_enrichments = false;
    }
    if (parser.get_flag("no-proxies")) {
        engine_config_.fetch.use_proxies = false;
    }
    if (auto value = parser.get_as<int>("timeout")) {
        if (*value <= 0) {
            std::cerr << "Error: --timeout must be positive" << std::endl;
            return false;
        }
        engine_config_.fetch.timeout_seconds = *value;
    } else if (parser.get("timeout")) {
        std::cerr << "Error: invalid --timeout value" << std::endl;
        return false;
    }
    if (auto value = parser.get_as<long>("batch-delay")) {
        if (*value < 0) {
            std::cerr << "Error: --batch-delay cannot be negative" << std::endl;
            return false;
        }
        engine_config_.batch_delay = std::chrono::milliseconds(*value);
    } else if (parser.get("batch-delay")) {
        std::cerr << "Error: invalid --batch-delay value" << std::endl;
        return false;
    }

    if (auto value = parser.get("radius")) {
        try {
            double radius = unit_parser_.parse_radius_miles(value.value());
            if (!std::isfinite(radius) || radius <= 0.0) {
                std::cerr << "Error: --radius must be greater than zero" << std::endl;
                return false;
            }
            settings_.radius_miles = radius;
        } catch (const UnitParseError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return false;
        }
    }

    if (!parse_location(parser)) {
        return false;
    }

    if (!settings_.list_datasets && !settings_.origin && !settings_.batch_file) {
        std::cerr << "Error: a location is required (--lat/--lon, --location or --batch)" << std::endl;
        std::cerr << "Run with --help for usage" << std::endl;
        return false;
    }
    if (settings_.origin && settings_.batch_file) {
        std::cerr << "Error: --batch cannot be combined with a single location" << std::endl;
        return false;
    }

    return true;
}

void CommandLineInterface::configure_logging(const SimpleCommandLineParser& parser) {
    // Priority: CLI > environment > config file > defaults
    if (const char* env_log_level = std::getenv("GEOENRICH_LOG_LEVEL")) {
        Logger::parseLogConfig(env_log_level);
    }
    if (auto value = parser.get("log-level")) {
        Logger::parseLogConfig(value.value());
    }

    if (parser.get_flag("silent")) {
        Logger::setSilent(true);
    }
    if (parser.get_flag("verbose")) {
        Logger::setSilent(false);
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    if (const char* env_log_file = std::getenv("GEOENRICH_LOG_FILE")) {
        settings_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        settings_.log_file = value.value();
    }
    if (settings_.log_file.has_value() && !Logger::setSharedLogFile(settings_.log_file)) {
        std::cerr << "Warning: Failed to open log file: " << settings_.log_file.value() << std::endl;
    }
}

bool CommandLineInterface::parse_location(const SimpleCommandLineParser& parser) {
    auto lat = parser.get("lat");
    auto lon = parser.get("lon");
    auto pair = parser.get("location");

    try {
        if (pair.has_value()) {
            if (lat.has_value() || lon.has_value()) {
                std::cerr << "Error: use either --location or --lat/--lon, not both" << std::endl;
                return false;
            }
            auto [latitude, longitude] = unit_parser_.parse_coordinate_pair(pair.value());
            settings_.origin = Coordinate(latitude, longitude);
        } else if (lat.has_value() || lon.has_value()) {
            if (!lat.has_value() || !lon.has_value()) {
                std::cerr << "Error: --lat and --lon must be given together" << std::endl;
                return false;
            }
            settings_.origin = Coordinate(unit_parser_.parse_latitude(lat.value()),
                                          unit_parser_.parse_longitude(lon.value()));
        }
    } catch (const UnitParseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }

    if (settings_.origin && !settings_.origin->is_valid()) {
        std::cerr << "Error: coordinates out of range: " << settings_.origin->lat
                  << ", " << settings_.origin->lon << std::endl;
        return false;
    }
    return true;
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    ConfigurationManager manager;
    if (!manager.load_from_file(filename)) {
        return false;
    }
    try {
        engine_config_ = manager.to_engine_config();
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
    if (manager.has_value("log_level")) {
        Logger::parseLogConfig(manager.get_string("log_level"));
    }
    return true;
}

std::vector<std::string> CommandLineInterface::split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

void CommandLineInterface::print_config() const {
    std::cerr << "\n=== geo-enrich Configuration ===\n";
    if (settings_.origin) {
        std::cerr << "Location: " << settings_.origin->lat << ", " << settings_.origin->lon << "\n";
    }
    if (settings_.batch_file) {
        std::cerr << "Batch file: " << *settings_.batch_file << "\n";
    }
    std::cerr << "Radius: ";
    if (settings_.radius_miles) {
        std::cerr << *settings_.radius_miles << " mi\n";
    } else {
        std::cerr << "dataset default\n";
    }
    std::cerr << "Datasets: ";
    if (settings_.datasets.empty()) {
        std::cerr << "all";
    }
    for (size_t i = 0; i < settings_.datasets.size(); ++i) {
        std::cerr << settings_.datasets[i];
        if (i < settings_.datasets.size() - 1) std::cerr << ", ";
    }
    std::cerr << "\n";
    std::cerr << "Catalog: " << settings_.catalog_path << "\n";
    std::cerr << "Default enrichments: " << (engine_config_.default_enrichments ? "on" : "off") << "\n";
    std::cerr << "Proxies: " << (engine_config_.fetch.use_proxies ? "on" : "off") << "\n";
    std::cerr << "Timeout: " << engine_config_.fetch.timeout_seconds << "s\n";
    std::cerr << "Page size: " << engine_config_.paging.page_size
              << ", max offset: " << engine_config_.paging.max_offset << "\n";
    if (settings_.export_path) {
        std::cerr << "Export: " << *settings_.export_path << "\n";
    }
    std::cerr << "================================\n\n";
}

} // namespace geoenrich
