/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the geo-enrich front end
 */

#pragma once

#include "geo_enrichment.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/UnitParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geoenrich {

/**
 * @brief Everything the front end needs to run one invocation
 */
struct CliSettings {
    std::optional<Coordinate> origin;
    std::optional<double> radius_miles;
    std::vector<std::string> datasets;          // empty: every catalog dataset
    std::string catalog_path = "config/datasets.json";
    std::optional<std::string> config_path;
    std::optional<std::string> batch_file;
    std::optional<std::string> export_path;
    std::optional<std::string> log_file;
    bool list_datasets = false;
    bool dry_run = false;
    bool show_metrics = false;
    bool pretty = true;
};

/**
 * @brief Command line interface for parsing arguments and building the engine configuration
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if parsing was successful, false if help was shown or an error was reported
     */
    bool parse_arguments(int argc, char* argv[]);

    const CliSettings& settings() const { return settings_; }

    /**
     * @brief Engine configuration: defaults, then --config file, then command line flags
     */
    const EngineConfig& engine_config() const { return engine_config_; }

    bool is_dry_run() const { return settings_.dry_run; }

    /**
     * @brief Print the effective configuration to stderr
     */
    void print_config() const;

    /**
     * @brief Split a comma separated list, trimming blanks and dropping empty items
     */
    static std::vector<std::string> split_list(const std::string& value);

private:
    CliSettings settings_;
    EngineConfig engine_config_;
    UnitParser unit_parser_;

    void configure_logging(const SimpleCommandLineParser& parser);
    bool parse_location(const SimpleCommandLineParser& parser);
    bool load_config_file(const std::string& filename);
};

} // namespace geoenrich
