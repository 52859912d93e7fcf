/**
 * @file ConfigurationManager.cpp
 * @brief Engine settings file management
 */

#include "ConfigurationManager.hpp"
#include "../core/EnrichmentErrors.hpp"
#include <fstream>
#include <sstream>

namespace geoenrich {

namespace {

std::string trim(std::string value) {
    value.erase(0, value.find_first_not_of(" \t\r"));
    value.erase(value.find_last_not_of(" \t\r") + 1);
    return value;
}

FetchStrategy parse_proxy(const std::string& entry) {
    size_t colon = entry.find(':');
    if (colon == std::string::npos) {
        throw ConfigurationError("proxy entry '" + entry + "' must be prefix:<url> or wrap:<url>");
    }
    std::string style = trim(entry.substr(0, colon));
    std::string base = trim(entry.substr(colon + 1));
    if (base.empty()) {
        throw ConfigurationError("proxy entry '" + entry + "' has no base URL");
    }
    if (style == "prefix") return FetchStrategy::prefix(base);
    if (style == "wrap") return FetchStrategy::wrap(base);
    throw ConfigurationError("unknown proxy style '" + style + "'");
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // Simple key=value parser
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        config_values_[trim(line.substr(0, eq_pos))] = trim(line.substr(eq_pos + 1));
    }

    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# GeoEnrich engine configuration" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        file << key << "=" << value << std::endl;
    }

    return file.good();
}

long ConfigurationManager::get_long(const std::string& key, long default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        long value = std::stol(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw ConfigurationError(key + " has trailing characters: '" + it->second + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " is not an integer: '" + it->second + "'");
    }
}

double ConfigurationManager::get_double(const std::string& key, double default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    try {
        return std::stod(it->second);
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " is not a number: '" + it->second + "'");
    }
}

bool ConfigurationManager::get_bool(const std::string& key, bool default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    const std::string& value = it->second;
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ConfigurationError(key + " is not a boolean: '" + value + "'");
}

EngineConfig ConfigurationManager::to_engine_config() const {
    EngineConfig config;

    config.fetch.timeout_seconds = static_cast<int>(get_long("timeout_seconds", config.fetch.timeout_seconds));
    config.fetch.retry_delay = std::chrono::milliseconds(get_long("retry_delay_ms", config.fetch.retry_delay.count()));
    config.fetch.user_agent = get_string("user_agent", config.fetch.user_agent);
    config.fetch.use_proxies = get_bool("use_proxies", config.fetch.use_proxies);

    if (has_value("proxies")) {
        config.fetch.proxies.clear();
        std::istringstream iss(get_string("proxies"));
        std::string entry;
        while (std::getline(iss, entry, ',')) {
            entry = trim(entry);
            if (!entry.empty()) {
                config.fetch.proxies.push_back(parse_proxy(entry));
            }
        }
    }

    config.paging.page_size = get_long("page_size", config.paging.page_size);
    config.paging.max_offset = get_long("max_offset", config.paging.max_offset);
    config.batch_delay = std::chrono::milliseconds(get_long("batch_delay_ms", config.batch_delay.count()));
    config.default_radius_miles = get_double("default_radius_miles", config.default_radius_miles);
    config.default_radius_cap_miles = get_double("radius_cap_miles", config.default_radius_cap_miles);
    config.default_enrichments = get_bool("default_enrichments", config.default_enrichments);

    if (config.fetch.timeout_seconds <= 0) {
        throw ConfigurationError("timeout_seconds must be positive");
    }
    if (config.paging.page_size <= 0) {
        throw ConfigurationError("page_size must be positive");
    }
    if (config.default_radius_miles <= 0 || config.default_radius_cap_miles <= 0) {
        throw ConfigurationError("radius settings must be positive");
    }

    return config;
}

void ConfigurationManager::from_engine_config(const EngineConfig& config) {
    set_value("timeout_seconds", std::to_string(config.fetch.timeout_seconds));
    set_value("retry_delay_ms", std::to_string(config.fetch.retry_delay.count()));
    set_value("user_agent", config.fetch.user_agent);
    set_value("use_proxies", config.fetch.use_proxies ? "true" : "false");

    std::ostringstream proxies;
    for (size_t i = 0; i < config.fetch.proxies.size(); ++i) {
        const auto& proxy = config.fetch.proxies[i];
        if (i > 0) proxies << ",";
        proxies << (proxy.style == FetchStrategy::Style::WRAP ? "wrap:" : "prefix:") << proxy.base;
    }
    set_value("proxies", proxies.str());

    set_value("page_size", std::to_string(config.paging.page_size));
    set_value("max_offset", std::to_string(config.paging.max_offset));
    set_value("batch_delay_ms", std::to_string(config.batch_delay.count()));

    std::ostringstream radius;
    radius << config.default_radius_miles;
    set_value("default_radius_miles", radius.str());
    std::ostringstream cap;
    cap << config.default_radius_cap_miles;
    set_value("radius_cap_miles", cap.str());
    set_value("default_enrichments", config.default_enrichments ? "true" : "false");
}

} // namespace geoenrich
