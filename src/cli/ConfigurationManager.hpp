/**
 * @file ConfigurationManager.hpp
 * @brief Engine settings file management
 */

#pragma once

#include "../core/EngineConfig.hpp"
#include <map>
#include <optional>
#include <string>

namespace geoenrich {

/**
 * @brief Configuration file manager for loading and saving engine settings
 *
 * Files are key=value lines; '#' starts a comment line. Recognized keys:
 * timeout_seconds, retry_delay_ms, user_agent, use_proxies, proxies
 * (comma-separated "prefix:<url>" / "wrap:<url>"), page_size, max_offset,
 * batch_delay_ms, default_radius_miles, radius_cap_miles,
 * default_enrichments, log_level.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @return true if successful, false if the file could not be opened
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Convert to an EngineConfig, starting from the defaults
     * @throws ConfigurationError on malformed numeric, boolean or proxy values
     */
    EngineConfig to_engine_config() const;

    void from_engine_config(const EngineConfig& config);

    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    long get_long(const std::string& key, long default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace geoenrich
