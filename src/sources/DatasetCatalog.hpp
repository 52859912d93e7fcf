/**
 * @file DatasetCatalog.hpp
 * @brief Dataset definitions loaded from JSON
 */

#pragma once

#include "../core/FieldAliasTable.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geoenrich {

/**
 * @brief Immutable description of one queryable dataset
 *
 * url is the layer endpoint (".../FeatureServer/0"); "/query" is appended
 * when requesting.
 */
struct DatasetConfig {
    std::string id;
    std::string label;
    std::string url;
    long page_size = 2000;
    long max_offset = 50000;
    double radius_cap_miles = 5.0;
    double default_radius_miles = 5.0;
    bool containing = true;
    bool nearby = true;
    std::vector<std::string> identity_fields;  // empty: engine default priority
    FieldAliasTable field_aliases;
    std::string label_field = "name";          // canonical field used as display label
};

/**
 * @brief Registry of datasets keyed by id, in load order
 */
class DatasetCatalog {
public:
    DatasetCatalog() = default;

    /**
     * @brief Load definitions from a JSON file ({"datasets": [...]})
     * @throws ConfigurationError if the file is unreadable or malformed
     */
    static DatasetCatalog load_from_file(const std::string& filename);

    /**
     * @brief Build from an already parsed document
     * @throws ConfigurationError for missing ids/urls, duplicates or bad values
     */
    static DatasetCatalog from_json(const nlohmann::json& document);

    /**
     * @brief Parse one dataset object; unset values fall back to the engine defaults
     */
    static DatasetConfig parse_dataset(const nlohmann::json& entry);

    void add(DatasetConfig config);

    const DatasetConfig* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    std::vector<std::string> ids() const;
    const std::vector<DatasetConfig>& datasets() const { return datasets_; }
    size_t size() const { return datasets_.size(); }

private:
    std::vector<DatasetConfig> datasets_;
    std::map<std::string, size_t> index_;
};

} // namespace geoenrich
