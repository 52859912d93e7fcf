/**
 * @file DatasetCatalog.cpp
 * @brief Dataset catalog loading and validation
 */

#include "DatasetCatalog.hpp"
#include "../core/EnrichmentErrors.hpp"
#include "../core/Logger.hpp"
#include <algorithm>
#include <fstream>

namespace geoenrich {

namespace {

template <typename T>
T value_or(const nlohmann::json& entry, const char* key, T fallback, const std::string& id) {
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::type_error&) {
        throw ConfigurationError("dataset '" + id + "': field '" + key + "' has the wrong type");
    }
}

} // namespace

DatasetConfig DatasetCatalog::parse_dataset(const nlohmann::json& entry) {
    if (!entry.is_object()) {
        throw ConfigurationError("dataset entry is not an object");
    }

    DatasetConfig config;
    config.id = value_or<std::string>(entry, "id", "", "?");
    if (config.id.empty()) {
        throw ConfigurationError("dataset entry without id");
    }

    config.url = value_or<std::string>(entry, "url", "", config.id);
    if (config.url.rfind("http://", 0) != 0 && config.url.rfind("https://", 0) != 0) {
        throw ConfigurationError("dataset '" + config.id + "' needs an http(s) url");
    }
    while (!config.url.empty() && config.url.back() == '/') {
        config.url.pop_back();
    }

    config.label = value_or<std::string>(entry, "label", config.id, config.id);
    config.page_size = value_or<long>(entry, "page_size", config.page_size, config.id);
    config.max_offset = value_or<long>(entry, "max_offset", config.max_offset, config.id);
    config.radius_cap_miles = value_or<double>(entry, "radius_cap_miles", config.radius_cap_miles, config.id);
    config.default_radius_miles = value_or<double>(entry, "default_radius_miles",
                                                   std::min(config.default_radius_miles, config.radius_cap_miles),
                                                   config.id);
    config.containing = value_or<bool>(entry, "containing", config.containing, config.id);
    config.nearby = value_or<bool>(entry, "nearby", config.nearby, config.id);
    config.identity_fields = value_or<std::vector<std::string>>(entry, "identity_fields", {}, config.id);
    config.label_field = value_or<std::string>(entry, "label_field", config.label_field, config.id);

    if (entry.contains("field_aliases")) {
        config.field_aliases = FieldAliasTable::from_json(entry["field_aliases"]);
    }

    if (config.page_size <= 0 || config.max_offset < 0) {
        throw ConfigurationError("dataset '" + config.id + "': invalid paging settings");
    }
    if (config.radius_cap_miles <= 0 || config.default_radius_miles <= 0) {
        throw ConfigurationError("dataset '" + config.id + "': radii must be positive");
    }
    if (!config.containing && !config.nearby) {
        throw ConfigurationError("dataset '" + config.id + "' disables both query modes");
    }

    return config;
}

DatasetCatalog DatasetCatalog::from_json(const nlohmann::json& document) {
    const nlohmann::json* list = &document;
    if (document.is_object()) {
        auto it = document.find("datasets");
        if (it == document.end()) {
            throw ConfigurationError("catalog has no 'datasets' array");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw ConfigurationError("'datasets' must be an array");
    }

    DatasetCatalog catalog;
    for (const auto& entry : *list) {
        catalog.add(parse_dataset(entry));
    }
    return catalog;
}

DatasetCatalog DatasetCatalog::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open dataset catalog " + filename);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(filename + ": " + e.what());
    }

    DatasetCatalog catalog = from_json(document);
    Logger("DatasetCatalog").detailed("Loaded " + std::to_string(catalog.size()) +
                                      " datasets from " + filename);
    return catalog;
}

void DatasetCatalog::add(DatasetConfig config) {
    if (index_.count(config.id)) {
        throw ConfigurationError("duplicate dataset id '" + config.id + "'");
    }
    index_[config.id] = datasets_.size();
    datasets_.push_back(std::move(config));
}

const DatasetConfig* DatasetCatalog::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &datasets_[it->second];
}

std::vector<std::string> DatasetCatalog::ids() const {
    std::vector<std::string> result;
    result.reserve(datasets_.size());
    for (const auto& dataset : datasets_) {
        result.push_back(dataset.id);
    }
    return result;
}

} // namespace geoenrich
