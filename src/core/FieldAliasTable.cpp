/**
 * @file FieldAliasTable.cpp
 * @brief Alias lookup over raw attribute bags
 */

#include "FieldAliasTable.hpp"
#include "EnrichmentErrors.hpp"
#include <algorithm>
#include <cctype>

namespace geoenrich {

namespace {

bool is_present(const nlohmann::json& value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_string() && value.get_ref<const std::string&>().empty()) {
        return false;
    }
    return true;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

FieldAliasTable::FieldAliasTable(std::map<std::string, std::vector<std::string>> aliases)
    : aliases_(std::move(aliases)) {
}

void FieldAliasTable::add(const std::string& canonical, std::vector<std::string> aliases) {
    aliases_[canonical] = std::move(aliases);
}

std::optional<nlohmann::json> FieldAliasTable::lookup(const nlohmann::json& attributes,
                                                      const std::vector<std::string>& candidates) {
    if (!attributes.is_object()) {
        return std::nullopt;
    }

    for (const auto& name : candidates) {
        auto it = attributes.find(name);
        if (it != attributes.end() && is_present(*it)) {
            return *it;
        }
    }

    for (const auto& name : candidates) {
        for (auto it = attributes.begin(); it != attributes.end(); ++it) {
            if (iequals(it.key(), name) && is_present(it.value())) {
                return it.value();
            }
        }
    }

    return std::nullopt;
}

std::optional<nlohmann::json> FieldAliasTable::resolve(const nlohmann::json& attributes,
                                                       const std::string& canonical) const {
    auto it = aliases_.find(canonical);
    if (it == aliases_.end()) {
        return std::nullopt;
    }
    return lookup(attributes, it->second);
}

std::map<std::string, nlohmann::json> FieldAliasTable::resolve_all(const nlohmann::json& attributes) const {
    std::map<std::string, nlohmann::json> resolved;
    for (const auto& [canonical, aliases] : aliases_) {
        if (auto value = lookup(attributes, aliases)) {
            resolved.emplace(canonical, std::move(*value));
        }
    }
    return resolved;
}

FieldAliasTable FieldAliasTable::from_json(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw ConfigurationError("field aliases must be an object");
    }

    FieldAliasTable table;
    for (auto it = config.begin(); it != config.end(); ++it) {
        std::vector<std::string> aliases;
        if (it.value().is_string()) {
            aliases.push_back(it.value().get<std::string>());
        } else if (it.value().is_array()) {
            for (const auto& alias : it.value()) {
                if (!alias.is_string()) {
                    throw ConfigurationError("alias for '" + it.key() + "' is not a string");
                }
                aliases.push_back(alias.get<std::string>());
            }
        } else {
            throw ConfigurationError("aliases for '" + it.key() + "' must be a string or array");
        }
        table.add(it.key(), std::move(aliases));
    }
    return table;
}

} // namespace geoenrich
