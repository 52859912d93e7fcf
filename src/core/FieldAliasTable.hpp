/**
 * @file FieldAliasTable.hpp
 * @brief Declarative canonical-field to attribute-alias resolution
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geoenrich {

/**
 * @brief Maps canonical field names ("name", "status", ...) to the attribute
 *        names a particular service uses for them
 *
 * Lookup tries each alias exactly in list order, then the same list again
 * case-insensitively. Null values and empty strings count as absent.
 */
class FieldAliasTable {
public:
    FieldAliasTable() = default;
    explicit FieldAliasTable(std::map<std::string, std::vector<std::string>> aliases);

    void add(const std::string& canonical, std::vector<std::string> aliases);

    std::optional<nlohmann::json> resolve(const nlohmann::json& attributes,
                                          const std::string& canonical) const;

    /**
     * @brief Resolve every canonical field present in the attributes
     */
    std::map<std::string, nlohmann::json> resolve_all(const nlohmann::json& attributes) const;

    /**
     * @brief Generic lookup over an ordered candidate list
     */
    static std::optional<nlohmann::json> lookup(const nlohmann::json& attributes,
                                                const std::vector<std::string>& candidates);

    /**
     * @brief Build from {"canonical": ["alias", ...], ...}
     * @throws ConfigurationError on any other shape
     */
    static FieldAliasTable from_json(const nlohmann::json& config);

    bool empty() const { return aliases_.empty(); }
    const std::map<std::string, std::vector<std::string>>& entries() const { return aliases_; }

private:
    std::map<std::string, std::vector<std::string>> aliases_;
};

} // namespace geoenrich
