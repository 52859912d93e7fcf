/**
 * @file InputValidator.hpp
 * @brief Query validation before any network use
 *
 * Rejects impossible queries with clear error messages and suggested
 * solutions; clamps radii above a dataset cap with a warning.
 */

#pragma once

#include "geo_enrichment.hpp"
#include <string>
#include <vector>
#include <optional>

namespace geoenrich {

/**
 * @brief Represents a problem detected in a query
 */
struct ParameterConflict {
    std::string description;                   // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 *
 * sanitized holds the query to run (radius clamped to the cap) when valid.
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;
    std::vector<std::string> warnings;
    QuerySpec sanitized;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate a query against a radius cap
     * @param spec Query to validate
     * @param radius_cap_miles Largest radius the dataset accepts
     */
    ValidationResult validate(const QuerySpec& spec, double radius_cap_miles) const;

private:
    std::optional<ParameterConflict> check_origin(const QuerySpec& spec) const;
    std::optional<ParameterConflict> check_radius(const QuerySpec& spec) const;
    std::optional<ParameterConflict> check_query_modes(const QuerySpec& spec) const;
};

} // namespace geoenrich
