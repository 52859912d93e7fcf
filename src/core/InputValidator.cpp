/**
 * @file InputValidator.cpp
 * @brief Implementation of query validation
 */

#include "InputValidator.hpp"
#include "Logger.hpp"
#include <cmath>
#include <sstream>

namespace geoenrich {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid query:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const QuerySpec& spec, double radius_cap_miles) const {
    Logger logger("InputValidator");
    ValidationResult result;
    result.sanitized = spec;

    for (const auto& check : {check_origin(spec), check_radius(spec), check_query_modes(spec)}) {
        if (check) {
            result.conflicts.push_back(*check);
            result.is_valid = false;
        }
    }

    if (result.is_valid && radius_cap_miles > 0 && spec.radius_miles > radius_cap_miles) {
        std::ostringstream oss;
        oss << "Radius " << spec.radius_miles << " mi exceeds the cap of "
            << radius_cap_miles << " mi; using " << radius_cap_miles << " mi";
        result.warnings.push_back(oss.str());
        result.sanitized.radius_miles = radius_cap_miles;
        logger.warning(oss.str());
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_origin(const QuerySpec& spec) const {
    if (std::isfinite(spec.origin.lat) && std::isfinite(spec.origin.lon) && spec.origin.is_valid()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    std::ostringstream oss;
    oss << "Origin (" << spec.origin.lat << ", " << spec.origin.lon << ") is outside the valid range";
    conflict.description = oss.str();
    conflict.involved_params = {"--lat (-90 to 90)", "--lon (-180 to 180)"};
    conflict.suggestions = {
        "Check that latitude and longitude are not swapped",
        "Use decimal degrees, e.g. --lat 29.7604 --lon -95.3698"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_radius(const QuerySpec& spec) const {
    if (std::isfinite(spec.radius_miles) && spec.radius_miles > 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    std::ostringstream oss;
    oss << "Radius must be greater than zero (got " << spec.radius_miles << ")";
    conflict.description = oss.str();
    conflict.involved_params = {"--radius"};
    conflict.suggestions = {"Specify a positive radius such as --radius 5mi or --radius 2km"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_query_modes(const QuerySpec& spec) const {
    if (spec.want_containing || spec.want_nearby) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Neither containing nor nearby features were requested";
    conflict.involved_params = {"containing", "nearby"};
    conflict.suggestions = {"Enable at least one query mode for the dataset"};
    return conflict;
}

} // namespace geoenrich
