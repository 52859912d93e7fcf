/**
 * @file EnrichmentErrors.hpp
 * @brief Exception taxonomy for fetch, parse, geometry and pagination failures
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace geoenrich {

/**
 * @brief Base class for all enrichment engine errors
 */
class EnrichmentError : public std::runtime_error {
public:
    explicit EnrichmentError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A request failed at the transport or HTTP level
 *
 * Also raised when every endpoint in a fetch chain has been exhausted and the
 * last failure was a network failure.
 */
class NetworkError : public EnrichmentError {
public:
    explicit NetworkError(const std::string& message,
                          std::optional<long> http_status = std::nullopt)
        : EnrichmentError("Network error: " + message), http_status_(http_status) {}

    std::optional<long> http_status() const { return http_status_; }

private:
    std::optional<long> http_status_;
};

/**
 * @brief Response body was not JSON (or was an HTML page posing as JSON)
 */
class ParseError : public EnrichmentError {
public:
    explicit ParseError(const std::string& message)
        : EnrichmentError("Parse error: " + message) {}
};

/**
 * @brief Missing or malformed geometry; the offending feature is dropped
 */
class GeometryError : public EnrichmentError {
public:
    explicit GeometryError(const std::string& message)
        : EnrichmentError("Geometry error: " + message) {}
};

/**
 * @brief Pagination offset passed the configured safety bound
 */
class PaginationSafetyError : public EnrichmentError {
public:
    PaginationSafetyError(const std::string& source_id, long offset, long max_offset)
        : EnrichmentError("Pagination safety bound reached for " + source_id +
                          ": offset " + std::to_string(offset) +
                          " exceeds " + std::to_string(max_offset)) {}
};

/**
 * @brief Invalid dataset catalog or engine configuration
 */
class ConfigurationError : public EnrichmentError {
public:
    explicit ConfigurationError(const std::string& message)
        : EnrichmentError("Configuration error: " + message) {}
};

} // namespace geoenrich
