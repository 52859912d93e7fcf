/**
 * @file Deduplicator.cpp
 * @brief Identity dedup and distance ordering of merged results
 */

#include "Deduplicator.hpp"
#include <algorithm>
#include <unordered_set>

namespace geoenrich {

ResultSet Deduplicator::merge(std::vector<AnnotatedFeature> containing,
                              std::vector<AnnotatedFeature> nearby) {
    ResultSet merged;
    std::unordered_set<std::string> seen;

    // true if the feature is new (or anonymous) and was recorded
    auto admit = [&seen](const AnnotatedFeature& feature) {
        if (!feature.identity.has_value()) {
            return true;
        }
        return seen.insert(*feature.identity).second;
    };

    for (auto& feature : containing) {
        if (!admit(feature)) {
            continue;
        }
        feature.is_containing = true;
        feature.distance_miles = 0.0;
        merged.containing.push_back(std::move(feature));
    }

    for (auto& feature : nearby) {
        if (!admit(feature)) {
            continue;
        }
        if (feature.is_containing) {
            feature.distance_miles = 0.0;
            merged.containing.push_back(std::move(feature));
        } else {
            merged.nearby.push_back(std::move(feature));
        }
    }

    std::stable_sort(merged.nearby.begin(), merged.nearby.end(),
                     [](const AnnotatedFeature& a, const AnnotatedFeature& b) {
                         return a.distance_miles < b.distance_miles;
                     });

    return merged;
}

} // namespace geoenrich
