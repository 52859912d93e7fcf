/**
 * @file DatasetEnrichmentTask.cpp
 * @brief Proximity enrichment for one catalog dataset
 */

#include "DatasetEnrichmentTask.hpp"
#include "ResultPresenter.hpp"
#include "../core/EnrichmentErrors.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "../sources/ArcGisFeatureSource.hpp"

namespace geoenrich {

namespace {

SpatialQueryPaginator::Options paging_for(const DatasetConfig& dataset) {
    SpatialQueryPaginator::Options options;
    options.page_size = dataset.page_size;
    options.max_offset = dataset.max_offset;
    return options;
}

} // namespace

DatasetEnrichmentTask::DatasetEnrichmentTask(DatasetConfig dataset, SourceFactory factory)
    : dataset_(std::move(dataset)),
      factory_(std::move(factory)),
      engine_(ResultClassifier(dataset_.identity_fields, dataset_.field_aliases), paging_for(dataset_)) {
    if (!factory_) {
        throw ConfigurationError("dataset '" + dataset_.id + "' has no source factory");
    }
}

DatasetEnrichmentTask::DatasetEnrichmentTask(DatasetConfig dataset, std::shared_ptr<ResilientFetcher> fetcher)
    : DatasetEnrichmentTask(std::move(dataset), [fetcher](const DatasetConfig& config) {
          return std::make_unique<ArcGisFeatureSource>(config.id, config.url, fetcher);
      }) {
}

TaskOutput DatasetEnrichmentTask::run(const EnrichmentRequest& request) {
    Logger logger("DatasetEnrichmentTask");

    QuerySpec spec;
    spec.origin = request.origin;
    spec.radius_miles = request.radius_miles.value_or(dataset_.default_radius_miles);
    spec.want_containing = dataset_.containing;
    spec.want_nearby = dataset_.nearby;

    InputValidator validator;
    ValidationResult validation = validator.validate(spec, dataset_.radius_cap_miles);
    if (validation.has_errors()) {
        throw ConfigurationError(dataset_.id + ": " + validation.conflicts.front().description);
    }
    spec = validation.sanitized;

    std::unique_ptr<SpatialSource> source = factory_(dataset_);
    ResultSet result = engine_.query(spec, *source);

    if (result.dropped_features > 0) {
        logger.warning(dataset_.id + ": dropped " + std::to_string(result.dropped_features) +
                       " features with unusable geometry");
    }

    TaskOutput output;
    output.values = ResultPresenter::present(dataset_, result, spec.radius_miles);
    output.result_set = std::move(result);
    return output;
}

} // namespace geoenrich
