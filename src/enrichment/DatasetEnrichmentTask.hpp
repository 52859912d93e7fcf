/**
 * @file DatasetEnrichmentTask.hpp
 * @brief Proximity enrichment for one catalog dataset
 */

#pragma once

#include "EnrichmentTask.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/ProximityEngine.hpp"
#include "../core/SpatialSource.hpp"
#include "../sources/DatasetCatalog.hpp"
#include <functional>
#include <memory>

namespace geoenrich {

/**
 * @brief Validates the query, runs the proximity engine against the
 *        dataset's source and presents the merged result
 *
 * A fresh source is created per run through the factory, so concurrent
 * runs never share a source.
 */
class DatasetEnrichmentTask : public EnrichmentTask {
public:
    using SourceFactory = std::function<std::unique_ptr<SpatialSource>(const DatasetConfig&)>;

    DatasetEnrichmentTask(DatasetConfig dataset, SourceFactory factory);

    /**
     * @brief Convenience: ArcGIS source over the given fetcher
     */
    DatasetEnrichmentTask(DatasetConfig dataset, std::shared_ptr<ResilientFetcher> fetcher);

    std::string id() const override { return dataset_.id; }

    TaskOutput run(const EnrichmentRequest& request) override;

    const DatasetConfig& dataset() const { return dataset_; }

private:
    DatasetConfig dataset_;
    SourceFactory factory_;
    ProximityEngine engine_;
};

} // namespace geoenrich
