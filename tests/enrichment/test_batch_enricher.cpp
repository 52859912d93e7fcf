/**
 * @file test_batch_enricher.cpp
 * @brief Unit tests for sequential batch enrichment and location files
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/EnrichmentErrors.hpp"
#include "core/UnitParser.hpp"
#include "enrichment/BatchEnricher.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace geoenrich;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

class CountingTask : public EnrichmentTask {
public:
    std::string id() const override { return "counter"; }

    TaskOutput run(const EnrichmentRequest& request) override {
        if (request.origin.lat == 13.0) {
            throw std::runtime_error("service unavailable");
        }
        TaskOutput output;
        output.values["counter_lat"] = request.origin.lat;
        return output;
    }
};

std::filesystem::path write_locations(const std::string& name, const std::string& content) {
    const auto dir = std::filesystem::temp_directory_path() / "geo_enrich_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

// =============================================================================
// Sequential run
// =============================================================================

class BatchEnricherTest : public ::testing::Test {
protected:
    void SetUp() override {
        orchestrator.register_task(std::make_shared<CountingTask>());
    }

    BatchEnricher make_batch(std::chrono::milliseconds delay) {
        BatchEnricher::Options options;
        options.delay = delay;
        BatchEnricher batch(orchestrator, options);
        batch.set_sleep_function([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
        return batch;
    }

    EnrichmentOrchestrator orchestrator;
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(BatchEnricherTest, SleepsBetweenLocationsOnly) {
    auto batch = make_batch(std::chrono::milliseconds(1100));
    std::vector<BatchLocation> locations = {
        {Coordinate(43.0, -71.5), "a"}, {Coordinate(44.0, -71.5), "b"}, {Coordinate(45.0, -71.5), "c"}
    };

    auto entries = batch.run(locations, {}, {"counter"});

    ASSERT_EQ(3u, entries.size());
    EXPECT_THAT(sleeps, ElementsAre(std::chrono::milliseconds(1100), std::chrono::milliseconds(1100)));
    EXPECT_DOUBLE_EQ(44.0, entries[1].values["counter_lat"].get<double>());
    EXPECT_EQ("c", entries[2].location.label);
}

TEST_F(BatchEnricherTest, ZeroDelayNeverSleeps) {
    auto batch = make_batch(std::chrono::milliseconds(0));
    batch.run({{Coordinate(43.0, -71.5), ""}, {Coordinate(44.0, -71.5), ""}}, {}, {"counter"});
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(BatchEnricherTest, InvalidLocationDoesNotStopBatch) {
    auto batch = make_batch(std::chrono::milliseconds(0));
    auto entries = batch.run({{Coordinate(95.0, -71.5), "bad"}, {Coordinate(43.0, -71.5), "good"}},
                             {}, {"counter"});

    ASSERT_EQ(2u, entries.size());
    ASSERT_TRUE(entries[0].error.has_value());
    EXPECT_EQ("Invalid coordinates", *entries[0].error);
    EXPECT_FALSE(entries[1].error.has_value());
    EXPECT_TRUE(entries[1].values.contains("counter_lat"));
}

TEST_F(BatchEnricherTest, TaskFailureIsRecordedInValues) {
    auto batch = make_batch(std::chrono::milliseconds(0));
    auto entries = batch.run({{Coordinate(13.0, 100.5), "bangkok"}}, {}, {"counter"});

    ASSERT_EQ(1u, entries.size());
    EXPECT_FALSE(entries[0].error.has_value());
    EXPECT_EQ("service unavailable", entries[0].values["counter_error"].get<std::string>());
}

TEST_F(BatchEnricherTest, ReportsProgressAfterEachLocation) {
    auto batch = make_batch(std::chrono::milliseconds(0));
    std::vector<std::pair<size_t, size_t>> reports;

    batch.run({{Coordinate(43.0, -71.5), ""}, {Coordinate(44.0, -71.5), ""}}, {}, {"counter"},
              [&reports](size_t current, size_t total, std::chrono::milliseconds) {
                  reports.emplace_back(current, total);
              });

    EXPECT_THAT(reports, ElementsAre(std::make_pair(size_t{1}, size_t{2}),
                                     std::make_pair(size_t{2}, size_t{2})));
}

// =============================================================================
// Location files
// =============================================================================

TEST(BatchLocationFileTest, ReadsDecimalAndDmsWithLabels) {
    auto path = write_locations("locations.csv",
        "# lat,lon,label\n"
        "\n"
        "43.2081, -71.5376, Concord\n"
        "29.7604,-95.3698\n"
        "40°26'46\"N, 79°58'56\"W, Pittsburgh\n");

    auto locations = BatchEnricher::load_locations(path.string());

    ASSERT_EQ(3u, locations.size());
    EXPECT_DOUBLE_EQ(43.2081, locations[0].origin.lat);
    EXPECT_DOUBLE_EQ(-71.5376, locations[0].origin.lon);
    EXPECT_EQ("Concord", locations[0].label);
    EXPECT_TRUE(locations[1].label.empty());
    EXPECT_NEAR(40.4461, locations[2].origin.lat, 1e-4);
    EXPECT_NEAR(-79.9822, locations[2].origin.lon, 1e-4);
}

TEST(BatchLocationFileTest, BadLineNamesFileAndLine) {
    auto path = write_locations("bad_locations.csv", "43.0,-71.5\nnot a coordinate\n");
    try {
        BatchEnricher::load_locations(path.string());
        FAIL() << "expected UnitParseError";
    } catch (const UnitParseError& e) {
        EXPECT_THAT(e.what(), HasSubstr("bad_locations.csv:2"));
    }
}

TEST(BatchLocationFileTest, MissingFileIsConfigurationError) {
    EXPECT_THROW(BatchEnricher::load_locations("/nonexistent/geo_enrich/locations.csv"), ConfigurationError);
}
