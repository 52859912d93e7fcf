/**
 * @file test_default_enrichments.cpp
 * @brief Unit tests for weather, terrain and census enrichments and result presentation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/EnrichmentErrors.hpp"
#include "enrichment/CensusTask.hpp"
#include "enrichment/ResultPresenter.hpp"
#include "enrichment/TerrainTask.hpp"
#include "enrichment/WeatherTask.hpp"
#include "mocks/MockHttpClient.hpp"

#include <memory>

using namespace geoenrich;
using namespace geoenrich::test;
using json = nlohmann::json;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

std::shared_ptr<ResilientFetcher> direct_fetcher(std::shared_ptr<HttpClient> client) {
    FetchOptions options;
    options.use_proxies = false;
    options.retry_delay = std::chrono::milliseconds(0);
    return std::make_shared<ResilientFetcher>(std::move(client), options);
}

} // namespace

// =============================================================================
// Weather
// =============================================================================

TEST(WeatherTaskTest, ParsesCurrentWeather) {
    json body = json::parse(R"({
        "timezone": "America/New_York",
        "timezone_abbreviation": "EST",
        "utc_offset_seconds": -18000,
        "current_weather": {"temperature": 20.0, "windspeed": 10.0, "winddirection": 270,
                            "weathercode": 3, "time": "2026-01-05T12:00"}
    })");

    json values = WeatherTask::parse_response(body);

    EXPECT_DOUBLE_EQ(68.0, values["open_meteo_weather_temperature_f"].get<double>());
    EXPECT_DOUBLE_EQ(6.2, values["open_meteo_weather_windspeed_mph"].get<double>());
    EXPECT_EQ("Overcast", values["open_meteo_weather_weather_description"].get<std::string>());
    EXPECT_EQ("EST", values["open_meteo_weather_timezone_abbreviation"].get<std::string>());
    EXPECT_EQ(-18000, values["open_meteo_weather_utc_offset_seconds"].get<int>());
    EXPECT_THAT(values["open_meteo_weather_summary"].get<std::string>(), HasSubstr("Overcast, 68.0"));
}

TEST(WeatherTaskTest, MissingCurrentWeatherIsParseError) {
    EXPECT_THROW(WeatherTask::parse_response(json::parse(R"({"hourly": {}})")), ParseError);
}

TEST(WeatherTaskTest, MissingReadingsAreParseErrors) {
    EXPECT_THROW(WeatherTask::parse_response(json::parse(
                     R"({"current_weather": {"windspeed": 10.0, "weathercode": 3}})")),
                 ParseError);
    EXPECT_THROW(WeatherTask::parse_response(json::parse(
                     R"({"current_weather": {"temperature": 20.0, "weathercode": 3}})")),
                 ParseError);
    EXPECT_THROW(WeatherTask::parse_response(json::parse(
                     R"({"current_weather": {"temperature": "warm", "windspeed": 10.0}})")),
                 ParseError);
}

TEST(WeatherTaskTest, WeatherCodeTable) {
    EXPECT_EQ("Clear sky", WeatherTask::describe_weather_code(0));
    EXPECT_EQ("Thunderstorm with heavy hail", WeatherTask::describe_weather_code(99));
    EXPECT_EQ("Unknown weather condition", WeatherTask::describe_weather_code(42));
}

TEST(WeatherTaskTest, RunRequestsForecastForOrigin) {
    auto client = std::make_shared<::testing::StrictMock<MockHttpClient>>();
    WeatherTask task(direct_fetcher(client));
    EXPECT_CALL(*client, get(HasSubstr("latitude=43&longitude=-71.5&current_weather=true"), _))
        .WillOnce(Return(ok_json(R"({"current_weather": {"temperature": 0, "windspeed": 0, "weathercode": 0}})")));

    TaskOutput output = task.run(EnrichmentRequest{Coordinate(43.0, -71.5), std::nullopt});
    EXPECT_DOUBLE_EQ(32.0, output.values["open_meteo_weather_temperature_f"].get<double>());
    EXPECT_FALSE(output.result_set.has_value());
}

// =============================================================================
// Terrain
// =============================================================================

TEST(TerrainAnalysisTest, FlatGridHasNoSlope) {
    auto analysis = TerrainAnalysis::from_grid({100, 100, 100, 100, 100, 100, 100, 100, 100}, 90.0);
    EXPECT_DOUBLE_EQ(0.0, analysis.slope_degrees);
    EXPECT_DOUBLE_EQ(100.0, analysis.elevation_m);
}

TEST(TerrainAnalysisTest, EastWardGradient) {
    // Each column 10 m higher than the one to its west
    auto analysis = TerrainAnalysis::from_grid({100, 110, 120, 100, 110, 120, 100, 110, 120}, 90.0);
    // dz/dx = 80 / 720
    EXPECT_NEAR(6.34, analysis.slope_degrees, 0.01);
    EXPECT_NEAR(180.0, analysis.aspect_degrees, 1e-9);
    EXPECT_EQ("S", analysis.slope_direction);
}

TEST(TerrainAnalysisTest, NorthWardGradient) {
    // Rows sampled south to north, each 10 m higher
    auto analysis = TerrainAnalysis::from_grid({100, 100, 100, 110, 110, 110, 120, 120, 120}, 90.0);
    EXPECT_NEAR(6.34, analysis.slope_degrees, 0.01);
    EXPECT_NEAR(90.0, analysis.aspect_degrees, 1e-9);
    EXPECT_EQ("E", analysis.slope_direction);
}

TEST(TerrainAnalysisTest, CompassBoundaries) {
    EXPECT_EQ("N", TerrainAnalysis::compass_direction(0.0));
    EXPECT_EQ("N", TerrainAnalysis::compass_direction(11.0));
    EXPECT_EQ("NNE", TerrainAnalysis::compass_direction(12.0));
    EXPECT_EQ("SW", TerrainAnalysis::compass_direction(225.0));
    EXPECT_EQ("NNW", TerrainAnalysis::compass_direction(337.5));
    EXPECT_EQ("N", TerrainAnalysis::compass_direction(359.0));
}

TEST(TerrainTaskTest, SampleGridSouthRowFirst) {
    TerrainTask task(direct_fetcher(std::make_shared<MockHttpClient>()));
    auto grid = task.sample_grid(Coordinate(43.0, -71.5));

    EXPECT_DOUBLE_EQ(43.0, grid[4].lat);
    EXPECT_DOUBLE_EQ(-71.5, grid[4].lon);
    EXPECT_LT(grid[0].lat, grid[4].lat);
    EXPECT_GT(grid[8].lat, grid[4].lat);
    EXPECT_LT(grid[0].lon, grid[2].lon);
    EXPECT_NEAR(90.0 / 111000.0, grid[7].lat - grid[4].lat, 1e-12);
}

TEST(TerrainTaskTest, ParseElevationsRequiresNineNumbers) {
    EXPECT_THROW(TerrainTask::parse_elevations(json::parse(R"({"elevation": [1, 2, 3]})")), ParseError);
    EXPECT_THROW(TerrainTask::parse_elevations(json::parse(R"({"elevation": [1,2,3,4,"x",6,7,8,9]})")), ParseError);
    EXPECT_THROW(TerrainTask::parse_elevations(json::parse(R"({})")), ParseError);
    auto z = TerrainTask::parse_elevations(json::parse(R"({"elevation": [1,2,3,4,5,6,7,8,9]})"));
    EXPECT_DOUBLE_EQ(5.0, z[4]);
}

TEST(TerrainTaskTest, RunPresentsAnalysis) {
    auto client = std::make_shared<::testing::StrictMock<MockHttpClient>>();
    TerrainTask task(direct_fetcher(client));
    EXPECT_CALL(*client, get(HasSubstr("elevation?latitude="), _))
        .WillOnce(Return(ok_json(R"({"elevation": [100,100,100,100,100,100,100,100,100]})")));

    TaskOutput output = task.run(EnrichmentRequest{Coordinate(43.0, -71.5), std::nullopt});
    EXPECT_DOUBLE_EQ(100.0, output.values["terrain_elevation"].get<double>());
    EXPECT_DOUBLE_EQ(0.0, output.values["terrain_slope"].get<double>());
    EXPECT_EQ(328, output.values["elevation_ft"].get<long>());
    EXPECT_TRUE(output.values.contains("terrain_slope_direction"));
}

// =============================================================================
// Census
// =============================================================================

class CensusTaskTest : public ::testing::Test {
protected:
    json full_response() const {
        return json::parse(R"({"result": {"geographies": {
            "States": [{"NAME": "New Hampshire", "STUSAB": "NH", "GEOID": "33", "STATE": "33",
                        "REGION": "1", "DIVISION": "1"}],
            "Counties": [{"NAME": "Merrimack County", "GEOID": "33013", "COUNTY": "013",
                          "BASENAME": "Merrimack"}],
            "Census Tracts": [{"NAME": "Census Tract 320", "GEOID": "33013032000", "TRACT": "032000",
                               "BASENAME": "320"}],
            "2020 Census Blocks": [{"NAME": "Block 1010", "GEOID": "330130320001010", "BASENAME": "1010",
                                    "UR": "R"}],
            "Incorporated Places": [{"NAME": "Concord city", "GEOID": "3314200", "BASENAME": "Concord",
                                     "FUNCSTAT": "A"}]
        }}})");
    }
};

TEST_F(CensusTaskTest, AllGeographiesYieldFipsCodes) {
    json values = CensusTask::parse_response(full_response());
    EXPECT_EQ("330130320001010", values["fips_block"].get<std::string>());
    EXPECT_EQ("33013032000", values["fips_tract"].get<std::string>());
    EXPECT_EQ("33", values["fips_state"].get<std::string>());
    EXPECT_EQ("013", values["fips_county"].get<std::string>());
    EXPECT_EQ("032000", values["fips_tract6"].get<std::string>());
    EXPECT_EQ("NH", values["state_code"].get<std::string>());
    EXPECT_EQ("Merrimack County", values["county_name"].get<std::string>());
    EXPECT_EQ("Rural", values["census_block_urban_rural"].get<std::string>());
    EXPECT_EQ("Concord city", values["city_name"].get<std::string>());
}

TEST_F(CensusTaskTest, MissingBlockSkipsFipsButKeepsNames) {
    json body = full_response();
    body["result"]["geographies"].erase("2020 Census Blocks");
    json values = CensusTask::parse_response(body);
    EXPECT_FALSE(values.contains("fips_block"));
    EXPECT_FALSE(values.contains("fips_state"));
    EXPECT_EQ("New Hampshire", values["state_name"].get<std::string>());
}

TEST_F(CensusTaskTest, OutsideUsIsEmpty) {
    EXPECT_TRUE(CensusTask::parse_response(json::parse(R"({"result": {"input": {}}})")).empty());
}

TEST_F(CensusTaskTest, UrlUsesLonAsX) {
    CensusTask task(direct_fetcher(std::make_shared<MockHttpClient>()));
    std::string url = task.build_url(Coordinate(43.0, -71.5));
    EXPECT_THAT(url, HasSubstr("?x=-71.5&y=43&benchmark=Public_AR_Current&vintage=Current_Current&format=json"));
}

// =============================================================================
// Presentation
// =============================================================================

TEST(ResultPresenterTest, DatasetKeysAndRounding) {
    DatasetConfig dataset;
    dataset.id = "parks";
    dataset.label = "Parks";

    AnnotatedFeature park;
    park.identity = "17";
    park.geometry = PointGeometry{Coordinate(43.01, -71.5)};
    park.distance_miles = 0.6912;
    park.attributes.canonical["name"] = "Memorial Field";

    ResultSet result;
    result.nearby.push_back(park);
    result.source_error = "Pagination safety bound reached";

    json values = ResultPresenter::present(dataset, result, 2.0);

    EXPECT_EQ(1u, values["parks_count"].get<size_t>());
    EXPECT_EQ(0u, values["parks_containing_count"].get<size_t>());
    EXPECT_DOUBLE_EQ(2.0, values["parks_radius_miles"].get<double>());
    EXPECT_DOUBLE_EQ(0.69, values["parks_nearby"][0]["distance_miles"].get<double>());
    EXPECT_EQ("Memorial Field", values["parks_nearby"][0]["label"].get<std::string>());
    EXPECT_EQ("point", values["parks_nearby"][0]["geometry"]["type"].get<std::string>());
    EXPECT_THAT(values["parks_summary"].get<std::string>(), HasSubstr("Found 1 Parks features within 2 miles"));
    EXPECT_EQ("Pagination safety bound reached", values["parks_error"].get<std::string>());
}

TEST(ResultPresenterTest, LabelFallsBackToIdentity) {
    AnnotatedFeature feature;
    feature.identity = "OBJ-3";
    EXPECT_EQ("OBJ-3", ResultPresenter::feature_label(feature, "name"));
    feature.identity.reset();
    EXPECT_EQ("unnamed", ResultPresenter::feature_label(feature, "name"));
}

TEST(ResultPresenterTest, MultiPolygonKeepsMemberStarts) {
    PolygonGeometry polygon;
    polygon.rings = {{Coordinate(0, 0), Coordinate(0, 1), Coordinate(1, 1)},
                     {Coordinate(5, 5), Coordinate(5, 6), Coordinate(6, 6)}};
    EXPECT_FALSE(ResultPresenter::geometry_to_json(polygon).contains("member_starts"));

    polygon.member_starts = {0, 1};
    json out = ResultPresenter::geometry_to_json(polygon);
    EXPECT_EQ("polygon", out["type"].get<std::string>());
    EXPECT_EQ(2u, out["rings"].size());
    EXPECT_EQ((std::vector<size_t>{0, 1}), out["member_starts"].get<std::vector<size_t>>());
}
