/**
 * @file TerrainTask.cpp
 * @brief Terrain analysis enrichment
 */

#include "TerrainTask.hpp"
#include "ResultPresenter.hpp"
#include "../core/EnrichmentErrors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace geoenrich {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double METERS_PER_DEGREE_LAT = 111000.0;
constexpr double FEET_PER_METER = 3.28084;

} // namespace

// ============================================================================
// TerrainAnalysis
// ============================================================================

TerrainAnalysis TerrainAnalysis::from_grid(const std::array<double, 9>& z, double spacing_m) {
    // z1..z9 in the usual Horn notation
    const double z1 = z[0], z2 = z[1], z3 = z[2];
    const double z4 = z[3], z6 = z[5];
    const double z7 = z[6], z8 = z[7], z9 = z[8];

    const double dz_dx = ((z3 + 2.0 * z6 + z9) - (z1 + 2.0 * z4 + z7)) / (8.0 * spacing_m);
    const double dz_dy = ((z7 + 2.0 * z8 + z9) - (z1 + 2.0 * z2 + z3)) / (8.0 * spacing_m);

    TerrainAnalysis analysis;
    analysis.elevation_m = z[4];
    analysis.slope_degrees = std::atan(std::sqrt(dz_dx * dz_dx + dz_dy * dz_dy)) * 180.0 / PI;

    double aspect = std::atan2(dz_dy, -dz_dx) * 180.0 / PI;
    if (aspect < 0.0) {
        aspect += 360.0;
    }
    if (aspect >= 360.0) {
        aspect -= 360.0;
    }
    analysis.aspect_degrees = aspect;
    analysis.slope_direction = compass_direction(aspect);
    return analysis;
}

std::string TerrainAnalysis::compass_direction(double aspect_degrees) {
    static const char* directions[16] = {
        "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
        "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"
    };
    const int index = static_cast<int>(std::lround(aspect_degrees / 22.5)) % 16;
    return directions[index < 0 ? index + 16 : index];
}

// ============================================================================
// TerrainTask
// ============================================================================

TerrainTask::TerrainTask(std::shared_ptr<ResilientFetcher> fetcher)
    : TerrainTask(std::move(fetcher), Options{}) {
}

TerrainTask::TerrainTask(std::shared_ptr<ResilientFetcher> fetcher, Options options)
    : fetcher_(std::move(fetcher)), options_(std::move(options)) {
    if (options_.spacing_m <= 0.0) {
        throw ConfigurationError("terrain sample spacing must be positive");
    }
}

std::array<Coordinate, 9> TerrainTask::sample_grid(const Coordinate& center) const {
    const double lat_step = options_.spacing_m / METERS_PER_DEGREE_LAT;
    const double lon_step = options_.spacing_m / (METERS_PER_DEGREE_LAT * std::cos(center.lat * PI / 180.0));

    std::array<Coordinate, 9> grid;
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            grid[row * 3 + col] = Coordinate(center.lat + (row - 1) * lat_step,
                                             center.lon + (col - 1) * lon_step);
        }
    }
    return grid;
}

std::string TerrainTask::build_url(const std::array<Coordinate, 9>& grid) const {
    std::ostringstream lats;
    std::ostringstream lons;
    lats << std::fixed << std::setprecision(6);
    lons << std::fixed << std::setprecision(6);

    for (size_t i = 0; i < grid.size(); ++i) {
        if (i > 0) {
            lats << ",";
            lons << ",";
        }
        lats << grid[i].lat;
        lons << grid[i].lon;
    }
    return options_.elevation_url + "?latitude=" + lats.str() + "&longitude=" + lons.str();
}

std::array<double, 9> TerrainTask::parse_elevations(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("elevation") || !body["elevation"].is_array()) {
        throw ParseError("elevation response has no elevation array");
    }
    const auto& values = body["elevation"];
    if (values.size() != 9) {
        throw ParseError("expected 9 elevation samples, got " + std::to_string(values.size()));
    }

    std::array<double, 9> z{};
    for (size_t i = 0; i < 9; ++i) {
        if (!values[i].is_number()) {
            throw ParseError("elevation sample " + std::to_string(i) + " is not a number");
        }
        z[i] = values[i].get<double>();
    }
    return z;
}

nlohmann::json TerrainTask::present(const TerrainAnalysis& analysis) {
    nlohmann::json values;
    values["terrain_elevation"] = analysis.elevation_m;
    values["terrain_slope"] = ResultPresenter::round_to(analysis.slope_degrees, 1);
    values["terrain_aspect"] = std::lround(analysis.aspect_degrees);
    values["terrain_slope_direction"] = analysis.slope_direction;
    values["elevation_ft"] = std::lround(analysis.elevation_m * FEET_PER_METER);
    return values;
}

TaskOutput TerrainTask::run(const EnrichmentRequest& request) {
    const auto grid = sample_grid(request.origin);
    const auto elevations = parse_elevations(fetcher_->fetch_json(build_url(grid)));

    TaskOutput output;
    output.values = present(TerrainAnalysis::from_grid(elevations, options_.spacing_m));
    return output;
}

} // namespace geoenrich
