/**
 * @file TerrainTask.hpp
 * @brief Elevation, slope and aspect from a sampled elevation grid
 */

#pragma once

#include "EnrichmentTask.hpp"
#include "../core/ResilientFetcher.hpp"
#include <array>
#include <memory>

namespace geoenrich {

/**
 * @brief Slope/aspect of the center cell of a 3x3 elevation window
 */
struct TerrainAnalysis {
    double elevation_m = 0.0;
    double slope_degrees = 0.0;
    double aspect_degrees = 0.0;     // [0, 360)
    std::string slope_direction;     // 16-point compass

    /**
     * @brief Horn's method over a row-major window
     *
     * z is row-major in sampling order: z[0..2] is the southern row
     * (west to east), z[6..8] the northern row. Aspect is atan2(b, -a) over
     * that layout, normalized to [0, 360).
     *
     * @param z Elevations in meters
     * @param spacing_m Distance between neighbouring samples
     */
    static TerrainAnalysis from_grid(const std::array<double, 9>& z, double spacing_m);

    static std::string compass_direction(double aspect_degrees);
};

class TerrainTask : public EnrichmentTask {
public:
    struct Options {
        std::string elevation_url = "https://api.open-meteo.com/v1/elevation";
        double spacing_m = 90.0;
    };

    explicit TerrainTask(std::shared_ptr<ResilientFetcher> fetcher);
    TerrainTask(std::shared_ptr<ResilientFetcher> fetcher, Options options);

    std::string id() const override { return "terrain_analysis"; }

    TaskOutput run(const EnrichmentRequest& request) override;

    /**
     * @brief Sample points, south row first, west to east within a row
     */
    std::array<Coordinate, 9> sample_grid(const Coordinate& center) const;

    std::string build_url(const std::array<Coordinate, 9>& grid) const;

    /**
     * @brief Read the 9 elevations from a response
     * @throws ParseError unless "elevation" holds 9 numbers
     */
    static std::array<double, 9> parse_elevations(const nlohmann::json& body);

    static nlohmann::json present(const TerrainAnalysis& analysis);

private:
    std::shared_ptr<ResilientFetcher> fetcher_;
    Options options_;
};

} // namespace geoenrich
