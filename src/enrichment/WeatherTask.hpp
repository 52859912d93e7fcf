/**
 * @file WeatherTask.hpp
 * @brief Current conditions from the Open-Meteo forecast API
 */

#pragma once

#include "EnrichmentTask.hpp"
#include "../core/ResilientFetcher.hpp"
#include <memory>

namespace geoenrich {

class WeatherTask : public EnrichmentTask {
public:
    struct Options {
        std::string forecast_url = "https://api.open-meteo.com/v1/forecast";
    };

    explicit WeatherTask(std::shared_ptr<ResilientFetcher> fetcher);
    WeatherTask(std::shared_ptr<ResilientFetcher> fetcher, Options options);

    std::string id() const override { return "open_meteo_weather"; }

    TaskOutput run(const EnrichmentRequest& request) override;

    std::string build_url(const Coordinate& origin) const;

    /**
     * @brief Convert a forecast response into open_meteo_weather_* keys
     * @throws ParseError if current_weather is absent
     */
    static nlohmann::json parse_response(const nlohmann::json& body);

    /**
     * @brief WMO weather interpretation code to text
     */
    static std::string describe_weather_code(int code);

private:
    std::shared_ptr<ResilientFetcher> fetcher_;
    Options options_;
};

} // namespace geoenrich
