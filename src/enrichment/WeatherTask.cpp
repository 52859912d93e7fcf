/**
 * @file WeatherTask.cpp
 * @brief Open-Meteo current weather enrichment
 */

#include "WeatherTask.hpp"
#include "ResultPresenter.hpp"
#include "../core/EnrichmentErrors.hpp"
#include <initializer_list>
#include <iomanip>
#include <map>
#include <sstream>

namespace geoenrich {

namespace {

constexpr double KMH_TO_MPH = 0.621371;

} // namespace

WeatherTask::WeatherTask(std::shared_ptr<ResilientFetcher> fetcher)
    : WeatherTask(std::move(fetcher), Options{}) {
}

WeatherTask::WeatherTask(std::shared_ptr<ResilientFetcher> fetcher, Options options)
    : fetcher_(std::move(fetcher)), options_(std::move(options)) {
}

std::string WeatherTask::build_url(const Coordinate& origin) const {
    std::ostringstream url;
    url << std::setprecision(10)
        << options_.forecast_url
        << "?latitude=" << origin.lat
        << "&longitude=" << origin.lon
        << "&current_weather=true&timezone=auto";
    return url.str();
}

std::string WeatherTask::describe_weather_code(int code) {
    static const std::map<int, std::string> descriptions = {
        {0, "Clear sky"}, {1, "Mainly clear"}, {2, "Partly cloudy"}, {3, "Overcast"},
        {45, "Foggy"}, {48, "Depositing rime fog"},
        {51, "Light drizzle"}, {53, "Moderate drizzle"}, {55, "Dense drizzle"},
        {56, "Light freezing drizzle"}, {57, "Dense freezing drizzle"},
        {61, "Slight rain"}, {63, "Moderate rain"}, {65, "Heavy rain"},
        {66, "Light freezing rain"}, {67, "Heavy freezing rain"},
        {71, "Slight snow fall"}, {73, "Moderate snow fall"}, {75, "Heavy snow fall"},
        {77, "Snow grains"},
        {80, "Slight rain showers"}, {81, "Moderate rain showers"}, {82, "Violent rain showers"},
        {85, "Slight snow showers"}, {86, "Heavy snow showers"},
        {95, "Thunderstorm"}, {96, "Thunderstorm with slight hail"}, {99, "Thunderstorm with heavy hail"}
    };

    auto it = descriptions.find(code);
    return it != descriptions.end() ? it->second : "Unknown weather condition";
}

nlohmann::json WeatherTask::parse_response(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("current_weather") || !body["current_weather"].is_object()) {
        throw ParseError("No current weather data available");
    }

    const auto& current = body["current_weather"];
    for (const char* field : {"temperature", "windspeed"}) {
        if (!current.contains(field) || !current[field].is_number()) {
            throw ParseError(std::string("Current weather has no ") + field + " reading");
        }
    }
    const double temperature_c = current["temperature"].get<double>();
    const double windspeed = current["windspeed"].get<double>();
    const int weathercode = current.contains("weathercode") && current["weathercode"].is_number_integer()
        ? current["weathercode"].get<int>()
        : -1;

    const double temperature_f = temperature_c * 9.0 / 5.0 + 32.0;
    const double windspeed_mph = windspeed * KMH_TO_MPH;
    const std::string description = describe_weather_code(weathercode);

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(1)
            << "Current weather: " << description << ", " << temperature_f << "°F, "
            << windspeed_mph << " mph wind";

    nlohmann::json values;
    values["open_meteo_weather_temperature_c"] = temperature_c;
    values["open_meteo_weather_temperature_f"] = ResultPresenter::round_to(temperature_f, 1);
    values["open_meteo_weather_windspeed"] = windspeed;
    values["open_meteo_weather_windspeed_mph"] = ResultPresenter::round_to(windspeed_mph, 1);
    values["open_meteo_weather_winddirection"] = current.value("winddirection", 0.0);
    values["open_meteo_weather_weathercode"] = weathercode;
    values["open_meteo_weather_weather_description"] = description;
    values["open_meteo_weather_time"] = current.value("time", "");
    values["open_meteo_weather_timezone"] = body.value("timezone", "Unknown");
    values["open_meteo_weather_timezone_abbreviation"] = body.value("timezone_abbreviation", "Unknown");
    values["open_meteo_weather_utc_offset_seconds"] = body.value("utc_offset_seconds", 0);
    values["open_meteo_weather_summary"] = summary.str();
    return values;
}

TaskOutput WeatherTask::run(const EnrichmentRequest& request) {
    TaskOutput output;
    output.values = parse_response(fetcher_->fetch_json(build_url(request.origin)));
    return output;
}

} // namespace geoenrich
