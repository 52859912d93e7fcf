/**
 * @file CensusTask.cpp
 * @brief US Census geographies enrichment
 */

#include "CensusTask.hpp"
#include "../core/EnrichmentErrors.hpp"
#include "../core/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace geoenrich {

namespace {

const nlohmann::json* first_entry(const nlohmann::json& geographies, const char* layer) {
    auto it = geographies.find(layer);
    if (it == geographies.end() || !it->is_array() || it->empty() || !(*it)[0].is_object()) {
        return nullptr;
    }
    return &(*it)[0];
}

// Copies entry[field] to values[key] when present
void copy_field(nlohmann::json& values, const char* key, const nlohmann::json& entry, const char* field) {
    auto it = entry.find(field);
    if (it != entry.end() && !it->is_null()) {
        values[key] = *it;
    }
}

} // namespace

CensusTask::CensusTask(std::shared_ptr<ResilientFetcher> fetcher)
    : CensusTask(std::move(fetcher), Options{}) {
}

CensusTask::CensusTask(std::shared_ptr<ResilientFetcher> fetcher, Options options)
    : fetcher_(std::move(fetcher)), options_(std::move(options)) {
}

std::string CensusTask::build_url(const Coordinate& origin) const {
    std::ostringstream url;
    url << std::setprecision(10)
        << options_.geocoder_url
        << "?x=" << origin.lon
        << "&y=" << origin.lat
        << "&benchmark=" << options_.benchmark
        << "&vintage=" << options_.vintage
        << "&format=json";
    return url.str();
}

nlohmann::json CensusTask::parse_response(const nlohmann::json& body) {
    nlohmann::json values = nlohmann::json::object();

    if (!body.is_object() || !body.contains("result") || !body["result"].is_object() ||
        !body["result"].contains("geographies") || !body["result"]["geographies"].is_object()) {
        Logger("CensusTask").warning("Census geocoder returned no geographic data");
        return values;
    }

    const auto& geo = body["result"]["geographies"];
    const auto* state = first_entry(geo, "States");
    const auto* county = first_entry(geo, "Counties");
    const auto* tract = first_entry(geo, "Census Tracts");
    const auto* block = first_entry(geo, "2020 Census Blocks");
    const auto* place = first_entry(geo, "Incorporated Places");

    if (state && county && tract && block) {
        copy_field(values, "fips_block", *block, "GEOID");
        copy_field(values, "fips_tract", *tract, "GEOID");
        copy_field(values, "fips_state", *state, "STATE");
        copy_field(values, "fips_county", *county, "COUNTY");
        copy_field(values, "fips_tract6", *tract, "TRACT");
    }

    if (state) {
        copy_field(values, "state_name", *state, "NAME");
        copy_field(values, "state_code", *state, "STUSAB");
        copy_field(values, "state_geoid", *state, "GEOID");
        copy_field(values, "state_region", *state, "REGION");
        copy_field(values, "state_division", *state, "DIVISION");
    }

    if (county) {
        copy_field(values, "county_name", *county, "NAME");
        copy_field(values, "county_geoid", *county, "GEOID");
        copy_field(values, "county_basename", *county, "BASENAME");
    }

    if (tract) {
        copy_field(values, "census_tract_name", *tract, "NAME");
        copy_field(values, "census_tract_geoid", *tract, "GEOID");
        copy_field(values, "census_tract_basename", *tract, "BASENAME");
    }

    if (block) {
        copy_field(values, "census_block_name", *block, "NAME");
        copy_field(values, "census_block_geoid", *block, "GEOID");
        copy_field(values, "census_block_basename", *block, "BASENAME");
        values["census_block_urban_rural"] = (block->value("UR", "") == "U") ? "Urban" : "Rural";
    }

    if (place) {
        copy_field(values, "city_name", *place, "NAME");
        copy_field(values, "city_geoid", *place, "GEOID");
        copy_field(values, "city_basename", *place, "BASENAME");
        copy_field(values, "city_functional_status", *place, "FUNCSTAT");
    }

    return values;
}

TaskOutput CensusTask::run(const EnrichmentRequest& request) {
    TaskOutput output;
    output.values = parse_response(fetcher_->fetch_json(build_url(request.origin)));
    return output;
}

} // namespace geoenrich
