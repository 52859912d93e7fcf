/**
 * @file GeometryParser.cpp
 * @brief ESRI JSON / GeoJSON geometry decoding
 */

#include "GeometryParser.hpp"
#include "../core/EnrichmentErrors.hpp"

namespace geoenrich {

std::optional<RawGeometry> GeometryParser::parse(const nlohmann::json& geometry) {
    if (geometry.is_null()) {
        return std::nullopt;
    }
    if (!geometry.is_object()) {
        throw GeometryError("geometry is not an object");
    }

    if (geometry.contains("type") && geometry.contains("coordinates")) {
        return parse_geojson(geometry);
    }
    return parse_esri(geometry);
}

Position GeometryParser::parse_position(const nlohmann::json& position) {
    if (!position.is_array() || position.size() < 2 ||
        !position[0].is_number() || !position[1].is_number()) {
        throw GeometryError("malformed coordinate " + position.dump());
    }
    return Position(position[0].get<double>(), position[1].get<double>());
}

std::vector<Position> GeometryParser::parse_position_list(const nlohmann::json& positions) {
    if (!positions.is_array()) {
        throw GeometryError("expected coordinate array");
    }
    std::vector<Position> result;
    result.reserve(positions.size());
    for (const auto& position : positions) {
        result.push_back(parse_position(position));
    }
    return result;
}

RawGeometry GeometryParser::parse_esri(const nlohmann::json& geometry) {
    RawGeometry raw;

    if (geometry.contains("x") && geometry.contains("y")) {
        const auto& x = geometry["x"];
        const auto& y = geometry["y"];
        if (!x.is_number() || !y.is_number()) {
            throw GeometryError("point has non-numeric x/y");
        }
        raw.kind = GeometryKind::POINT;
        raw.parts.push_back({Position(x.get<double>(), y.get<double>())});
        return raw;
    }

    if (geometry.contains("points")) {
        auto points = parse_position_list(geometry["points"]);
        if (points.empty()) {
            throw GeometryError("multipoint has no points");
        }
        raw.kind = GeometryKind::POINT;
        raw.parts.push_back({points.front()});
        return raw;
    }

    const char* key = nullptr;
    if (geometry.contains("rings")) {
        raw.kind = GeometryKind::POLYGON;
        key = "rings";
    } else if (geometry.contains("paths")) {
        raw.kind = GeometryKind::POLYLINE;
        key = "paths";
    } else {
        throw GeometryError("unrecognized geometry with keys " + geometry.dump().substr(0, 80));
    }

    const auto& parts = geometry[key];
    if (!parts.is_array() || parts.empty()) {
        throw GeometryError(std::string(key) + " missing or empty");
    }
    for (const auto& part : parts) {
        raw.parts.push_back(parse_position_list(part));
    }
    return raw;
}

RawGeometry GeometryParser::parse_geojson(const nlohmann::json& geometry) {
    const auto& type_value = geometry["type"];
    if (!type_value.is_string()) {
        throw GeometryError("GeoJSON type is not a string");
    }
    const std::string type = type_value.get<std::string>();
    const auto& coords = geometry["coordinates"];

    RawGeometry raw;

    if (type == "Point") {
        raw.kind = GeometryKind::POINT;
        raw.parts.push_back({parse_position(coords)});
    } else if (type == "MultiPoint") {
        auto points = parse_position_list(coords);
        if (points.empty()) {
            throw GeometryError("MultiPoint has no points");
        }
        raw.kind = GeometryKind::POINT;
        raw.parts.push_back({points.front()});
    } else if (type == "LineString") {
        raw.kind = GeometryKind::POLYLINE;
        raw.parts.push_back(parse_position_list(coords));
    } else if (type == "MultiLineString" || type == "Polygon") {
        raw.kind = (type == "Polygon") ? GeometryKind::POLYGON : GeometryKind::POLYLINE;
        if (!coords.is_array()) {
            throw GeometryError(type + " coordinates are not an array");
        }
        for (const auto& part : coords) {
            raw.parts.push_back(parse_position_list(part));
        }
    } else if (type == "MultiPolygon") {
        raw.kind = GeometryKind::POLYGON;
        if (!coords.is_array()) {
            throw GeometryError("MultiPolygon coordinates are not an array");
        }
        for (const auto& polygon : coords) {
            if (!polygon.is_array()) {
                throw GeometryError("MultiPolygon member is not an array");
            }
            if (polygon.empty()) {
                continue;
            }
            raw.member_starts.push_back(raw.parts.size());
            for (const auto& ring : polygon) {
                raw.parts.push_back(parse_position_list(ring));
            }
        }
    } else {
        throw GeometryError("unsupported GeoJSON type " + type);
    }

    if (raw.parts.empty()) {
        throw GeometryError(type + " has no coordinates");
    }
    return raw;
}

} // namespace geoenrich
