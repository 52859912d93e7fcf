/**
 * @file ResultExporter.cpp
 * @brief Implementation of GDAL/OGR vector export
 */

#include "ResultExporter.hpp"
#include "../core/EnrichmentErrors.hpp"
#include "../core/Logger.hpp"
#include "../enrichment/ResultPresenter.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <memory>

namespace geoenrich {

namespace {

struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};
using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

struct OGRFeatureDeleter {
    void operator()(OGRFeature* feature) const {
        OGRFeature::DestroyFeature(feature);
    }
};
using OGRFeaturePtr = std::unique_ptr<OGRFeature, OGRFeatureDeleter>;

struct OGRGeometryDeleter {
    void operator()(OGRGeometry* geometry) const {
        OGRGeometryFactory::destroyGeometry(geometry);
    }
};
using OGRGeometryPtr = std::unique_ptr<OGRGeometry, OGRGeometryDeleter>;

// Field order; values are set by index since shapefiles truncate names to 10 characters
enum FieldIndex {
    FIELD_IDENTITY = 0,
    FIELD_SOURCE_ID,
    FIELD_DISTANCE,
    FIELD_CONTAINING,
    FIELD_LABEL
};

OGRLineString* path_to_ogr(const std::vector<Coordinate>& path) {
    auto* line = new OGRLineString();
    for (const auto& c : path) {
        line->addPoint(c.lon, c.lat);
    }
    return line;
}

OGRLinearRing* ring_to_ogr(const Ring& ring) {
    auto* linear = new OGRLinearRing();
    for (const auto& c : ring) {
        linear->addPoint(c.lon, c.lat);
    }
    linear->closeRings();
    return linear;
}

OGRPolygon* polygon_to_ogr(const std::vector<Ring>& rings) {
    auto* polygon = new OGRPolygon();
    for (const auto& ring : rings) {
        polygon->addRingDirectly(ring_to_ogr(ring));
    }
    return polygon;
}

std::string lowercase_extension(const std::string& filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

ResultExporter::ResultExporter()
    : options_() {
    GDALAllRegister();
}

ResultExporter::ResultExporter(const Options& options)
    : options_(options) {
    GDALAllRegister();
}

ResultExporter::Format ResultExporter::format_for(const std::string& filename) {
    const std::string ext = lowercase_extension(filename);
    if (ext == ".geojson" || ext == ".json") return Format::GEOJSON;
    if (ext == ".gpkg") return Format::GEOPACKAGE;
    if (ext == ".shp") return Format::SHAPEFILE;
    throw ConfigurationError("unsupported export format '" + ext + "' (use .geojson, .gpkg or .shp)");
}

std::string ResultExporter::driver_name(Format format) {
    switch (format) {
        case Format::GEOJSON:    return "GeoJSON";
        case Format::GEOPACKAGE: return "GPKG";
        case Format::SHAPEFILE:  return "ESRI Shapefile";
    }
    return "GeoJSON";
}

bool ResultExporter::export_results(const std::map<std::string, ResultSet>& result_sets,
                                    const std::string& filename) const {
    std::vector<AnnotatedFeature> features;
    for (const auto& [id, result] : result_sets) {
        features.insert(features.end(), result.containing.begin(), result.containing.end());
        features.insert(features.end(), result.nearby.begin(), result.nearby.end());
    }
    return export_features(features, filename);
}

bool ResultExporter::export_features(const std::vector<AnnotatedFeature>& features,
                                     const std::string& filename) const {
    Logger logger("ResultExporter");
    const Format format = format_for(filename);

    if (format != Format::SHAPEFILE) {
        std::vector<const AnnotatedFeature*> all;
        for (const auto& feature : features) {
            all.push_back(&feature);
        }
        return write_dataset(all, filename, format);
    }

    std::map<GeometryKind, std::vector<const AnnotatedFeature*>> by_kind;
    for (const auto& feature : features) {
        by_kind[geometry_kind(feature.geometry)].push_back(&feature);
    }

    const std::string base = filename.substr(0, filename.size() - 4);
    bool ok = true;
    for (const auto& [kind, group] : by_kind) {
        const char* suffix = kind == GeometryKind::POINT ? "_points"
                           : kind == GeometryKind::POLYLINE ? "_lines" : "_polygons";
        ok = write_dataset(group, base + suffix + ".shp", format) && ok;
    }
    if (by_kind.empty()) {
        logger.warning("No features to export");
    }
    return ok;
}

bool ResultExporter::write_dataset(const std::vector<const AnnotatedFeature*>& features,
                                   const std::string& filename, Format format) const {
    Logger logger("ResultExporter");

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name(format).c_str());
    if (!driver) {
        logger.error(driver_name(format) + " driver not available");
        return false;
    }

    // GeoJSON and GPKG refuse to overwrite
    if (std::filesystem::exists(filename)) {
        driver->Delete(filename.c_str());
    }

    GDALDatasetPtr dataset(driver->Create(filename.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        logger.error("Failed to create " + filename);
        return false;
    }

    OGRSpatialReference srs;
    srs.SetWellKnownGeogCS("WGS84");
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRwkbGeometryType geom_type = wkbUnknown;
    if (format == Format::SHAPEFILE && !features.empty()) {
        switch (geometry_kind(features.front()->geometry)) {
            case GeometryKind::POINT:    geom_type = wkbPoint; break;
            case GeometryKind::POLYLINE: geom_type = wkbMultiLineString; break;
            case GeometryKind::POLYGON:  geom_type = wkbPolygon; break;
        }
    }

    OGRLayer* layer = dataset->CreateLayer(options_.layer_name.c_str(), &srs, geom_type, nullptr);
    if (!layer) {
        logger.error("Failed to create layer");
        return false;
    }

    if (!create_attribute_fields(layer)) {
        logger.error("Failed to create attribute fields in " + filename);
        return false;
    }

    size_t written = 0;
    for (const AnnotatedFeature* annotated : features) {
        OGRGeometryPtr geom(geometry_to_ogr(annotated->geometry));
        if (!geom) {
            logger.warning("Skipping empty geometry");
            continue;
        }

        OGRFeaturePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        feature->SetGeometry(geom.get());

        if (annotated->identity) {
            feature->SetField(FIELD_IDENTITY, annotated->identity->c_str());
        }
        feature->SetField(FIELD_SOURCE_ID, annotated->source_id.c_str());
        feature->SetField(FIELD_DISTANCE, ResultPresenter::round_to(annotated->distance_miles, 2));
        feature->SetField(FIELD_CONTAINING, annotated->is_containing ? 1 : 0);
        feature->SetField(FIELD_LABEL,
                          ResultPresenter::feature_label(*annotated, options_.label_field).c_str());

        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            logger.warning("Failed to create feature");
            continue;
        }
        ++written;
    }

    logger.info("Exported " + std::to_string(written) + " features to " + filename);
    return true;
}

OGRGeometry* ResultExporter::geometry_to_ogr(const Geometry& geometry) {
    if (const auto* point = std::get_if<PointGeometry>(&geometry)) {
        return new OGRPoint(point->point.lon, point->point.lat);
    }

    if (const auto* line = std::get_if<PolylineGeometry>(&geometry)) {
        if (line->paths.empty()) {
            return nullptr;
        }
        auto* multi = new OGRMultiLineString();
        for (const auto& path : line->paths) {
            multi->addGeometryDirectly(path_to_ogr(path));
        }
        return multi;
    }

    const auto members = std::get<PolygonGeometry>(geometry).members();
    if (members.empty() || members.front().empty()) {
        return nullptr;
    }
    if (members.size() == 1) {
        return polygon_to_ogr(members.front());
    }
    auto* multi = new OGRMultiPolygon();
    for (const auto& member : members) {
        multi->addGeometryDirectly(polygon_to_ogr(member));
    }
    return multi;
}

bool ResultExporter::create_attribute_fields(OGRLayer* layer) {
    OGRFieldDefn identity_field("identity", OFTString);
    identity_field.SetWidth(64);

    OGRFieldDefn source_field("source_id", OFTString);
    source_field.SetWidth(64);

    OGRFieldDefn distance_field("distance_mi", OFTReal);
    distance_field.SetWidth(12);
    distance_field.SetPrecision(2);

    OGRFieldDefn containing_field("containing", OFTInteger);
    containing_field.SetWidth(1);

    OGRFieldDefn label_field("label", OFTString);
    label_field.SetWidth(254);

    // Order must match FieldIndex
    for (OGRFieldDefn* field : {&identity_field, &source_field, &distance_field,
                                &containing_field, &label_field}) {
        if (layer->CreateField(field) != OGRERR_NONE) {
            return false;
        }
    }
    return true;
}

} // namespace geoenrich
