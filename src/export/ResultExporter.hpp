/**
 * @file ResultExporter.hpp
 * @brief Vector export of annotated features through GDAL/OGR
 *
 * Writes enrichment results as GeoJSON, GeoPackage or ESRI Shapefile for
 * inspection in desktop GIS applications like QGIS.
 */

#pragma once

#include "geo_enrichment.hpp"
#include <map>
#include <string>
#include <vector>

class OGRGeometry;
class OGRLayer;

namespace geoenrich {

/**
 * @brief Exports result sets as an EPSG:4326 vector dataset
 *
 * Every feature carries identity, source_id, distance_mi, containing and
 * label attributes. GeoJSON and GeoPackage hold all geometry kinds in one
 * layer; Shapefile output is split into <base>_points, <base>_lines and
 * <base>_polygons since a shapefile holds a single geometry type.
 */
class ResultExporter {
public:
    enum class Format {
        GEOJSON,
        GEOPACKAGE,
        SHAPEFILE
    };

    struct Options {
        std::string layer_name;
        std::string label_field;   // canonical field used for "label"

        Options()
            : layer_name("enrichment"),
              label_field("name") {}
    };

    ResultExporter();
    explicit ResultExporter(const Options& options);

    /**
     * @brief Export all features of all result sets
     * @param result_sets Result sets keyed by dataset id
     * @param filename Output path; the extension selects the format
     * @return true if export succeeded
     */
    bool export_results(const std::map<std::string, ResultSet>& result_sets,
                        const std::string& filename) const;

    /**
     * @brief Export a flat feature list
     */
    bool export_features(const std::vector<AnnotatedFeature>& features,
                         const std::string& filename) const;

    /**
     * @brief Format from the file extension (.geojson/.json, .gpkg, .shp)
     * @throws ConfigurationError for any other extension
     */
    static Format format_for(const std::string& filename);

    static std::string driver_name(Format format);

private:
    Options options_;

    bool write_dataset(const std::vector<const AnnotatedFeature*>& features,
                       const std::string& filename, Format format) const;

    static OGRGeometry* geometry_to_ogr(const Geometry& geometry);
    static bool create_attribute_fields(OGRLayer* layer);
};

} // namespace geoenrich
