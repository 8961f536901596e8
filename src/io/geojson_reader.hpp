/**
 * LAEP core.
 *
 * GeoJSON reading functions. Documents are parsed into boost property
 * trees, where arrays are children with empty keys and every scalar is
 * kept as text. Quoted strings inside coordinates keep their quotes.
 */

#ifndef LAEP_IO_GEOJSON_READER_HPP_
#define LAEP_IO_GEOJSON_READER_HPP_

#include "core/feature.hpp"
#include "core/geometry.hpp"
#include "region/type.hpp"

#include <optional>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  /**
   * Input and output of features, boundaries and results
   */
  namespace IO
  {

    /**
     * Property keys holding the region label, first present key wins
     */
    const std::vector<std::string> DEFAULT_LABEL_KEYS = {
        "boro_name", "BoroName", "borough"};

    /**
     * Parse a GeoJSON FeatureCollection (or a single Feature) from text
     * @param text GeoJSON document
     * @return features in document order
     * @throw boost::property_tree::json_parser_error on invalid JSON
     * @throw std::runtime_error if the document has no features
     */
    CORE::FeatureCollection read_geojson_string(const std::string &text);

    /**
     * Parse a GeoJSON file
     * @throw std::runtime_error if the file cannot be read or parsed
     */
    CORE::FeatureCollection read_geojson_file(const std::string &filename);

    /**
     * Parse a GeoJSON position. At least 2 numeric components are
     * required, components beyond the second are ignored. Quoted numbers
     * such as "1.0" are not numeric.
     * @return the point or nullopt when malformed
     */
    std::optional<CORE::Point> parse_position(
        const boost::property_tree::ptree &position);

    /**
     * Parse an array of positions (LineString or MultiPoint coordinates,
     * or a ring)
     * @return false if the array is empty or any position is malformed
     */
    bool parse_point_sequence(const boost::property_tree::ptree &coordinates,
                              std::vector<CORE::Point> *points);

    /**
     * Parse Polygon coordinates: the first ring is the exterior, the
     * following rings are holes
     */
    bool parse_polygon(const boost::property_tree::ptree &coordinates,
                       CORE::Polygon *polygon);

    /**
     * Parse a Polygon or MultiPolygon geometry object into a multipolygon
     * @return false for other geometry types or malformed coordinates
     */
    bool parse_polygonal_geometry(const boost::property_tree::ptree &geometry,
                                  CORE::MultiPolygon *mpoly);

    /**
     * Get the first present, non empty property among keys
     */
    std::optional<std::string> lookup_property(
        const CORE::Feature &feature, const std::vector<std::string> &keys);

    /**
     * Convert polygonal features into region inputs. Features without a
     * polygonal geometry are skipped with a warning; features without a
     * label property are labeled "Unknown".
     *
     * @param features input features
     * @param label_keys property keys holding the region label
     * @param skipped if not null, set to the number of skipped features
     */
    std::vector<REGION::RegionInput> features_to_regions(
        const CORE::FeatureCollection &features,
        const std::vector<std::string> &label_keys,
        int *skipped = nullptr);

  } // IO
} // LAEP

#endif // LAEP_IO_GEOJSON_READER_HPP_
