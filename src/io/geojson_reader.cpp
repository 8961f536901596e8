#include "io/geojson_reader.hpp"
#include "io/json_document.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <cmath>
#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::REGION;

namespace pt = boost::property_tree;

namespace
{
  const std::vector<std::string> GEOJSON_NUMERIC_KEYS = {"coordinates", "bbox"};

  // Keys may contain dots, disable the path separator
  pt::ptree::path_type literal_key(const std::string &key)
  {
    return pt::ptree::path_type(key, '\0');
  }
}

FeatureCollection LAEP::IO::read_geojson_string(const std::string &text)
{
  pt::ptree root = read_json_document(text, GEOJSON_NUMERIC_KEYS);
  FeatureCollection features;
  std::string type = root.get<std::string>("type", "");
  if (type == "Feature")
  {
    features.push_back({0, root});
    return features;
  }
  auto features_node = root.get_child_optional("features");
  if (!features_node)
  {
    throw std::runtime_error("GeoJSON document has no features array");
  }
  int id = 0;
  for (const auto &child : *features_node)
  {
    features.push_back({id, child.second});
    ++id;
  }
  SPDLOG_DEBUG("Read {} features from GeoJSON", features.size());
  return features;
}

FeatureCollection LAEP::IO::read_geojson_file(const std::string &filename)
{
  SPDLOG_INFO("Read GeoJSON file {}", filename);
  std::string text = UTIL::read_file(filename);
  try
  {
    return read_geojson_string(text);
  }
  catch (const pt::json_parser_error &e)
  {
    throw std::runtime_error("Invalid GeoJSON in " + filename + ": " + e.what());
  }
}

std::optional<Point> LAEP::IO::parse_position(const pt::ptree &position)
{
  if (position.size() < 2)
    return std::nullopt;
  double xy[2];
  int i = 0;
  for (const auto &component : position)
  {
    if (i == 2)
      break;
    // A nested array or object is not a number, neither is a quoted string
    if (!component.second.empty())
      return std::nullopt;
    auto value = component.second.get_value_optional<double>();
    if (!value || !std::isfinite(*value))
      return std::nullopt;
    xy[i] = *value;
    ++i;
  }
  return Point(xy[0], xy[1]);
}

bool LAEP::IO::parse_point_sequence(const pt::ptree &coordinates,
                                    std::vector<Point> *points)
{
  points->clear();
  if (coordinates.empty())
    return false;
  for (const auto &child : coordinates)
  {
    std::optional<Point> p = parse_position(child.second);
    if (!p)
      return false;
    points->push_back(*p);
  }
  return true;
}

bool LAEP::IO::parse_polygon(const pt::ptree &coordinates, Polygon *polygon)
{
  boost::geometry::clear(*polygon);
  if (coordinates.empty())
    return false;
  std::vector<Point> ring;
  bool outer = true;
  for (const auto &child : coordinates)
  {
    if (!parse_point_sequence(child.second, &ring))
      return false;
    if (outer)
    {
      polygon->outer().assign(ring.begin(), ring.end());
      outer = false;
    }
    else
    {
      polygon->inners().emplace_back(ring.begin(), ring.end());
    }
  }
  return true;
}

bool LAEP::IO::parse_polygonal_geometry(const pt::ptree &geometry,
                                        MultiPolygon *mpoly)
{
  mpoly->clear();
  std::string type = geometry.get<std::string>("type", "");
  auto coordinates = geometry.get_child_optional("coordinates");
  if (!coordinates)
    return false;
  if (type == "Polygon")
  {
    Polygon poly;
    if (!parse_polygon(*coordinates, &poly))
      return false;
    mpoly->push_back(poly);
    return true;
  }
  if (type == "MultiPolygon")
  {
    for (const auto &child : *coordinates)
    {
      Polygon poly;
      if (!parse_polygon(child.second, &poly))
        return false;
      mpoly->push_back(poly);
    }
    return !mpoly->empty();
  }
  return false;
}

std::optional<std::string> LAEP::IO::lookup_property(
    const Feature &feature, const std::vector<std::string> &keys)
{
  auto properties = feature.node.get_child_optional("properties");
  if (!properties)
    return std::nullopt;
  for (const std::string &key : keys)
  {
    auto value = properties->get_child_optional(literal_key(key));
    if (!value || !value->empty())
      continue;
    std::string text = value->data();
    if (!text.empty() && text != "null")
      return text;
  }
  return std::nullopt;
}

std::vector<RegionInput> LAEP::IO::features_to_regions(
    const FeatureCollection &features,
    const std::vector<std::string> &label_keys,
    int *skipped)
{
  std::vector<RegionInput> inputs;
  int skipped_count = 0;
  for (const Feature &feature : features)
  {
    auto geometry = feature.node.get_child_optional("geometry");
    MultiPolygon mpoly;
    if (!geometry || !parse_polygonal_geometry(*geometry, &mpoly))
    {
      SPDLOG_WARN("Feature {} skipped: no polygonal geometry", feature.id);
      ++skipped_count;
      continue;
    }
    std::optional<std::string> label = lookup_property(feature, label_keys);
    inputs.push_back({label ? *label : std::string("Unknown"), std::move(mpoly)});
  }
  if (skipped != nullptr)
  {
    *skipped = skipped_count;
  }
  return inputs;
}
