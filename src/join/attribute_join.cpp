#include "join/attribute_join.hpp"
#include "io/geojson_reader.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <algorithm>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::REGION;
using namespace LAEP::JOIN;

namespace bg = boost::geometry;
namespace pt = boost::property_tree;

std::string LAEP::JOIN::join_status_to_string(JoinStatus status)
{
  switch (status)
  {
  case JoinStatus::SPATIAL:
    return "spatial";
  case JoinStatus::PROPERTY:
    return "property";
  case JoinStatus::NOT_CONTAINED:
    return "not_contained";
  case JoinStatus::UNRESOLVABLE:
    return "unresolvable";
  }
  return "unknown";
}

void JoinConfig::print() const
{
  SPDLOG_INFO("JoinConfig");
  SPDLOG_INFO("Property keys {} verbose {}", property_keys, verbose);
}

JoinConfig JoinConfig::load_from_ptree(const pt::ptree &data)
{
  JoinConfig config;
  auto keys = data.get_optional<std::string>("config.join.property_keys");
  if (keys)
  {
    config.property_keys = UTIL::split_string(*keys);
  }
  auto verbose = data.get_optional<std::string>("config.join.verbose");
  if (verbose)
  {
    config.verbose = UTIL::string2bool(*verbose);
  }
  return config;
}

AttributeJoin::AttributeJoin(const JoinConfig &config) : config_(config)
{
}

std::optional<Point> AttributeJoin::representative_point(const Feature &feature)
{
  auto geometry = feature.node.get_child_optional("geometry");
  if (!geometry)
    return std::nullopt;
  auto coordinates = geometry->get_child_optional("coordinates");
  if (!coordinates || coordinates->empty())
    return std::nullopt;
  std::string type = geometry->get<std::string>("type", "");
  Point centroid;
  try
  {
    if (type == "Polygon" || type == "MultiPolygon")
    {
      MultiPolygon mpoly;
      if (!IO::parse_polygonal_geometry(*geometry, &mpoly))
        return std::nullopt;
      bg::correct(mpoly);
      bg::centroid(mpoly, centroid);
    }
    else if (type == "LineString" || type == "MultiPoint")
    {
      std::vector<Point> points;
      if (!IO::parse_point_sequence(*coordinates, &points))
        return std::nullopt;
      if (type == "LineString" && points.size() >= 2)
      {
        BGLineString line(points.begin(), points.end());
        bg::centroid(line, centroid);
      }
      else
      {
        bg::model::multi_point<Point> mpoint(points.begin(), points.end());
        bg::centroid(mpoint, centroid);
      }
    }
    else if (type == "MultiLineString")
    {
      bg::model::multi_linestring<BGLineString> mline;
      for (const auto &child : *coordinates)
      {
        std::vector<Point> points;
        if (!IO::parse_point_sequence(child.second, &points))
          return std::nullopt;
        mline.emplace_back(points.begin(), points.end());
      }
      bg::centroid(mline, centroid);
    }
    else
    {
      // Point, or an untyped geometry holding a single position
      return IO::parse_position(*coordinates);
    }
  }
  catch (const bg::centroid_exception &)
  {
    return std::nullopt;
  }
  if (!is_finite(centroid))
    return std::nullopt;
  return centroid;
}

JoinResult AttributeJoin::resolve_by_property(const Feature &feature) const
{
  std::optional<std::string> label =
      IO::lookup_property(feature, config_.property_keys);
  if (!label)
  {
    if (config_.verbose)
    {
      SPDLOG_INFO("Feature {} has no region property", feature.id);
    }
    return {JoinStatus::UNRESOLVABLE, ""};
  }
  return {JoinStatus::PROPERTY, *label};
}

JoinResult AttributeJoin::resolve_region(const Feature &feature,
                                         const RegionIndex *region_index) const
{
  if (region_index == nullptr || region_index->empty())
  {
    return resolve_by_property(feature);
  }
  std::optional<Point> p = representative_point(feature);
  if (!p)
  {
    if (config_.verbose)
    {
      SPDLOG_INFO("Feature {} unresolvable: missing or malformed geometry",
                  feature.id);
    }
    return {JoinStatus::UNRESOLVABLE, ""};
  }
  std::optional<std::string> label = region_index->label_for_point(*p);
  if (!label)
  {
    if (config_.verbose)
    {
      SPDLOG_INFO("Feature {} at {} is in no region", feature.id, point2string(*p));
    }
    return {JoinStatus::NOT_CONTAINED, ""};
  }
  return {JoinStatus::SPATIAL, *label};
}

FeatureCollection AttributeJoin::filter_features_by_region(
    const FeatureCollection &features,
    const RegionIndex *region_index,
    const std::vector<std::string> &labels) const
{
  FeatureCollection result;
  int unresolved = 0;
  for (const Feature &feature : features)
  {
    JoinResult joined = resolve_region(feature, region_index);
    if (!joined.resolved())
    {
      ++unresolved;
      continue;
    }
    if (labels.empty() ||
        std::find(labels.begin(), labels.end(), joined.label) != labels.end())
    {
      result.push_back(feature);
    }
  }
  SPDLOG_DEBUG("Region filter kept {} of {} features ({} unresolved)",
               result.size(), features.size(), unresolved);
  return result;
}
