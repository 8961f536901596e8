#include "io/boundary_loader.hpp"
#include "util/debug.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

#include <stdexcept>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::REGION;
using namespace LAEP::IO;

namespace
{
  // One small neighborhood per borough, keeps the tool usable offline
  const std::string FALLBACK_GEOJSON = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature",
     "properties": {"ntacode": "MN17", "ntaname": "Midtown-Midtown South", "boro_name": "Manhattan"},
     "geometry": {"type": "Polygon", "coordinates": [[[-73.9985, 40.7636], [-73.9850, 40.7648], [-73.9733, 40.7563], [-73.9786, 40.7480], [-73.9918, 40.7471], [-73.9985, 40.7636]]]}},
    {"type": "Feature",
     "properties": {"ntacode": "BK09", "ntaname": "Williamsburg", "boro_name": "Brooklyn"},
     "geometry": {"type": "Polygon", "coordinates": [[[-73.9719, 40.7269], [-73.9490, 40.7269], [-73.9420, 40.7095], [-73.9645, 40.7095], [-73.9719, 40.7269]]]}},
    {"type": "Feature",
     "properties": {"ntacode": "QN01", "ntaname": "Astoria", "boro_name": "Queens"},
     "geometry": {"type": "Polygon", "coordinates": [[[-73.9437, 40.7893], [-73.9099, 40.7893], [-73.9099, 40.7687], [-73.9360, 40.7640], [-73.9437, 40.7893]]]}},
    {"type": "Feature",
     "properties": {"ntacode": "BX06", "ntaname": "Belmont", "boro_name": "Bronx"},
     "geometry": {"type": "Polygon", "coordinates": [[[-73.8922, 40.8620], [-73.8785, 40.8620], [-73.8785, 40.8503], [-73.8922, 40.8503], [-73.8922, 40.8620]]]}},
    {"type": "Feature",
     "properties": {"ntacode": "SI07", "ntaname": "New Springville", "boro_name": "Staten Island"},
     "geometry": {"type": "Polygon", "coordinates": [[[-74.1681, 40.5887], [-74.1378, 40.5887], [-74.1378, 40.5718], [-74.1681, 40.5718], [-74.1681, 40.5887]]]}}
  ]
})";
}

std::string LAEP::IO::boundary_status_to_string(BoundaryStatus status)
{
  switch (status)
  {
  case BoundaryStatus::LOADED:
    return "loaded";
  case BoundaryStatus::FALLBACK:
    return "fallback";
  }
  return "unknown";
}

BoundaryLoader::BoundaryLoader(const std::vector<std::string> &label_keys)
    : label_keys_(label_keys)
{
}

const std::string &BoundaryLoader::fallback_geojson()
{
  return FALLBACK_GEOJSON;
}

BoundaryLoadResult BoundaryLoader::fallback() const
{
  BoundaryLoadResult result;
  result.status = BoundaryStatus::FALLBACK;
  result.source = "builtin";
  result.features = read_geojson_string(FALLBACK_GEOJSON);
  // The built-in features carry boro_name whatever keys were configured
  std::vector<std::string> keys = label_keys_;
  keys.push_back("boro_name");
  result.index = RegionIndex::build(features_to_regions(result.features, keys));
  SPDLOG_INFO("Boundaries: fallback with {} regions",
              result.index->get_region_count());
  return result;
}

BoundaryLoadResult BoundaryLoader::load_string(const std::string &text,
                                               const std::string &source) const
{
  try
  {
    BoundaryLoadResult result;
    result.status = BoundaryStatus::LOADED;
    result.source = source;
    result.features = read_geojson_string(text);
    int skipped = 0;
    std::vector<RegionInput> inputs =
        features_to_regions(result.features, label_keys_, &skipped);
    result.index = RegionIndex::build(inputs);
    SPDLOG_INFO("Boundaries: loaded {} regions from {} ({} features skipped)",
                result.index->get_region_count(), source, skipped);
    return result;
  }
  catch (const GeometryError &e)
  {
    SPDLOG_WARN("Boundaries from {} unusable: {}", source, e.what());
  }
  catch (const std::runtime_error &e)
  {
    // json_parser_error and a missing features array both land here
    SPDLOG_WARN("Boundaries from {} could not be parsed: {}", source, e.what());
  }
  return fallback();
}

BoundaryLoadResult BoundaryLoader::load_file(const std::string &filename) const
{
  if (!UTIL::file_exists(filename))
  {
    SPDLOG_WARN("Boundary file {} not found", filename);
    return fallback();
  }
  std::string text;
  try
  {
    text = UTIL::read_file(filename);
  }
  catch (const std::runtime_error &e)
  {
    SPDLOG_WARN("Boundary file {} not readable: {}", filename, e.what());
    return fallback();
  }
  return load_string(text, filename);
}

BoundaryLoadResult BoundaryLoader::load_remote(const FetchFunction &fetch) const
{
  std::string text;
  try
  {
    text = fetch();
  }
  catch (const std::exception &e)
  {
    SPDLOG_WARN("Boundary fetch failed: {}", e.what());
    return fallback();
  }
  return load_string(text, "remote");
}
