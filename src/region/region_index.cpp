#include "region/region_index.hpp"
#include "util/debug.hpp"
#include "util/error.hpp"

#include <algorithm>
#include <iterator>

#include <boost/geometry/index/rtree.hpp>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::REGION;

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

std::shared_ptr<RegionIndex> RegionIndex::build(
    const std::vector<RegionInput> &inputs)
{
  auto index = std::make_shared<RegionIndex>();
  for (const RegionInput &input : inputs)
  {
    index->add_region(input.label, input.geom);
  }
  if (index->empty())
  {
    throw GeometryError("No valid polygon among " +
                        std::to_string(inputs.size()) + " region geometries");
  }
  SPDLOG_INFO("Region index built with {} regions ({} rejected)",
              index->get_region_count(), index->get_rejected_count());
  return index;
}

bool RegionIndex::add_region(const std::string &label, const MultiPolygon &geom)
{
  MultiPolygon corrected = geom;
  // Drop parts without an exterior ring, they carry no area
  corrected.erase(std::remove_if(corrected.begin(), corrected.end(),
                                 [](const Polygon &poly)
                                 { return poly.outer().empty(); }),
                  corrected.end());
  if (corrected.empty())
  {
    SPDLOG_WARN("Region {} rejected: empty geometry", label);
    ++rejected;
    return false;
  }
  bg::correct(corrected);
  std::string message;
  if (!bg::is_valid(corrected, message))
  {
    SPDLOG_WARN("Region {} rejected: {}", label, message);
    ++rejected;
    return false;
  }
  RegionOrder order = regions.size();
  Box envelope = bg::return_envelope<Box>(corrected);
  regions.push_back({order, label, std::move(corrected), envelope});
  rtree.insert(std::make_pair(envelope, order));
  {
    std::lock_guard<std::mutex> lock(union_mutex);
    union_cache.reset();
  }
  SPDLOG_DEBUG("Region {} added with order {}", label, order);
  return true;
}

std::shared_ptr<const RegionIndex::UnionCache> RegionIndex::compute_union() const
{
  SPDLOG_DEBUG("Compute union of {} regions", regions.size());
  auto cache = std::make_shared<UnionCache>();
  try
  {
    MultiPolygon acc;
    for (const Region &region : regions)
    {
      MultiPolygon merged;
      bg::union_(acc, region.geom, merged);
      acc = std::move(merged);
    }
    cache->geom = std::move(acc);
  }
  catch (const bg::exception &e)
  {
    // Overlay failed on touching or nearly coincident rings. Membership in
    // the concatenated parts is the same point set as the union.
    SPDLOG_WARN("Union of regions failed ({}), using the concatenated parts",
                e.what());
    cache->geom.clear();
    for (const Region &region : regions)
    {
      cache->geom.insert(cache->geom.end(),
                         region.geom.begin(), region.geom.end());
    }
  }
  cache->envelope = bg::return_envelope<Box>(cache->geom);
  SPDLOG_DEBUG("Union has {} parts", cache->geom.size());
  return cache;
}

std::shared_ptr<const RegionIndex::UnionCache> RegionIndex::get_union() const
{
  std::lock_guard<std::mutex> lock(union_mutex);
  if (!union_cache)
  {
    union_cache = compute_union();
  }
  return union_cache;
}

bool RegionIndex::contains_point(const Point &p) const
{
  if (regions.empty() || !is_finite(p))
    return false;
  std::shared_ptr<const UnionCache> cache = get_union();
  if (!bg::covered_by(p, cache->envelope))
    return false;
  return bg::covered_by(p, cache->geom);
}

std::optional<std::string> RegionIndex::label_for_point(const Point &p) const
{
  if (regions.empty() || !is_finite(p))
    return std::nullopt;
  std::vector<Item> temp;
  rtree.query(bgi::intersects(p), std::back_inserter(temp));
  // Rtree returns items in no particular order, restore ingestion order
  std::sort(temp.begin(), temp.end(),
            [](const Item &a, const Item &b)
            { return a.second < b.second; });
  for (const Item &item : temp)
  {
    const Region &region = regions[item.second];
    if (bg::covered_by(p, region.geom))
    {
      return region.label;
    }
  }
  return std::nullopt;
}

int RegionIndex::get_region_count() const
{
  return regions.size();
}

int RegionIndex::get_rejected_count() const
{
  return rejected;
}

bool RegionIndex::empty() const
{
  return regions.empty();
}

const std::vector<Region> &RegionIndex::get_regions() const
{
  return regions;
}

std::vector<std::string> RegionIndex::get_labels() const
{
  std::vector<std::string> labels;
  for (const Region &region : regions)
  {
    if (std::find(labels.begin(), labels.end(), region.label) == labels.end())
    {
      labels.push_back(region.label);
    }
  }
  return labels;
}

Box RegionIndex::get_envelope() const
{
  if (regions.empty())
  {
    throw GeometryError("Envelope requested on an empty region index");
  }
  return get_union()->envelope;
}
