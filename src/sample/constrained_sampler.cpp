#include "sample/constrained_sampler.hpp"
#include "util/debug.hpp"
#include "util/error.hpp"

#include <algorithm>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::REGION;
using namespace LAEP::SAMPLE;

SamplerConfig::SamplerConfig(int cols_arg, int rows_arg,
                             double jitter_fraction_arg)
    : cols(cols_arg), rows(rows_arg), jitter_fraction(jitter_fraction_arg)
{
}

bool SamplerConfig::validate() const
{
  bool valid = true;
  if (cols < 1 || rows < 1)
  {
    SPDLOG_CRITICAL("Lattice {}x{} should have at least one cell", cols, rows);
    valid = false;
  }
  if (jitter_fraction < 0 || jitter_fraction > 0.5)
  {
    SPDLOG_CRITICAL("Jitter fraction {} should be in [0, 0.5]", jitter_fraction);
    valid = false;
  }
  if (existing_min < 0 || existing_min > existing_max)
  {
    SPDLOG_CRITICAL("Existing capacity range [{}, {}] is invalid",
                    existing_min, existing_max);
    valid = false;
  }
  if (needed_max < existing_max)
  {
    SPDLOG_CRITICAL("Needed capacity bound {} is below existing bound {}",
                    needed_max, existing_max);
    valid = false;
  }
  return valid;
}

void SamplerConfig::print() const
{
  SPDLOG_INFO("SamplerConfig");
  SPDLOG_INFO("Lattice {}x{} jitter {}", cols, rows, jitter_fraction);
  SPDLOG_INFO("Existing capacity [{}, {}] needed up to {}",
              existing_min, existing_max, needed_max);
  SPDLOG_INFO("Name prefix '{}' unknown label '{}'", name_prefix, unknown_label);
}

SamplerConfig SamplerConfig::load_from_ptree(
    const boost::property_tree::ptree &data)
{
  SamplerConfig config;
  config.cols = data.get("config.sampler.cols", config.cols);
  config.rows = data.get("config.sampler.rows", config.rows);
  config.jitter_fraction = data.get("config.sampler.jitter", config.jitter_fraction);
  config.existing_min = data.get("config.sampler.existing_min", config.existing_min);
  config.existing_max = data.get("config.sampler.existing_max", config.existing_max);
  config.needed_max = data.get("config.sampler.needed_max", config.needed_max);
  config.name_prefix = data.get("config.sampler.name_prefix", config.name_prefix);
  config.unknown_label = data.get("config.sampler.unknown_label", config.unknown_label);
  return config;
}

ConstrainedSampler::ConstrainedSampler(const SamplerConfig &config)
    : config_(config)
{
}

const SamplerConfig &ConstrainedSampler::get_config() const
{
  return config_;
}

SamplePoints ConstrainedSampler::sample(const RegionIndex &region_index,
                                        const Box &bbox,
                                        std::mt19937 &rng) const
{
  return sample(region_index, bbox, config_.cols, config_.rows, rng);
}

SamplePoints ConstrainedSampler::sample(const RegionIndex &region_index,
                                        const Box &bbox, int cols, int rows,
                                        std::mt19937 &rng) const
{
  if (is_degenerate(bbox))
  {
    throw DegenerateInput("Sampling box has zero area");
  }
  if (cols < 1 || rows < 1)
  {
    throw DegenerateInput("Sampling lattice must have at least one cell");
  }
  if (!config_.validate())
  {
    throw DegenerateInput("Invalid sampler configuration");
  }
  double minx = boost::geometry::get<boost::geometry::min_corner, 0>(bbox);
  double miny = boost::geometry::get<boost::geometry::min_corner, 1>(bbox);
  double maxx = boost::geometry::get<boost::geometry::max_corner, 0>(bbox);
  double maxy = boost::geometry::get<boost::geometry::max_corner, 1>(bbox);
  double dx = (maxx - minx) / cols;
  double dy = (maxy - miny) / rows;
  double jx_max = dx * config_.jitter_fraction;
  double jy_max = dy * config_.jitter_fraction;
  std::uniform_real_distribution<double> jitter_x(-jx_max, jx_max);
  std::uniform_real_distribution<double> jitter_y(-jy_max, jy_max);
  std::uniform_int_distribution<int> existing_dist(config_.existing_min,
                                                   config_.existing_max);
  SPDLOG_DEBUG("Sample lattice {}x{} cell {} x {}", cols, rows, dx, dy);

  SamplePoints points;
  int unresolved = 0;
  for (int r = 0; r < rows; ++r)
  {
    for (int c = 0; c < cols; ++c)
    {
      double lon = minx + (c + 0.5) * dx + jitter_x(rng);
      double lat = miny + (r + 0.5) * dy + jitter_y(rng);
      Point p(lon, lat);
      if (!region_index.contains_point(p))
        continue;
      std::optional<std::string> label = region_index.label_for_point(p);
      if (!label)
      {
        SPDLOG_DEBUG("Point {} inside union but in no region", point2string(p));
        ++unresolved;
      }
      int existing = existing_dist(rng);
      std::uniform_int_distribution<int> needed_dist(
          existing, std::max(existing, config_.needed_max));
      int needed = needed_dist(rng);
      int gap = needed - existing;
      int id = static_cast<int>(points.size()) + 1;
      points.push_back({id,
                        config_.name_prefix + " " + std::to_string(id),
                        p,
                        label ? *label : config_.unknown_label,
                        existing,
                        needed,
                        gap,
                        speed_category_from_gap(gap)});
    }
  }
  SPDLOG_INFO("Sampled {} of {} lattice points ({} without region)",
              points.size(), cols * rows, unresolved);
  return points;
}

SamplePoints LAEP::SAMPLE::filter_samples(const SamplePoints &points,
                                          const std::vector<std::string> &labels,
                                          const std::vector<SpeedCategory> &speeds)
{
  SamplePoints result;
  for (const SamplePoint &point : points)
  {
    if (!labels.empty() &&
        std::find(labels.begin(), labels.end(), point.region) == labels.end())
      continue;
    if (!speeds.empty() &&
        std::find(speeds.begin(), speeds.end(), point.speed) == speeds.end())
      continue;
    result.push_back(point);
  }
  return result;
}
