#include "routing/route_planner.hpp"
#include "util/debug.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <thread>

#include <omp.h>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::SAMPLE;
using namespace LAEP::ROUTING;

namespace pt = boost::property_tree;

bool PlannerConfig::validate() const
{
  bool valid = true;
  if (routes_per_region < 1)
  {
    SPDLOG_CRITICAL("Routes per region {} should be at least 1", routes_per_region);
    valid = false;
  }
  if (candidates_per_region < 0)
  {
    SPDLOG_CRITICAL("Candidates per region {} should not be negative",
                    candidates_per_region);
    valid = false;
  }
  if (num_threads < 1)
  {
    SPDLOG_CRITICAL("Thread count {} should be at least 1", num_threads);
    valid = false;
  }
  if (origin_delay.count() < 0)
  {
    SPDLOG_CRITICAL("Origin delay {} ms should not be negative", origin_delay.count());
    valid = false;
  }
  return valid;
}

void PlannerConfig::print() const
{
  SPDLOG_INFO("PlannerConfig");
  SPDLOG_INFO("Routes per region {} candidates per region {} threads {}",
              routes_per_region, candidates_per_region, num_threads);
  SPDLOG_INFO("Regions {} origin delay {} ms", regions, origin_delay.count());
}

PlannerConfig PlannerConfig::load_from_ptree(const pt::ptree &data)
{
  PlannerConfig config;
  config.routes_per_region = data.get("config.planner.routes_per_region",
                                      config.routes_per_region);
  config.candidates_per_region = data.get("config.planner.candidates_per_region",
                                          config.candidates_per_region);
  auto regions = data.get_optional<std::string>("config.planner.regions");
  if (regions)
  {
    config.regions = UTIL::split_string(*regions);
  }
  config.num_threads = data.get("config.planner.threads", config.num_threads);
  config.origin_delay = std::chrono::milliseconds(
      data.get("config.planner.delay_ms",
               static_cast<long>(config.origin_delay.count())));
  return config;
}

RoutePlanner::RoutePlanner(RoutingOracle &oracle, const Box &bbox)
    : search_(oracle, bbox)
{
}

std::vector<PlannedRoute> RoutePlanner::plan_region(
    const std::string &region, const SamplePoints &origins,
    const PlannerConfig &planner_config,
    const DurationSearchConfig &search_config,
    std::mt19937 &rng, const CancellationToken *cancel) const
{
  std::vector<const SamplePoint *> candidates;
  for (const SamplePoint &point : origins)
  {
    if (point.region == region)
    {
      candidates.push_back(&point);
    }
  }
  std::shuffle(candidates.begin(), candidates.end(), rng);
  if (planner_config.candidates_per_region > 0 &&
      static_cast<int>(candidates.size()) > planner_config.candidates_per_region)
  {
    candidates.resize(planner_config.candidates_per_region);
  }

  std::vector<PlannedRoute> routes;
  int searched = 0;
  for (const SamplePoint *candidate : candidates)
  {
    if (static_cast<int>(routes.size()) >= planner_config.routes_per_region)
      break;
    if (cancel != nullptr && cancel->is_cancelled())
      break;
    if (searched > 0 && planner_config.origin_delay.count() > 0)
    {
      std::this_thread::sleep_for(planner_config.origin_delay);
    }
    ++searched;
    std::optional<RouteResult> route =
        search_.search(candidate->point, search_config, rng, cancel);
    if (route)
    {
      routes.push_back({region, candidate->id, candidate->point, *route});
    }
  }
  SPDLOG_DEBUG("Region {}: {} routes from {} searches of {} candidates",
               region, routes.size(), searched, candidates.size());
  return routes;
}

std::vector<PlannedRoute> RoutePlanner::plan(const SamplePoints &origins,
                                             const PlannerConfig &planner_config,
                                             const DurationSearchConfig &search_config,
                                             unsigned int seed,
                                             const CancellationToken *cancel) const
{
  if (origins.empty())
  {
    throw DegenerateInput("Route planning needs at least one origin");
  }
  if (!planner_config.validate() || !search_config.validate())
  {
    throw DegenerateInput("Invalid route planner configuration");
  }
  // Searches run inside the parallel region, reject bad origins up front
  for (const SamplePoint &point : origins)
  {
    if (!is_finite(point.point))
    {
      throw DegenerateInput("Origin " + std::to_string(point.id) +
                            " is not a finite point");
    }
  }
  std::vector<std::string> regions = planner_config.regions;
  if (regions.empty())
  {
    for (const SamplePoint &point : origins)
    {
      if (std::find(regions.begin(), regions.end(), point.region) == regions.end())
      {
        regions.push_back(point.region);
      }
    }
  }
  int num_regions = regions.size();
  SPDLOG_INFO("Plan {} routes per region over {} regions with {} threads",
              planner_config.routes_per_region, num_regions,
              planner_config.num_threads);

  std::vector<std::vector<PlannedRoute>> region_routes(num_regions);
#pragma omp parallel for num_threads(planner_config.num_threads) schedule(dynamic)
  for (int i = 0; i < num_regions; ++i)
  {
    std::seed_seq seq{seed, static_cast<unsigned int>(i)};
    std::mt19937 rng(seq);
    SPDLOG_TRACE("Region {} on thread {}", regions[i], omp_get_thread_num());
    region_routes[i] = plan_region(regions[i], origins, planner_config,
                                   search_config, rng, cancel);
  }

  std::vector<PlannedRoute> routes;
  for (auto &group : region_routes)
  {
    routes.insert(routes.end(), group.begin(), group.end());
  }
  SPDLOG_INFO("Planned {} routes (target {} per region)", routes.size(),
              planner_config.routes_per_region);
  return routes;
}
