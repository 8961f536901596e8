#include "routing/duration_search.hpp"
#include "util/debug.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include <boost/math/constants/constants.hpp>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::ROUTING;

namespace pt = boost::property_tree;

namespace
{
  const double SHORT_TARGET_LIMIT_S = 45 * 60;
  const double SHORT_TARGET_BASE_RADIUS = 0.05;
  const double LONG_TARGET_BASE_RADIUS = 0.18;
}

DurationSearchConfig::DurationSearchConfig(double target_duration_s_arg,
                                           int max_attempts_arg,
                                           double tolerance_fraction_arg,
                                           double growth_factor_arg)
    : target_duration_s(target_duration_s_arg), max_attempts(max_attempts_arg),
      tolerance_fraction(tolerance_fraction_arg), growth_factor(growth_factor_arg)
{
}

double DurationSearchConfig::default_base_radius(double target_duration_s)
{
  return target_duration_s <= SHORT_TARGET_LIMIT_S ? SHORT_TARGET_BASE_RADIUS
                                                   : LONG_TARGET_BASE_RADIUS;
}

double DurationSearchConfig::get_base_radius() const
{
  return base_radius ? *base_radius : default_base_radius(target_duration_s);
}

bool DurationSearchConfig::validate() const
{
  bool valid = true;
  if (!(target_duration_s > 0))
  {
    SPDLOG_CRITICAL("Target duration {} should be positive", target_duration_s);
    valid = false;
  }
  if (max_attempts < 1)
  {
    SPDLOG_CRITICAL("Max attempts {} should be at least 1", max_attempts);
    valid = false;
  }
  if (!(tolerance_fraction > 0))
  {
    SPDLOG_CRITICAL("Tolerance {} should be positive", tolerance_fraction);
    valid = false;
  }
  if (!(growth_factor > 1))
  {
    SPDLOG_CRITICAL("Growth factor {} should be greater than 1", growth_factor);
    valid = false;
  }
  if (!(get_base_radius() > 0) || !(attempt_scale > 0))
  {
    SPDLOG_CRITICAL("Base radius {} and attempt scale {} should be positive",
                    get_base_radius(), attempt_scale);
    valid = false;
  }
  if (oracle_timeout.count() <= 0 || politeness_delay.count() < 0)
  {
    SPDLOG_CRITICAL("Oracle timeout {} ms should be positive and delay {} ms non-negative",
                    oracle_timeout.count(), politeness_delay.count());
    valid = false;
  }
  return valid;
}

void DurationSearchConfig::print() const
{
  SPDLOG_INFO("DurationSearchConfig");
  SPDLOG_INFO("Target {} s max attempts {} tolerance {}",
              target_duration_s, max_attempts, tolerance_fraction);
  SPDLOG_INFO("Base radius {} attempt scale {} growth {}",
              get_base_radius(), attempt_scale, growth_factor);
  SPDLOG_INFO("Oracle timeout {} ms politeness delay {} ms strict {}",
              oracle_timeout.count(), politeness_delay.count(), strict_tolerance);
}

DurationSearchConfig DurationSearchConfig::load_from_ptree(const pt::ptree &data)
{
  DurationSearchConfig config;
  config.target_duration_s = data.get("config.search.target_duration",
                                      config.target_duration_s);
  config.max_attempts = data.get("config.search.max_attempts", config.max_attempts);
  config.tolerance_fraction = data.get("config.search.tolerance",
                                       config.tolerance_fraction);
  config.growth_factor = data.get("config.search.growth_factor", config.growth_factor);
  auto radius = data.get_optional<double>("config.search.base_radius");
  if (radius)
  {
    config.base_radius = *radius;
  }
  config.attempt_scale = data.get("config.search.attempt_scale", config.attempt_scale);
  config.oracle_timeout = std::chrono::milliseconds(
      data.get("config.search.timeout_ms",
               static_cast<long>(config.oracle_timeout.count())));
  config.politeness_delay = std::chrono::milliseconds(
      data.get("config.search.delay_ms",
               static_cast<long>(config.politeness_delay.count())));
  auto strict = data.get_optional<std::string>("config.search.strict");
  if (strict)
  {
    config.strict_tolerance = UTIL::string2bool(*strict);
  }
  return config;
}

TargetDurationSearch::TargetDurationSearch(RoutingOracle &oracle, const Box &bbox)
    : oracle_(oracle), bbox_(bbox)
{
  if (is_degenerate(bbox_))
  {
    throw DegenerateInput("Search box has zero area");
  }
}

const Box &TargetDurationSearch::get_bbox() const
{
  return bbox_;
}

Point TargetDurationSearch::project_destination(const Point &origin,
                                                double radius,
                                                double angle) const
{
  namespace bg = boost::geometry;
  double x = bg::get<0>(origin) + std::cos(angle) * radius;
  double y = bg::get<1>(origin) + std::sin(angle) * radius;
  return Point(
      std::clamp(x, bg::get<bg::min_corner, 0>(bbox_), bg::get<bg::max_corner, 0>(bbox_)),
      std::clamp(y, bg::get<bg::min_corner, 1>(bbox_), bg::get<bg::max_corner, 1>(bbox_)));
}

std::optional<RouteResult> TargetDurationSearch::search(
    const Point &origin, const DurationSearchConfig &config, std::mt19937 &rng,
    const CancellationToken *cancel, SearchStats *stats) const
{
  if (!is_finite(origin))
  {
    throw DegenerateInput("Search origin is not a finite point");
  }
  if (!config.validate())
  {
    throw DegenerateInput("Invalid search configuration");
  }
  SearchStats local_stats;
  SearchStats &st = stats != nullptr ? *stats : local_stats;
  st = SearchStats{};

  const double target = config.target_duration_s;
  const double tolerance = target * config.tolerance_fraction;
  double base_radius = config.get_base_radius();
  std::uniform_real_distribution<double> bearing(
      0, boost::math::constants::two_pi<double>());
  std::optional<RouteResult> best;
  SPDLOG_DEBUG("Search from {} target {} s", point2string(origin), target);

  for (int k = 1; k <= config.max_attempts; ++k)
  {
    if (cancel != nullptr && cancel->is_cancelled())
    {
      SPDLOG_DEBUG("Search cancelled before attempt {}", k);
      st.cancelled = true;
      break;
    }
    if (k > 1 && config.politeness_delay.count() > 0)
    {
      std::this_thread::sleep_for(config.politeness_delay);
    }
    ++st.attempts;
    double angle = bearing(rng);
    double radius = base_radius * k * config.attempt_scale;
    Point destination = project_destination(origin, radius, angle);
    OracleReply reply = oracle_.route(origin, destination, config.oracle_timeout);
    if (!reply.ok())
    {
      SPDLOG_DEBUG("Attempt {} skipped: oracle {}", k,
                   route_error_to_string(reply.error_code));
      ++st.oracle_failures;
      continue;
    }
    RouteResult &result = reply.route;
    result.attempts = k;
    double miss = std::abs(result.duration_s - target);
    SPDLOG_TRACE("Attempt {} radius {} angle {} duration {} miss {}",
                 k, radius, angle, result.duration_s, miss);
    if (!best || miss < std::abs(best->duration_s - target))
    {
      best = result;
    }
    if (miss <= tolerance)
    {
      SPDLOG_DEBUG("Attempt {} within tolerance, duration {}", k, result.duration_s);
      break;
    }
    if (result.duration_s < target * 0.5)
    {
      base_radius *= config.growth_factor;
    }
  }

  if (!best)
  {
    SPDLOG_DEBUG("No route found in {} attempts", st.attempts);
    return std::nullopt;
  }
  st.within_tolerance = std::abs(best->duration_s - target) <= tolerance;
  if (config.strict_tolerance && !st.within_tolerance)
  {
    SPDLOG_DEBUG("Best duration {} misses target {}, no result",
                 best->duration_s, target);
    return std::nullopt;
  }
  SPDLOG_DEBUG("Best duration {} found at attempt {}", best->duration_s,
               best->attempts);
  return best;
}

std::optional<RouteResult> LAEP::ROUTING::search_route_near_duration(
    const Point &origin, double target_duration_s, RoutingOracle &oracle,
    int max_attempts, const Box &bbox, std::mt19937 &rng)
{
  DurationSearchConfig config(target_duration_s, max_attempts);
  TargetDurationSearch search(oracle, bbox);
  return search.search(origin, config, rng);
}
