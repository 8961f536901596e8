#include "catch2/catch.hpp"

#include "util/debug.hpp"
#include "util/error.hpp"
#include "routing/duration_search.hpp"
#include "routing/straight_line_oracle.hpp"

#include <cmath>
#include <functional>
#include <limits>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::ROUTING;

namespace
{
  // Oracle answering with a duration computed from the query, recording
  // every destination
  class StubOracle : public RoutingOracle
  {
  public:
    typedef std::function<std::optional<double>(const Point &, const Point &)>
        DurationFunction;
    explicit StubOracle(DurationFunction duration) : duration_(duration) {}

    OracleReply route(const Point &origin, const Point &destination,
                      std::chrono::milliseconds) override
    {
      destinations.push_back(destination);
      std::optional<double> d = duration_(origin, destination);
      if (!d)
        return OracleReply::failure(RouteErrorCode::NO_ROUTE);
      RouteResult result;
      result.geometry.add_point(origin);
      result.geometry.add_point(destination);
      result.duration_s = *d;
      result.distance_m = planar_distance(origin, destination) * 111000;
      result.status = "ok";
      return OracleReply::success(result);
    }

    int calls() const
    {
      return destinations.size();
    }

    std::vector<Point> destinations;

  private:
    DurationFunction duration_;
  };
}

TEST_CASE("target duration search is tested", "[search]")
{
  spdlog::set_level(spdlog::level::warn);
  const double target = 2700;
  Point origin(0, 0);
  Box bbox = make_box(-2, -2, 2, 2);
  std::mt19937 rng(17);
  DurationSearchConfig config(target, 7);

  SECTION("always_fail_test")
  {
    StubOracle oracle([](const Point &, const Point &)
                      { return std::optional<double>(); });
    TargetDurationSearch search(oracle, bbox);
    SearchStats stats;
    auto result = search.search(origin, config, rng, nullptr, &stats);
    REQUIRE_FALSE(result);
    REQUIRE(oracle.calls() == 7);
    REQUIRE(stats.attempts == 7);
    REQUIRE(stats.oracle_failures == 7);
  }
  SECTION("exact_target_test")
  {
    StubOracle oracle([&](const Point &, const Point &)
                      { return std::optional<double>(target); });
    TargetDurationSearch search(oracle, bbox);
    auto result = search.search(origin, config, rng);
    REQUIRE(result);
    REQUIRE(oracle.calls() == 1);
    REQUIRE(result->attempts == 1);
    REQUIRE(result->duration_s == Approx(target));
    REQUIRE(result->geometry.get_num_points() == 2);
  }
  SECTION("ring_convergence_test")
  {
    // Duration grows with distance, the target lies 0.3 degrees away
    StubOracle oracle([&](const Point &o, const Point &d)
                      { return std::optional<double>(target * planar_distance(o, d) / 0.3); });
    TargetDurationSearch search(oracle, bbox);
    SearchStats stats;
    auto result = search.search(origin, config, rng, nullptr, &stats);
    REQUIRE(result);
    REQUIRE(std::abs(result->duration_s - target) <= 0.1 * target);
    REQUIRE(stats.within_tolerance);
    // Radii 0.05, 0.14 then 0.294 after two growth steps
    REQUIRE(result->attempts == 3);
    REQUIRE(oracle.calls() == 3);
    REQUIRE(planar_distance(origin, oracle.destinations[0]) == Approx(0.05));
    REQUIRE(planar_distance(origin, oracle.destinations[1]) == Approx(0.14));
    REQUIRE(planar_distance(origin, oracle.destinations[2]) == Approx(0.294));
  }
  SECTION("no_growth_above_half_target_test")
  {
    StubOracle oracle([&](const Point &, const Point &)
                      { return std::optional<double>(0.6 * target); });
    TargetDurationSearch search(oracle, bbox);
    auto result = search.search(origin, config, rng);
    REQUIRE(result);
    REQUIRE(oracle.calls() == 7);
    for (int k = 1; k <= 7; ++k)
    {
      REQUIRE(planar_distance(origin, oracle.destinations[k - 1]) == Approx(0.05 * k));
    }
    REQUIRE(result->attempts == 1);
  }
  SECTION("strictly_closer_replaces_best_test")
  {
    // 1000 and 4400 miss the target by the same amount
    std::vector<double> durations = {1000, 4400, 2000};
    std::size_t next = 0;
    StubOracle oracle([&](const Point &, const Point &)
                      { return std::optional<double>(durations[next++ % durations.size()]); });
    TargetDurationSearch search(oracle, bbox);
    auto tie = search.search(origin, DurationSearchConfig(target, 2), rng);
    REQUIRE(tie);
    REQUIRE(tie->duration_s == Approx(1000));
    REQUIRE(tie->attempts == 1);
    next = 0;
    auto closer = search.search(origin, DurationSearchConfig(target, 3), rng);
    REQUIRE(closer);
    REQUIRE(closer->duration_s == Approx(2000));
    REQUIRE(closer->attempts == 3);
  }
  SECTION("cancellation_test")
  {
    StubOracle oracle([](const Point &, const Point &)
                      { return std::optional<double>(); });
    TargetDurationSearch search(oracle, bbox);
    CancellationToken token;
    token.cancel();
    SearchStats stats;
    auto result = search.search(origin, config, rng, &token, &stats);
    REQUIRE_FALSE(result);
    REQUIRE(oracle.calls() == 0);
    REQUIRE(stats.cancelled);
  }
  SECTION("cancel_during_search_test")
  {
    CancellationToken token;
    int calls = 0;
    StubOracle oracle([&](const Point &, const Point &)
                      {
                        if (++calls == 2)
                          token.cancel();
                        return std::optional<double>(100);
                      });
    TargetDurationSearch search(oracle, bbox);
    SearchStats stats;
    auto result = search.search(origin, config, rng, &token, &stats);
    REQUIRE(oracle.calls() == 2);
    REQUIRE(stats.cancelled);
    REQUIRE(result);
    REQUIRE(result->duration_s == Approx(100));
  }
  SECTION("destination_clamped_test")
  {
    StubOracle oracle([](const Point &, const Point &)
                      { return std::optional<double>(10); });
    Box unit = make_box(0, 0, 1, 1);
    TargetDurationSearch search(oracle, unit);
    DurationSearchConfig wide(target, 7);
    wide.base_radius = 5;
    search.search(Point(0, 0), wide, rng);
    REQUIRE(oracle.calls() == 7);
    for (const Point &d : oracle.destinations)
    {
      REQUIRE(d.get<0>() >= 0);
      REQUIRE(d.get<0>() <= 1);
      REQUIRE(d.get<1>() >= 0);
      REQUIRE(d.get<1>() <= 1);
    }
  }
  SECTION("degenerate_input_test")
  {
    StubOracle oracle([](const Point &, const Point &)
                      { return std::optional<double>(1); });
    REQUIRE_THROWS_AS(TargetDurationSearch(oracle, make_box(0, 0, 0, 1)), DegenerateInput);
    TargetDurationSearch search(oracle, bbox);
    double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(search.search(Point(nan, 0), config, rng), DegenerateInput);
    DurationSearchConfig no_attempts(target, 0);
    REQUIRE_THROWS_AS(search.search(origin, no_attempts, rng), DegenerateInput);
    DurationSearchConfig no_growth(target, 7, 0.1, 1.0);
    REQUIRE_THROWS_AS(search.search(origin, no_growth, rng), DegenerateInput);
    REQUIRE(oracle.calls() == 0);
  }
}

TEST_CASE("search scenario in a ten degree box is tested", "[search]")
{
  spdlog::set_level(spdlog::level::warn);
  // Duration is 100 seconds per degree, the 2700 s target is out of reach
  StubOracle oracle([](const Point &o, const Point &d)
                    { return std::optional<double>(100 * planar_distance(o, d)); });
  TargetDurationSearch search(oracle, make_box(0, 0, 10, 10));
  std::mt19937 rng(2024);
  DurationSearchConfig config(2700, 7);

  SECTION("strict_test")
  {
    config.strict_tolerance = true;
    SearchStats stats;
    auto result = search.search(Point(5, 5), config, rng, nullptr, &stats);
    REQUIRE(oracle.calls() <= 7);
    if (result)
      REQUIRE(std::abs(result->duration_s - 2700) <= 270);
    REQUIRE_FALSE(result);
    REQUIRE_FALSE(stats.within_tolerance);
  }
  SECTION("best_effort_test")
  {
    auto result = search.search(Point(5, 5), config, rng);
    REQUIRE(oracle.calls() == 7);
    REQUIRE(result);
    // Radius grows every attempt, the last one goes farthest
    REQUIRE(result->attempts == 7);
    for (const Point &d : oracle.destinations)
    {
      REQUIRE(result->duration_s >= 100 * planar_distance(Point(5, 5), d) - 1e-9);
    }
  }
}

TEST_CASE("duration search config is tested", "[search]")
{
  spdlog::set_level(spdlog::level::off);
  DurationSearchConfig config;
  REQUIRE(config.target_duration_s == 2700);
  REQUIRE(config.max_attempts == 7);
  REQUIRE(config.get_base_radius() == Approx(0.05));
  REQUIRE(DurationSearchConfig::default_base_radius(2701) == Approx(0.18));
  REQUIRE(DurationSearchConfig::default_base_radius(3600) == Approx(0.18));
  config.base_radius = 0.3;
  REQUIRE(config.get_base_radius() == Approx(0.3));
  REQUIRE(config.validate());
  config.tolerance_fraction = 0;
  REQUIRE_FALSE(config.validate());
}

TEST_CASE("search route near duration is tested", "[search]")
{
  spdlog::set_level(spdlog::level::warn);
  StraightLineOracle oracle(6000);
  std::mt19937 rng(9);
  Box bbox = make_box(-74.25559, 40.49612, -73.70001, 40.91553);
  auto result = search_route_near_duration(Point(-73.95, 40.7), 2700, oracle, 7,
                                           bbox, rng);
  REQUIRE(result);
  REQUIRE(result->status == "ok");
  REQUIRE(result->attempts >= 1);
  REQUIRE(result->attempts <= 7);
  REQUIRE(result->geometry.get_num_points() == 2);
}
