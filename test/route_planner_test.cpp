#include "catch2/catch.hpp"

#include "util/debug.hpp"
#include "util/error.hpp"
#include "routing/route_planner.hpp"
#include "routing/straight_line_oracle.hpp"

#include <algorithm>
#include <limits>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::SAMPLE;
using namespace LAEP::ROUTING;

namespace
{
  SamplePoint make_origin(int id, const std::string &region, double x, double y)
  {
    return {id, "Depot " + std::to_string(id), Point(x, y), region,
            100, 300, 200, SpeedCategory::FAST};
  }

  class FailingOracle : public RoutingOracle
  {
  public:
    OracleReply route(const Point &, const Point &, std::chrono::milliseconds) override
    {
      return OracleReply::failure(RouteErrorCode::TRANSPORT_STATUS);
    }
  };
}

TEST_CASE("route planner is tested", "[planner]")
{
  spdlog::set_level(spdlog::level::warn);
  SamplePoints origins = {make_origin(1, "A", 2, 2), make_origin(2, "B", 8, 8),
                          make_origin(3, "A", 3, 2), make_origin(4, "A", 2, 3),
                          make_origin(5, "B", 7, 8)};
  StraightLineOracle oracle(6000);
  Box bbox = make_box(0, 0, 10, 10);
  RoutePlanner planner(oracle, bbox);
  PlannerConfig planner_config;
  planner_config.routes_per_region = 2;
  DurationSearchConfig search_config;

  SECTION("grouping_test")
  {
    std::vector<PlannedRoute> routes = planner.plan(origins, planner_config,
                                                    search_config, 42);
    REQUIRE(routes.size() == 4);
    REQUIRE(routes[0].region == "A");
    REQUIRE(routes[1].region == "A");
    REQUIRE(routes[2].region == "B");
    REQUIRE(routes[3].region == "B");
    REQUIRE(routes[0].origin_id != routes[1].origin_id);
    for (const PlannedRoute &r : routes)
    {
      auto it = std::find_if(origins.begin(), origins.end(),
                             [&](const SamplePoint &p) { return p.id == r.origin_id; });
      REQUIRE(it != origins.end());
      const SamplePoint &o = *it;
      REQUIRE(o.region == r.region);
      REQUIRE(r.origin.get<0>() == o.point.get<0>());
      REQUIRE(r.route.geometry.get_num_points() == 2);
      REQUIRE(r.route.geometry.get_x(0) == Approx(o.point.get<0>()));
      REQUIRE(r.route.attempts >= 1);
      REQUIRE(r.route.attempts <= search_config.max_attempts);
    }
  }
  SECTION("determinism_test")
  {
    std::vector<PlannedRoute> a = planner.plan(origins, planner_config, search_config, 7);
    planner_config.num_threads = 2;
    std::vector<PlannedRoute> b = planner.plan(origins, planner_config, search_config, 7);
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
    {
      REQUIRE(a[i].origin_id == b[i].origin_id);
      REQUIRE(a[i].route.duration_s == b[i].route.duration_s);
      REQUIRE(a[i].route.attempts == b[i].route.attempts);
    }
  }
  SECTION("region_selection_test")
  {
    planner_config.regions = {"B", "C"};
    std::vector<PlannedRoute> routes = planner.plan(origins, planner_config,
                                                    search_config, 1);
    REQUIRE(routes.size() == 2);
    REQUIRE(routes[0].region == "B");
    REQUIRE(routes[1].region == "B");
  }
  SECTION("candidate_limit_test")
  {
    planner_config.routes_per_region = 3;
    planner_config.candidates_per_region = 1;
    std::vector<PlannedRoute> routes = planner.plan(origins, planner_config,
                                                    search_config, 1);
    REQUIRE(routes.size() == 2);
  }
  SECTION("no_route_test")
  {
    FailingOracle failing;
    RoutePlanner failing_planner(failing, bbox);
    REQUIRE(failing_planner.plan(origins, planner_config, search_config, 1).empty());
  }
  SECTION("cancelled_test")
  {
    CancellationToken token;
    token.cancel();
    REQUIRE(planner.plan(origins, planner_config, search_config, 1, &token).empty());
  }
  SECTION("degenerate_input_test")
  {
    REQUIRE_THROWS_AS(planner.plan({}, planner_config, search_config, 1), DegenerateInput);
    SamplePoints bad = origins;
    bad.push_back(make_origin(6, "C", std::numeric_limits<double>::quiet_NaN(), 1));
    REQUIRE_THROWS_AS(planner.plan(bad, planner_config, search_config, 1), DegenerateInput);
    planner_config.routes_per_region = 0;
    REQUIRE_THROWS_AS(planner.plan(origins, planner_config, search_config, 1), DegenerateInput);
  }
}
