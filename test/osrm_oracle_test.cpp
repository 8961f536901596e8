#include "catch2/catch.hpp"

#include "util/debug.hpp"
#include "routing/osrm_oracle.hpp"
#include "routing/straight_line_oracle.hpp"

#include <boost/property_tree/ptree.hpp>

#include <limits>
#include <stdexcept>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::ROUTING;

namespace
{
  class StubTransport : public HttpTransport
  {
  public:
    StubTransport(int status, const std::string &body, bool fail = false)
        : status_(status), body_(body), fail_(fail) {}

    HttpResponse get(const std::string &url, std::chrono::milliseconds) override
    {
      urls.push_back(url);
      if (fail_)
        throw std::runtime_error("connection reset");
      return {status_, body_};
    }

    std::vector<std::string> urls;

  private:
    int status_;
    std::string body_;
    bool fail_;
  };

  const char *OK_BODY = R"({"code":"Ok","routes":[{"duration":2650.4,"distance":21033.9,
    "geometry":{"type":"LineString","coordinates":[[-73.95,40.7],[-73.9,40.72],[-73.85,40.75]]}}]})";
}

TEST_CASE("osrm routing oracle is tested", "[osrm]")
{
  spdlog::set_level(spdlog::level::warn);
  Point origin(-73.95, 40.7);
  Point destination(-73.85, 40.75);
  std::chrono::milliseconds timeout(12000);

  SECTION("build_url_test")
  {
    OsrmRoutingOracle oracle(std::make_shared<StubTransport>(200, OK_BODY));
    REQUIRE(oracle.build_url(origin, destination) ==
            "https://router.project-osrm.org/route/v1/driving/"
            "-73.950000,40.700000;-73.850000,40.750000"
            "?overview=full&annotations=false&geometries=geojson");
    OsrmConfig config;
    config.base_url = "http://localhost:5000/route/v1/driving";
    OsrmRoutingOracle local(std::make_shared<StubTransport>(200, OK_BODY), config);
    REQUIRE(local.build_url(origin, destination).rfind("http://localhost:5000/route/v1/driving/", 0) == 0);
  }
  SECTION("success_test")
  {
    auto transport = std::make_shared<StubTransport>(200, OK_BODY);
    OsrmRoutingOracle oracle(transport);
    OracleReply reply = oracle.route(origin, destination, timeout);
    REQUIRE(reply.ok());
    REQUIRE(reply.route.duration_s == Approx(2650.4));
    REQUIRE(reply.route.distance_m == Approx(21033.9));
    REQUIRE(reply.route.status == "ok");
    REQUIRE(reply.route.attempts == 1);
    REQUIRE(reply.route.geometry.get_num_points() == 3);
    REQUIRE(reply.route.geometry.get_x(1) == Approx(-73.9));
    REQUIRE(reply.route.geometry.get_y(2) == Approx(40.75));
    REQUIRE(transport->urls.size() == 1);
  }
  SECTION("transport_status_test")
  {
    OsrmRoutingOracle oracle(std::make_shared<StubTransport>(429, OK_BODY));
    REQUIRE(oracle.route(origin, destination, timeout).error_code ==
            RouteErrorCode::TRANSPORT_STATUS);
  }
  SECTION("transport_exception_test")
  {
    OsrmRoutingOracle oracle(std::make_shared<StubTransport>(200, OK_BODY, true));
    OracleReply reply;
    REQUIRE_NOTHROW(reply = oracle.route(origin, destination, timeout));
    REQUIRE(reply.error_code == RouteErrorCode::TRANSPORT_EXCEPTION);
  }
  SECTION("no_route_test")
  {
    REQUIRE(OsrmRoutingOracle::parse_response(R"({"code":"NoRoute","routes":[]})").error_code ==
            RouteErrorCode::NO_ROUTE);
    REQUIRE(OsrmRoutingOracle::parse_response(R"({"code":"Ok","routes":[]})").error_code ==
            RouteErrorCode::NO_ROUTE);
    REQUIRE(OsrmRoutingOracle::parse_response(R"({"routes":[{"duration":1}]})").error_code ==
            RouteErrorCode::NO_ROUTE);
  }
  SECTION("malformed_response_test")
  {
    REQUIRE(OsrmRoutingOracle::parse_response("<html>").error_code ==
            RouteErrorCode::MALFORMED_RESPONSE);
    REQUIRE(OsrmRoutingOracle::parse_response(
                R"({"code":"Ok","routes":[{"duration":10,"distance":10}]})")
                .error_code == RouteErrorCode::MALFORMED_RESPONSE);
    REQUIRE(OsrmRoutingOracle::parse_response(
                R"({"code":"Ok","routes":[{"duration":-5,"distance":10,
                "geometry":{"coordinates":[[0,0],[1,1]]}}]})")
                .error_code == RouteErrorCode::MALFORMED_RESPONSE);
    REQUIRE(OsrmRoutingOracle::parse_response(
                R"({"code":"Ok","routes":[{"duration":"slow","distance":10,
                "geometry":{"coordinates":[[0,0],[1,1]]}}]})")
                .error_code == RouteErrorCode::MALFORMED_RESPONSE);
    REQUIRE(OsrmRoutingOracle::parse_response(
                R"({"code":"Ok","routes":[{"duration":"123","distance":10,
                "geometry":{"coordinates":[[0,0],[1,1]]}}]})")
                .error_code == RouteErrorCode::MALFORMED_RESPONSE);
    REQUIRE(OsrmRoutingOracle::parse_response(
                R"({"code":"Ok","routes":[{"duration":10,"distance":10,
                "geometry":{"coordinates":[["0","0"],[1,1]]}}]})")
                .error_code == RouteErrorCode::MALFORMED_RESPONSE);
  }
  SECTION("missing_fields_default_test")
  {
    OracleReply reply = OsrmRoutingOracle::parse_response(
        R"({"code":"Ok","routes":[{"geometry":{"coordinates":[[0,0],[1,1]]}}]})");
    REQUIRE(reply.ok());
    REQUIRE(reply.route.duration_s == 0);
    REQUIRE(reply.route.distance_m == 0);
  }
  SECTION("null_transport_test")
  {
    REQUIRE_THROWS_AS(OsrmRoutingOracle(nullptr), std::invalid_argument);
  }
}

TEST_CASE("straight line oracle is tested", "[osrm]")
{
  StraightLineOracle oracle(100, 1000);
  OracleReply reply = oracle.route(Point(0, 0), Point(3, 4), std::chrono::milliseconds(1));
  REQUIRE(reply.ok());
  REQUIRE(reply.route.duration_s == Approx(500));
  REQUIRE(reply.route.distance_m == Approx(5000));
  REQUIRE(reply.route.geometry.get_num_points() == 2);
  double nan = std::numeric_limits<double>::quiet_NaN();
  REQUIRE(oracle.route(Point(nan, 0), Point(1, 1), std::chrono::milliseconds(1)).error_code ==
          RouteErrorCode::NO_ROUTE);
  REQUIRE_THROWS_AS(StraightLineOracle(0), std::invalid_argument);
}

TEST_CASE("oracle config is tested", "[config]")
{
  spdlog::set_level(spdlog::level::off);
  boost::property_tree::ptree tree;
  tree.put("config.osrm.base_url", "http://osrm.local/route/v1/driving");
  OsrmConfig config = OsrmConfig::load_from_ptree(tree);
  REQUIRE(config.base_url == "http://osrm.local/route/v1/driving");
  REQUIRE(config.validate());
  config.base_url = "";
  REQUIRE_FALSE(config.validate());
}
