#include "routing/osrm_oracle.hpp"
#include "io/geojson_reader.hpp"
#include "io/json_document.hpp"
#include "util/debug.hpp"

#include <stdexcept>

#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::ROUTING;

namespace pt = boost::property_tree;

bool OsrmConfig::validate() const
{
  if (base_url.empty())
  {
    SPDLOG_CRITICAL("OSRM base url is empty");
    return false;
  }
  return true;
}

void OsrmConfig::print() const
{
  SPDLOG_INFO("OsrmConfig");
  SPDLOG_INFO("Base url {}", base_url);
}

OsrmConfig OsrmConfig::load_from_ptree(const pt::ptree &data)
{
  OsrmConfig config;
  config.base_url = data.get("config.osrm.base_url", config.base_url);
  return config;
}

OsrmRoutingOracle::OsrmRoutingOracle(std::shared_ptr<HttpTransport> transport,
                                     const OsrmConfig &config)
    : transport_(std::move(transport)), config_(config)
{
  if (!transport_)
  {
    throw std::invalid_argument("OSRM oracle requires a transport");
  }
}

std::string OsrmRoutingOracle::build_url(const Point &origin,
                                         const Point &destination) const
{
  return (boost::format("%s/%.6f,%.6f;%.6f,%.6f"
                        "?overview=full&annotations=false&geometries=geojson") %
          config_.base_url %
          boost::geometry::get<0>(origin) % boost::geometry::get<1>(origin) %
          boost::geometry::get<0>(destination) % boost::geometry::get<1>(destination))
      .str();
}

OracleReply OsrmRoutingOracle::parse_response(const std::string &body)
{
  pt::ptree root;
  try
  {
    root = IO::read_json_document(body, {"duration", "distance", "coordinates"});
  }
  catch (const pt::json_parser_error &e)
  {
    SPDLOG_DEBUG("OSRM body is not JSON: {}", e.what());
    return OracleReply::failure(RouteErrorCode::MALFORMED_RESPONSE);
  }
  std::string code = root.get<std::string>("code", "");
  auto routes = root.get_child_optional("routes");
  if (code != "Ok" || !routes || routes->empty())
  {
    SPDLOG_DEBUG("OSRM bad code {}", code);
    return OracleReply::failure(RouteErrorCode::NO_ROUTE);
  }
  const pt::ptree &first = routes->begin()->second;
  RouteResult result;
  for (const auto &field : {std::make_pair("duration", &result.duration_s),
                            std::make_pair("distance", &result.distance_m)})
  {
    auto node = first.get_child_optional(field.first);
    if (!node)
      continue;
    auto value = node->get_value_optional<double>();
    if (!value || !(*value >= 0))
    {
      SPDLOG_DEBUG("OSRM route {} is not a non-negative number", field.first);
      return OracleReply::failure(RouteErrorCode::MALFORMED_RESPONSE);
    }
    *field.second = *value;
  }
  auto coordinates = first.get_child_optional("geometry.coordinates");
  std::vector<Point> points;
  if (!coordinates || !IO::parse_point_sequence(*coordinates, &points))
  {
    SPDLOG_DEBUG("OSRM route geometry missing or malformed");
    return OracleReply::failure(RouteErrorCode::MALFORMED_RESPONSE);
  }
  for (const Point &p : points)
  {
    result.geometry.add_point(p);
  }
  result.status = "ok";
  result.attempts = 1;
  return OracleReply::success(result);
}

OracleReply OsrmRoutingOracle::route(const Point &origin,
                                     const Point &destination,
                                     std::chrono::milliseconds timeout)
{
  std::string url = build_url(origin, destination);
  HttpResponse response;
  try
  {
    response = transport_->get(url, timeout);
  }
  catch (const std::exception &e)
  {
    SPDLOG_DEBUG("OSRM exception {} url={}", e.what(), url);
    return OracleReply::failure(RouteErrorCode::TRANSPORT_EXCEPTION);
  }
  if (response.status != 200)
  {
    SPDLOG_DEBUG("OSRM non200 status={} url={}", response.status, url);
    return OracleReply::failure(RouteErrorCode::TRANSPORT_STATUS);
  }
  OracleReply reply = parse_response(response.body);
  SPDLOG_TRACE("OSRM reply {} url={}", route_error_to_string(reply.error_code), url);
  return reply;
}
