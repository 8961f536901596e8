#include "routing/straight_line_oracle.hpp"

#include <stdexcept>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::ROUTING;

StraightLineOracle::StraightLineOracle(double seconds_per_degree,
                                       double meters_per_degree)
    : seconds_per_degree_(seconds_per_degree),
      meters_per_degree_(meters_per_degree)
{
  if (!(seconds_per_degree > 0) || !(meters_per_degree > 0))
  {
    throw std::invalid_argument("Straight line oracle factors must be positive");
  }
}

OracleReply StraightLineOracle::route(const Point &origin,
                                      const Point &destination,
                                      std::chrono::milliseconds)
{
  if (!is_finite(origin) || !is_finite(destination))
  {
    return OracleReply::failure(RouteErrorCode::NO_ROUTE);
  }
  double d = planar_distance(origin, destination);
  RouteResult result;
  result.geometry.add_point(origin);
  result.geometry.add_point(destination);
  result.duration_s = d * seconds_per_degree_;
  result.distance_m = d * meters_per_degree_;
  result.status = "ok";
  return OracleReply::success(result);
}
