#include "routing/route_type.hpp"

using namespace LAEP;
using namespace LAEP::ROUTING;

std::string LAEP::ROUTING::route_error_to_string(RouteErrorCode code)
{
  switch (code)
  {
  case RouteErrorCode::SUCCESS:
    return "success";
  case RouteErrorCode::TRANSPORT_STATUS:
    return "transport_status";
  case RouteErrorCode::NO_ROUTE:
    return "no_route";
  case RouteErrorCode::MALFORMED_RESPONSE:
    return "malformed_response";
  case RouteErrorCode::TRANSPORT_EXCEPTION:
    return "transport_exception";
  case RouteErrorCode::UNKNOWN_ERROR:
    return "unknown_error";
  }
  return "unknown_error";
}
