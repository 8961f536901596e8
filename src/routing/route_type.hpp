/**
 * LAEP core.
 *
 * Definition of routing types
 */

#ifndef LAEP_ROUTING_ROUTE_TYPE_HPP_
#define LAEP_ROUTING_ROUTE_TYPE_HPP_

#include "core/geometry.hpp"

#include <string>
#include <vector>

namespace LAEP
{
  /**
   * Routing oracle and target-duration route search
   */
  namespace ROUTING
  {

    /**
     * Error codes of a routing oracle reply
     */
    enum class RouteErrorCode : int
    {
      SUCCESS = 0,             /**< a route was found */
      TRANSPORT_STATUS = 1,    /**< transport returned a non-success status */
      NO_ROUTE = 2,            /**< response lacks the route-found indicator or routes */
      MALFORMED_RESPONSE = 3,  /**< response could not be parsed */
      TRANSPORT_EXCEPTION = 4, /**< transport raised, including timeouts */
      UNKNOWN_ERROR = 255      /**< unknown error occurred */
    };

    std::string route_error_to_string(RouteErrorCode code);

    /**
     * A route between an origin and a destination as returned by a routing
     * oracle
     */
    struct RouteResult
    {
      CORE::LineString geometry; /**< ordered (lon, lat) vertices of the path */
      double duration_s = 0;     /**< travel duration in seconds */
      double distance_m = 0;     /**< travel distance in meters */
      std::string status;        /**< status reported by the oracle, e.g. "ok" */
      int attempts = 1;          /**< search attempt that produced this route */
    };

    /**
     * Reply of a single oracle query. route is only meaningful when
     * error_code is SUCCESS.
     */
    struct OracleReply
    {
      RouteErrorCode error_code = RouteErrorCode::UNKNOWN_ERROR;
      RouteResult route;

      bool ok() const
      {
        return error_code == RouteErrorCode::SUCCESS;
      }
      static OracleReply failure(RouteErrorCode code)
      {
        OracleReply reply;
        reply.error_code = code;
        return reply;
      }
      static OracleReply success(const RouteResult &route)
      {
        OracleReply reply;
        reply.error_code = RouteErrorCode::SUCCESS;
        reply.route = route;
        return reply;
      }
    };

  } // ROUTING
} // LAEP

#endif // LAEP_ROUTING_ROUTE_TYPE_HPP_
