/**
 * LAEP core.
 *
 * Routing oracle interface
 */

#ifndef LAEP_ROUTING_ROUTING_ORACLE_HPP_
#define LAEP_ROUTING_ROUTING_ORACLE_HPP_

#include "routing/route_type.hpp"

#include <chrono>

namespace LAEP
{
  namespace ROUTING
  {
    /**
     * A routing backend queried as a black box: one origin, one
     * destination, one reply. Nothing is known about how the duration
     * varies with the destination.
     *
     * Implementations never throw; every failure is reported through the
     * error code of the reply. Implementations used by the route planner
     * with more than one thread must be thread-safe.
     */
    class RoutingOracle
    {
    public:
      virtual ~RoutingOracle() = default;
      /**
       * Query a route
       * @param origin (lon, lat)
       * @param destination (lon, lat)
       * @param timeout upper bound of the query
       * @return the route or a failure code
       */
      virtual OracleReply route(const CORE::Point &origin,
                                const CORE::Point &destination,
                                std::chrono::milliseconds timeout) = 0;
    };

  } // ROUTING
} // LAEP

#endif // LAEP_ROUTING_ROUTING_ORACLE_HPP_
