/**
 * LAEP core.
 *
 * Synthetic routing oracle for offline runs
 */

#ifndef LAEP_ROUTING_STRAIGHT_LINE_ORACLE_HPP_
#define LAEP_ROUTING_STRAIGHT_LINE_ORACLE_HPP_

#include "routing/routing_oracle.hpp"

namespace LAEP
{
  namespace ROUTING
  {
    /**
     * Oracle answering with the straight segment between origin and
     * destination. Duration and distance are proportional to the planar
     * distance in degrees. Stateless and thread-safe.
     */
    class StraightLineOracle : public RoutingOracle
    {
    public:
      /**
       * @param seconds_per_degree duration of one degree of travel
       * @param meters_per_degree distance of one degree of travel
       */
      explicit StraightLineOracle(double seconds_per_degree = 6000,
                                  double meters_per_degree = 111000);

      OracleReply route(const CORE::Point &origin,
                        const CORE::Point &destination,
                        std::chrono::milliseconds timeout) override;

    private:
      double seconds_per_degree_;
      double meters_per_degree_;
    };

  } // ROUTING
} // LAEP

#endif // LAEP_ROUTING_STRAIGHT_LINE_ORACLE_HPP_
