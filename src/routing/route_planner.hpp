/**
 * LAEP core.
 *
 * Route planner: target-duration routes from sampled facilities, a fixed
 * number per region
 */

#ifndef LAEP_ROUTING_ROUTE_PLANNER_HPP_
#define LAEP_ROUTING_ROUTE_PLANNER_HPP_

#include "routing/duration_search.hpp"
#include "sample/sample_type.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  namespace ROUTING
  {
    /**
     * Configuration of the route planner
     */
    struct PlannerConfig
    {
      int routes_per_region = 3;     /**< routes wanted per region */
      int candidates_per_region = 0; /**< origins tried per region at most, 0 for all */
      std::vector<std::string> regions; /**< regions planned, in order; empty for all */
      int num_threads = 1;           /**< worker threads, one region per task */
      std::chrono::milliseconds origin_delay{0}; /**< pause between two searches */
      bool validate() const;
      void print() const;
      /**
       * Read the "config.planner" node, regions as a comma separated list
       */
      static PlannerConfig load_from_ptree(const boost::property_tree::ptree &data);
    };

    /**
     * A route found from a sampled facility
     */
    struct PlannedRoute
    {
      std::string region;  /**< region of the origin */
      int origin_id;       /**< id of the origin sample point */
      CORE::Point origin;  /**< origin (lon, lat) */
      RouteResult route;   /**< best route found from the origin */
    };

    /**
     * Runs one target-duration search per origin until each region has
     * enough routes.
     *
     * Origins of a region are shuffled and tried in turn; an origin whose
     * search returns no result is skipped. Every region owns a random engine
     * derived from the seed and the region position, so the output does not
     * depend on the number of threads. The oracle must be thread-safe when
     * num_threads > 1.
     */
    class RoutePlanner
    {
    public:
      /**
       * @param oracle routing oracle, must outlive the planner
       * @param bbox box holding every destination
       */
      RoutePlanner(RoutingOracle &oracle, const CORE::Box &bbox);

      /**
       * Plan routes
       * @param origins sampled facilities
       * @param planner_config planner configuration
       * @param search_config configuration of every search
       * @param seed random seed
       * @param cancel optional token, checked between searches and attempts
       * @return routes grouped by region in region order
       * @throw DegenerateInput on an empty origin set or invalid configs
       */
      std::vector<PlannedRoute> plan(const SAMPLE::SamplePoints &origins,
                                     const PlannerConfig &planner_config,
                                     const DurationSearchConfig &search_config,
                                     unsigned int seed,
                                     const CancellationToken *cancel = nullptr) const;

    private:
      std::vector<PlannedRoute> plan_region(
          const std::string &region, const SAMPLE::SamplePoints &origins,
          const PlannerConfig &planner_config,
          const DurationSearchConfig &search_config,
          std::mt19937 &rng, const CancellationToken *cancel) const;

      TargetDurationSearch search_;
    };

  } // ROUTING
} // LAEP

#endif // LAEP_ROUTING_ROUTE_PLANNER_HPP_
