/**
 * LAEP core.
 *
 * Target-duration route search implementation and configuration
 */

#ifndef LAEP_ROUTING_DURATION_SEARCH_HPP_
#define LAEP_ROUTING_DURATION_SEARCH_HPP_

#include "routing/routing_oracle.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <random>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  namespace ROUTING
  {
    /**
     * Configuration of the target-duration search
     */
    struct DurationSearchConfig
    {
      /**
       * Constructor of search configuration
       * @param target_duration_s_arg wanted route duration in seconds
       * @param max_attempts_arg number of oracle queries at most
       * @param tolerance_fraction_arg a route within this fraction of the
       * target stops the search
       * @param growth_factor_arg factor applied to the base radius after a
       * route shorter than half the target
       */
      DurationSearchConfig(double target_duration_s_arg = 45 * 60,
                           int max_attempts_arg = 7,
                           double tolerance_fraction_arg = 0.1,
                           double growth_factor_arg = 1.4);
      double target_duration_s;          /**< target duration in seconds */
      int max_attempts;                  /**< attempts per search */
      double tolerance_fraction;         /**< early stop tolerance, fraction of target */
      double growth_factor;              /**< base radius growth, > 1 */
      std::optional<double> base_radius; /**< initial radius in degrees, default by target */
      double attempt_scale = 1.0;        /**< radius of attempt k is base * k * attempt_scale */
      std::chrono::milliseconds oracle_timeout{12000};  /**< timeout of one oracle query */
      std::chrono::milliseconds politeness_delay{0};    /**< pause between oracle queries */
      bool strict_tolerance = false;     /**< report a best route outside tolerance as no result */

      /**
       * The configured base radius, or the default of the target regime
       */
      double get_base_radius() const;
      /**
       * Base radius of a target duration: 0.05 degree up to 45 minutes,
       * 0.18 degree (about 20 km at New York latitude) above.
       */
      static double default_base_radius(double target_duration_s);
      bool validate() const;
      void print() const;
      /**
       * Read the "config.search" node, delays in milliseconds
       */
      static DurationSearchConfig load_from_ptree(
          const boost::property_tree::ptree &data);
    };

    /**
     * Cancellation flag shared between a caller and running searches. A
     * search checks it between attempts, never during an oracle query.
     */
    class CancellationToken
    {
    public:
      void cancel()
      {
        cancelled_.store(true);
      }
      bool is_cancelled() const
      {
        return cancelled_.load();
      }

    private:
      std::atomic<bool> cancelled_{false};
    };

    /**
     * Counters of a single search
     */
    struct SearchStats
    {
      int attempts = 0;          /**< attempts started */
      int oracle_failures = 0;   /**< attempts skipped on oracle failure */
      bool within_tolerance = false; /**< best route is within tolerance */
      bool cancelled = false;    /**< stopped by the cancellation token */
    };

    /**
     * Searches a destination whose route duration from an origin is close
     * to a target duration.
     *
     * The oracle cost surface is unknown and non-monotonic, so the search
     * draws random bearings at a radius growing with the attempt index,
     * and widens the base radius when routes come out shorter than half the
     * target. Destinations are clamped into the bounding box one axis at a
     * time, which shortens the effective radius near edges and corners.
     *
     * A search owns its best route and radius; one search never issues
     * concurrent oracle queries.
     */
    class TargetDurationSearch
    {
    public:
      /**
       * @param oracle routing oracle, must outlive the search
       * @param bbox box holding every destination
       * @throw DegenerateInput if bbox has zero area
       */
      TargetDurationSearch(RoutingOracle &oracle, const CORE::Box &bbox);

      /**
       * Run a search.
       *
       * @param origin route origin (lon, lat)
       * @param config search configuration
       * @param rng random engine for the bearings
       * @param cancel optional cancellation token
       * @param stats if not null, filled with the counters of the search
       * @return the route closest to the target with its attempt index, or
       * nullopt if every attempt failed at the oracle (or, with
       * strict_tolerance, if the best route misses the tolerance)
       * @throw DegenerateInput on a non-finite origin or an invalid config
       */
      std::optional<RouteResult> search(const CORE::Point &origin,
                                        const DurationSearchConfig &config,
                                        std::mt19937 &rng,
                                        const CancellationToken *cancel = nullptr,
                                        SearchStats *stats = nullptr) const;

      const CORE::Box &get_bbox() const;

    private:
      /**
       * Project a destination at radius and bearing from origin, each axis
       * clamped into the box
       */
      CORE::Point project_destination(const CORE::Point &origin,
                                      double radius, double angle) const;

      RoutingOracle &oracle_;
      CORE::Box bbox_;
    };

    /**
     * Search with default tunables for a target duration and attempt
     * budget
     */
    std::optional<RouteResult> search_route_near_duration(
        const CORE::Point &origin, double target_duration_s,
        RoutingOracle &oracle, int max_attempts, const CORE::Box &bbox,
        std::mt19937 &rng);

  } // ROUTING
} // LAEP

#endif // LAEP_ROUTING_DURATION_SEARCH_HPP_
