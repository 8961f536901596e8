/**
 * LAEP core.
 *
 * Definition of synthetic facility points
 */

#ifndef LAEP_SAMPLE_TYPE_HPP_
#define LAEP_SAMPLE_TYPE_HPP_

#include "core/geometry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace LAEP
{
  /**
   * Synthetic facility generation
   */
  namespace SAMPLE
  {

    /**
     * Electrification speed of a facility, derived from its capacity gap
     */
    enum class SpeedCategory
    {
      FAST,   /**< gap < 250 */
      MEDIUM, /**< 250 <= gap < 500 */
      SLOW    /**< gap >= 500 */
    };

    const int FAST_GAP_LIMIT = 250;   /**< gaps below are FAST */
    const int MEDIUM_GAP_LIMIT = 500; /**< gaps below are MEDIUM, above SLOW */

    /**
     * Deterministic classification of a capacity gap
     */
    SpeedCategory speed_category_from_gap(int gap);

    /**
     * "Fast", "Medium" or "Slow"
     */
    std::string speed_category_to_string(SpeedCategory category);

    /**
     * Parse "Fast", "Medium" or "Slow" (case sensitive)
     */
    std::optional<SpeedCategory> speed_category_from_string(const std::string &str);

    /**
     * %Sample point, a synthetic facility (e.g. a bus depot)
     */
    struct SamplePoint
    {
      int id;                   /**< 1-based position in the sample */
      std::string name;         /**< display name */
      CORE::Point point;        /**< (lon, lat) */
      std::string region;       /**< containing region label or "Unknown" */
      int existing_capacity;    /**< synthetic existing capacity (kW) */
      int needed_capacity;      /**< synthetic needed capacity (kW), >= existing */
      int capacity_gap;         /**< needed - existing */
      SpeedCategory speed;      /**< derived from capacity_gap */
    };

    typedef std::vector<SamplePoint> SamplePoints;

  } // SAMPLE
} // LAEP

#endif // LAEP_SAMPLE_TYPE_HPP_
