/**
 * LAEP core.
 *
 * Attribute join: region label of external feature points
 */

#ifndef LAEP_JOIN_ATTRIBUTE_JOIN_HPP_
#define LAEP_JOIN_ATTRIBUTE_JOIN_HPP_

#include "core/feature.hpp"
#include "core/geometry.hpp"
#include "region/region_index.hpp"

#include <optional>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  /**
   * Joining external features to regions
   */
  namespace JOIN
  {

    /**
     * How the label of a feature was obtained
     */
    enum class JoinStatus
    {
      SPATIAL,       /**< representative point inside a region */
      PROPERTY,      /**< no usable index, label read from the feature properties */
      NOT_CONTAINED, /**< representative point inside no region */
      UNRESOLVABLE   /**< geometry missing or malformed, or no label property */
    };

    std::string join_status_to_string(JoinStatus status);

    /**
     * Result of resolving the region of one feature
     */
    struct JoinResult
    {
      JoinStatus status;  /**< how the label was obtained */
      std::string label;  /**< region label, empty unless SPATIAL or PROPERTY */

      bool resolved() const
      {
        return status == JoinStatus::SPATIAL || status == JoinStatus::PROPERTY;
      }
    };

    /**
     * Configuration of the attribute join
     */
    struct JoinConfig
    {
      /**
       * Feature property keys read when no index is usable, first present
       * key wins
       */
      std::vector<std::string> property_keys = {"borough", "BoroName", "boro_name"};
      bool verbose = false; /**< log every feature that cannot be resolved */
      void print() const;
      /**
       * Read the "config.join" node, property keys as a comma separated
       * list
       */
      static JoinConfig load_from_ptree(const boost::property_tree::ptree &data);
    };

    /**
     * Resolves the containing region of external feature points.
     *
     * Malformed input never raises: it is reported as UNRESOLVABLE and is
     * excluded from filtered results. Polygonal and multi-vertex geometries
     * are represented by their centroid, which can fall outside a concave
     * shape.
     */
    class AttributeJoin
    {
    public:
      explicit AttributeJoin(const JoinConfig &config = JoinConfig());

      /**
       * Resolve the region label of a feature.
       *
       * @param feature input feature, never modified
       * @param region_index index to test against, may be null; a null or
       * empty index falls back to the feature properties
       * @return status and label
       */
      JoinResult resolve_region(const CORE::Feature &feature,
                                const REGION::RegionIndex *region_index) const;

      /**
       * Keep the features resolved into one of labels (all resolved
       * features if labels is empty). Unresolvable and uncontained features
       * are always excluded.
       */
      CORE::FeatureCollection filter_features_by_region(
          const CORE::FeatureCollection &features,
          const REGION::RegionIndex *region_index,
          const std::vector<std::string> &labels) const;

      /**
       * Representative point of a feature geometry: the point itself, or
       * the centroid of line, multi-point and polygonal geometries.
       *
       * @return nullopt if the geometry is missing or malformed
       */
      static std::optional<CORE::Point> representative_point(
          const CORE::Feature &feature);

    private:
      JoinResult resolve_by_property(const CORE::Feature &feature) const;
      JoinConfig config_;
    };

  } // JOIN
} // LAEP

#endif // LAEP_JOIN_ATTRIBUTE_JOIN_HPP_
