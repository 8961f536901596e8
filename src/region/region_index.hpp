/**
 * LAEP core.
 *
 * Region index class
 */

#ifndef LAEP_REGION_INDEX_HPP_
#define LAEP_REGION_INDEX_HPP_

#include "region/type.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Data structures for Rtree
#include <boost/geometry/index/rtree.hpp>

namespace LAEP
{
  /**
   * Classes related with administrative regions
   */
  namespace REGION
  {
    /**
     * Spatial membership index over a set of labeled polygons.
     *
     * Answers two queries: whether a point lies inside the union of all
     * regions, and which region contains a point. When regions overlap the
     * region ingested first wins; there is no adjudication by area.
     *
     * The union is derived lazily and recomputed only after the region set
     * changed. Once populated, the index may be shared by any number of
     * concurrent readers; adding regions while readers are active is not
     * supported.
     */
    class RegionIndex
    {
    public:
      /**
       * Item stored in a node of Rtree, the envelope of a region and its
       * ingestion order
       */
      typedef std::pair<CORE::Box, RegionOrder> Item;
      /**
       * Rtree of region envelopes
       */
      typedef boost::geometry::index::rtree<
          Item, boost::geometry::index::quadratic<16>>
          Rtree;

      /**
       * Create an empty index, populate it with add_region.
       */
      RegionIndex() = default;
      virtual ~RegionIndex() = default;
      RegionIndex(const RegionIndex &) = delete;
      RegionIndex &operator=(const RegionIndex &) = delete;

      /**
       * Build an index from a collection of labeled polygons. Invalid
       * polygons are logged and skipped.
       *
       * @param inputs labeled polygons in ingestion order
       * @return a populated index
       * @throw GeometryError if no valid polygon exists in inputs
       */
      static std::shared_ptr<RegionIndex> build(
          const std::vector<RegionInput> &inputs);

      /**
       * Add a region to the index. Ring orientation and closure are
       * corrected before validation.
       *
       * @param label region label
       * @param geom region geometry
       * @return true if the region was added, false if the geometry was
       * rejected as invalid
       */
      bool add_region(const std::string &label, const CORE::MultiPolygon &geom);

      /**
       * Test membership in the union of all regions. Points on a boundary
       * are inside.
       */
      virtual bool contains_point(const CORE::Point &p) const;

      /**
       * Label of the first region (ingestion order) covering p.
       *
       * @return the label, or nullopt if no single region covers p, which
       * can happen for points accepted by contains_point through numeric
       * tolerance of the union
       */
      virtual std::optional<std::string> label_for_point(const CORE::Point &p) const;

      /**
       * Number of regions accepted into the index
       */
      int get_region_count() const;
      /**
       * Number of geometries rejected at ingestion
       */
      int get_rejected_count() const;
      bool empty() const;
      const std::vector<Region> &get_regions() const;
      /**
       * Distinct labels in order of first appearance
       */
      std::vector<std::string> get_labels() const;
      /**
       * Envelope of the union of all regions
       * @throw GeometryError if the index is empty
       */
      CORE::Box get_envelope() const;

    private:
      /**
       * Union geometry derived from the current region set
       */
      struct UnionCache
      {
        CORE::MultiPolygon geom;
        CORE::Box envelope;
      };
      /**
       * Get the union, computing it if the region set changed since the
       * last call
       */
      std::shared_ptr<const UnionCache> get_union() const;
      std::shared_ptr<const UnionCache> compute_union() const;

      std::vector<Region> regions;
      Rtree rtree;
      int rejected = 0;
      mutable std::mutex union_mutex;
      mutable std::shared_ptr<const UnionCache> union_cache; // null when stale
    };
  }
}
#endif // LAEP_REGION_INDEX_HPP_
