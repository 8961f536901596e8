/**
 * LAEP core.
 *
 * Boundary data source with a built-in fallback
 */

#ifndef LAEP_IO_BOUNDARY_LOADER_HPP_
#define LAEP_IO_BOUNDARY_LOADER_HPP_

#include "core/feature.hpp"
#include "io/geojson_reader.hpp"
#include "region/region_index.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace LAEP
{
  namespace IO
  {

    /**
     * Origin of the boundaries held by a load result
     */
    enum class BoundaryStatus
    {
      LOADED,  /**< loaded from the primary source */
      FALLBACK /**< primary source failed, built-in set used */
    };

    std::string boundary_status_to_string(BoundaryStatus status);

    /**
     * Boundaries ready for use: the raw features (for rendering), and the
     * region index built from them, which is never empty.
     */
    struct BoundaryLoadResult
    {
      BoundaryStatus status;                        /**< loaded or fallback */
      std::string source;                           /**< file name, "remote" or "builtin" */
      CORE::FeatureCollection features;             /**< polygon features as read */
      std::shared_ptr<REGION::RegionIndex> index;   /**< index over the features */
    };

    /**
     * Load region boundaries from a local GeoJSON file or a remote feature
     * service. Any failure (fetch, parse, no valid polygon) is logged and
     * replaced by the built-in set of one polygon per borough.
     */
    class BoundaryLoader
    {
    public:
      /**
       * Fetch the GeoJSON text of a remote feature service. The transport
       * is supplied by the caller and may throw.
       */
      typedef std::function<std::string()> FetchFunction;

      /**
       * @param label_keys property keys holding the region label
       */
      explicit BoundaryLoader(
          const std::vector<std::string> &label_keys = DEFAULT_LABEL_KEYS);

      BoundaryLoadResult load_file(const std::string &filename) const;

      BoundaryLoadResult load_remote(const FetchFunction &fetch) const;

      /**
       * Load from GeoJSON text
       * @param text GeoJSON document
       * @param source name reported in the result
       */
      BoundaryLoadResult load_string(const std::string &text,
                                     const std::string &source) const;

      /**
       * The built-in boundaries, status FALLBACK
       */
      BoundaryLoadResult fallback() const;

      /**
       * GeoJSON text of the built-in boundaries
       */
      static const std::string &fallback_geojson();

    private:
      std::vector<std::string> label_keys_;
    };

  } // IO
} // LAEP

#endif // LAEP_IO_BOUNDARY_LOADER_HPP_
