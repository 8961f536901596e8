/**
 * LAEP core.
 *
 * Definition of region types stored in the region index
 */

#ifndef LAEP_REGION_TYPE_HPP_
#define LAEP_REGION_TYPE_HPP_

#include "core/geometry.hpp"

#include <string>
#include <vector>

namespace LAEP
{
  namespace REGION
  {

    typedef unsigned int RegionOrder; /**< Ingestion order of a region, range
                                         from [0,num_regions-1] */

    /**
     * Labeled polygon as supplied by a boundary source, before validation
     */
    struct RegionInput
    {
      std::string label;          /**< region label, e.g. borough name */
      CORE::MultiPolygon geom;    /**< boundary geometry */
    };

    /**
     * Validated region stored in the index
     */
    struct Region
    {
      RegionOrder order;          /**< ingestion order, first match wins */
      std::string label;          /**< region label */
      CORE::MultiPolygon geom;    /**< corrected, valid boundary */
      CORE::Box envelope;         /**< envelope of geom */
    };

  } // REGION
} // LAEP

#endif // LAEP_REGION_TYPE_HPP_
