/**
 * LAEP core.
 *
 * Definition of an external feature point (e.g. an amenity record read
 * from GeoJSON)
 */

#ifndef LAEP_CORE_FEATURE_HPP_
#define LAEP_CORE_FEATURE_HPP_

#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  namespace CORE
  {

    /**
     * %Feature class
     *
     * A GeoJSON feature kept as its parsed tree. The geometry may be
     * missing or malformed; consumers validate it before use and never
     * modify the properties.
     */
    struct Feature
    {
      int id;                            /**< position in the source collection */
      boost::property_tree::ptree node;  /**< the whole feature object */
    };

    typedef std::vector<Feature> FeatureCollection;

  } // CORE
} // LAEP

#endif // LAEP_CORE_FEATURE_HPP_
