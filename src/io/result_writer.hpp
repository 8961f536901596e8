/**
 * LAEP core.
 *
 * Writers of sampled facilities and planned routes for the rendering layer
 */

#ifndef LAEP_IO_RESULT_WRITER_HPP_
#define LAEP_IO_RESULT_WRITER_HPP_

#include "core/feature.hpp"
#include "join/attribute_join.hpp"
#include "routing/route_planner.hpp"
#include "sample/sample_type.hpp"

#include <ostream>
#include <vector>

namespace LAEP
{
  namespace IO
  {

    /**
     * Write sample points as a GeoJSON FeatureCollection of points with
     * id, name, borough, capacities and electrification speed properties
     */
    void write_samples_geojson(std::ostream &os,
                               const SAMPLE::SamplePoints &points);

    /**
     * Write planned routes as a GeoJSON FeatureCollection of linestrings
     * with duration, distance, attempts and a display name
     */
    void write_routes_geojson(std::ostream &os,
                              const std::vector<ROUTING::PlannedRoute> &routes);

    /**
     * Write route diagnostics as CSV:
     * region;origin_id;duration_min;distance_km;attempts;status
     */
    void write_route_diagnostics_csv(std::ostream &os,
                                     const std::vector<ROUTING::PlannedRoute> &routes);

    /**
     * Write the join outcome of every feature as CSV: id;status;region
     * @throw std::invalid_argument when the two vectors differ in size
     */
    void write_join_csv(std::ostream &os, const CORE::FeatureCollection &features,
                        const std::vector<JOIN::JoinResult> &results);

  } // IO
} // LAEP

#endif // LAEP_IO_RESULT_WRITER_HPP_
