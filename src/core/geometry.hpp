/**
 * LAEP core.
 *
 * Definition of geometry types built on boost geometry. Coordinates are
 * (longitude, latitude) in degrees and are handled as planar cartesian
 * values, which is how the search radius and the lattice are expressed.
 */

#ifndef LAEP_CORE_GEOMETRY_HPP_
#define LAEP_CORE_GEOMETRY_HPP_

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/geometries.hpp>

namespace LAEP
{
  /**
   * Core data types
   */
  namespace CORE
  {

    /**
     *  Point class, x is longitude and y is latitude
     */
    typedef boost::geometry::model::point<double, 2,
                                          boost::geometry::cs::cartesian>
        Point;

    /**
     * Axis aligned bounding box (min corner, max corner)
     */
    typedef boost::geometry::model::box<Point> Box;

    /**
     * Clockwise, closed polygon. Rings read from GeoJSON are reoriented
     * with boost::geometry::correct before use.
     */
    typedef boost::geometry::model::polygon<Point> Polygon;

    typedef boost::geometry::model::multi_polygon<Polygon> MultiPolygon;

    typedef boost::geometry::model::linestring<Point> BGLineString;

    /**
     * Linestring geometry class
     *
     * This class wraps a boost linestring geometry and is used for route
     * paths.
     */
    class LineString
    {
    public:
      inline double get_x(int i) const
      {
        return boost::geometry::get<0>(line.at(i));
      };
      inline double get_y(int i) const
      {
        return boost::geometry::get<1>(line.at(i));
      };
      inline const Point &get_point(int i) const
      {
        return line.at(i);
      };
      inline void add_point(double x, double y)
      {
        boost::geometry::append(line, Point(x, y));
      };
      inline void add_point(const Point &point)
      {
        boost::geometry::append(line, point);
      };
      inline int get_num_points() const
      {
        return static_cast<int>(boost::geometry::num_points(line));
      };
      inline bool is_empty() const
      {
        return boost::geometry::num_points(line) == 0;
      };
      inline void clear()
      {
        boost::geometry::clear(line);
      };
      /**
       * Planar length in degrees
       */
      inline double get_length() const
      {
        return boost::geometry::length(line);
      };
      inline BGLineString &get_geometry()
      {
        return line;
      };
      inline const BGLineString &get_geometry_const() const
      {
        return line;
      };
      /**
       * Export as a list of (lon, lat) pairs
       */
      std::vector<std::pair<double, double>> to_xy_pairs() const;

      friend bool operator==(const LineString &lhs, const LineString &rhs);

      friend std::ostream &operator<<(std::ostream &os, const LineString &rhs);

    private:
      BGLineString line;
    };

    bool operator==(const LineString &lhs, const LineString &rhs);

    std::ostream &operator<<(std::ostream &os, const LineString &rhs);

    /**
     * Convert a wkt into a linestring
     */
    LineString wkt2linestring(const std::string &wkt);

    /**
     * Convert a wkt POLYGON or MULTIPOLYGON into a multipolygon. The
     * result is not corrected nor validated.
     * @throw std::runtime_error (boost read_wkt_exception) on a bad wkt
     */
    MultiPolygon wkt2multipolygon(const std::string &wkt);

    /**
     * Create a box from (minx, miny, maxx, maxy)
     */
    Box make_box(double minx, double miny, double maxx, double maxy);

    /**
     * True if the box has zero (or negative) width or height, or a
     * non-finite corner
     */
    bool is_degenerate(const Box &box);

    bool is_finite(const Point &p);

    /**
     * Euclidean distance in coordinate units
     */
    double planar_distance(const Point &a, const Point &b);

    std::string point2string(const Point &p);

  } // CORE
} // LAEP

#endif // LAEP_CORE_GEOMETRY_HPP_
