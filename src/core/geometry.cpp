#include "core/geometry.hpp"

#include <cmath>
#include <sstream>

using namespace LAEP;
using namespace LAEP::CORE;

std::vector<std::pair<double, double>> LineString::to_xy_pairs() const
{
  std::vector<std::pair<double, double>> data;
  int n = get_num_points();
  data.reserve(n);
  for (int i = 0; i < n; ++i)
  {
    data.emplace_back(get_x(i), get_y(i));
  }
  return data;
}

bool LAEP::CORE::operator==(const LineString &lhs, const LineString &rhs)
{
  int N = lhs.get_num_points();
  if (rhs.get_num_points() != N)
    return false;
  for (int i = 0; i < N; ++i)
  {
    if (std::abs(lhs.get_x(i) - rhs.get_x(i)) > 1e-9 ||
        std::abs(lhs.get_y(i) - rhs.get_y(i)) > 1e-9)
      return false;
  }
  return true;
}

std::ostream &LAEP::CORE::operator<<(std::ostream &os, const LineString &rhs)
{
  os << std::setprecision(12) << boost::geometry::wkt(rhs.line);
  return os;
}

LineString LAEP::CORE::wkt2linestring(const std::string &wkt)
{
  LineString line;
  boost::geometry::read_wkt(wkt, line.get_geometry());
  return line;
}

MultiPolygon LAEP::CORE::wkt2multipolygon(const std::string &wkt)
{
  MultiPolygon mpoly;
  if (wkt.find("MULTIPOLYGON") != std::string::npos)
  {
    boost::geometry::read_wkt(wkt, mpoly);
  }
  else
  {
    Polygon poly;
    boost::geometry::read_wkt(wkt, poly);
    mpoly.push_back(poly);
  }
  return mpoly;
}

Box LAEP::CORE::make_box(double minx, double miny, double maxx, double maxy)
{
  return Box(Point(minx, miny), Point(maxx, maxy));
}

bool LAEP::CORE::is_finite(const Point &p)
{
  return std::isfinite(boost::geometry::get<0>(p)) &&
         std::isfinite(boost::geometry::get<1>(p));
}

bool LAEP::CORE::is_degenerate(const Box &box)
{
  const Point &lo = box.min_corner();
  const Point &hi = box.max_corner();
  if (!is_finite(lo) || !is_finite(hi))
    return true;
  return !(boost::geometry::get<0>(hi) > boost::geometry::get<0>(lo) &&
           boost::geometry::get<1>(hi) > boost::geometry::get<1>(lo));
}

double LAEP::CORE::planar_distance(const Point &a, const Point &b)
{
  return boost::geometry::distance(a, b);
}

std::string LAEP::CORE::point2string(const Point &p)
{
  std::ostringstream oss;
  oss << std::setprecision(12) << boost::geometry::wkt(p);
  return oss.str();
}
