#include "io/result_writer.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <stdexcept>
#include <string>

#include <boost/io/ios_state.hpp>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::SAMPLE;
using namespace LAEP::ROUTING;
using namespace LAEP::JOIN;

namespace
{
  std::string escape_json(const std::string &str)
  {
    std::string out;
    out.reserve(str.size());
    for (char c : str)
    {
      switch (c)
      {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(c)));
          out += buf;
        }
        else
        {
          out += c;
        }
      }
    }
    return out;
  }

  // Fields holding the separator, a quote or a line break are quoted
  std::string csv_field(const std::string &str)
  {
    if (str.find_first_of(";\"\r\n") == std::string::npos)
      return str;
    std::string out = "\"";
    for (char c : str)
    {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  void write_position(std::ostream &os, double x, double y)
  {
    boost::io::ios_precision_saver saver(os);
    os << "[" << std::setprecision(10) << x << "," << y << "]";
  }
}

void LAEP::IO::write_samples_geojson(std::ostream &os, const SamplePoints &points)
{
  os << "{\"type\":\"FeatureCollection\",\"features\":[";
  for (std::size_t i = 0; i < points.size(); ++i)
  {
    const SamplePoint &p = points[i];
    if (i > 0)
      os << ",";
    os << "\n{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":";
    write_position(os, boost::geometry::get<0>(p.point), boost::geometry::get<1>(p.point));
    os << "},\"properties\":{"
       << "\"id\":" << p.id
       << ",\"name\":\"" << escape_json(p.name) << "\""
       << ",\"borough\":\"" << escape_json(p.region) << "\""
       << ",\"existing_capacity_kw\":" << p.existing_capacity
       << ",\"needed_capacity_kw\":" << p.needed_capacity
       << ",\"capacity_gap_kw\":" << p.capacity_gap
       << ",\"electrification_speed\":\"" << speed_category_to_string(p.speed) << "\""
       << "}}";
  }
  os << "\n]}\n";
}

void LAEP::IO::write_routes_geojson(std::ostream &os,
                                    const std::vector<PlannedRoute> &routes)
{
  boost::io::ios_all_saver saver(os);
  os << "{\"type\":\"FeatureCollection\",\"features\":[";
  for (std::size_t i = 0; i < routes.size(); ++i)
  {
    const PlannedRoute &planned = routes[i];
    const RouteResult &r = planned.route;
    if (i > 0)
      os << ",";
    os << "\n{\"type\":\"Feature\",\"geometry\":{\"type\":\"LineString\",\"coordinates\":[";
    for (int j = 0; j < r.geometry.get_num_points(); ++j)
    {
      if (j > 0)
        os << ",";
      write_position(os, r.geometry.get_x(j), r.geometry.get_y(j));
    }
    os << "]},\"properties\":{"
       << "\"borough\":\"" << escape_json(planned.region) << "\""
       << ",\"origin_id\":" << planned.origin_id
       << ",\"duration\":" << std::fixed << std::setprecision(1) << r.duration_s
       << ",\"distance\":" << r.distance_m << std::defaultfloat
       << ",\"attempts\":" << r.attempts
       << ",\"status\":\"" << escape_json(r.status) << "\""
       << ",\"name\":\"~" << std::lround(r.duration_s / 60.0) << " min route\""
       << "}}";
  }
  os << "\n]}\n";
}

void LAEP::IO::write_route_diagnostics_csv(std::ostream &os,
                                           const std::vector<PlannedRoute> &routes)
{
  boost::io::ios_all_saver saver(os);
  os << "region;origin_id;duration_min;distance_km;attempts;status\n";
  os << std::fixed << std::setprecision(1);
  for (const PlannedRoute &planned : routes)
  {
    const RouteResult &r = planned.route;
    os << csv_field(planned.region) << ";"
       << planned.origin_id << ";"
       << r.duration_s / 60.0 << ";"
       << r.distance_m / 1000.0 << ";"
       << r.attempts << ";"
       << csv_field(r.status) << "\n";
  }
}

void LAEP::IO::write_join_csv(std::ostream &os, const FeatureCollection &features,
                              const std::vector<JoinResult> &results)
{
  if (features.size() != results.size())
  {
    throw std::invalid_argument("Join results do not match the features");
  }
  os << "id;status;region\n";
  for (std::size_t i = 0; i < features.size(); ++i)
  {
    os << features[i].id << ";"
       << join_status_to_string(results[i].status) << ";"
       << csv_field(results[i].label) << "\n";
  }
}
