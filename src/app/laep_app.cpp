/**
 * LAEP core.
 *
 * laep command line application: load borough boundaries, sample depots
 * inside them, and plan target-duration routes from the depots with the
 * synthetic routing oracle
 */

#include "app/laep_app_config.hpp"
#include "io/boundary_loader.hpp"
#include "io/geojson_reader.hpp"
#include "io/result_writer.hpp"
#include "join/attribute_join.hpp"
#include "routing/route_planner.hpp"
#include "routing/straight_line_oracle.hpp"
#include "sample/constrained_sampler.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>

using namespace LAEP;
using namespace LAEP::APP;
using namespace LAEP::CORE;

namespace
{
  template <typename WriteFunction>
  bool write_output(const std::string &filename, WriteFunction write)
  {
    if (filename.empty())
      return true;
    std::ofstream ofs(filename);
    if (!ofs.is_open())
    {
      SPDLOG_CRITICAL("Cannot write to {}", filename);
      return false;
    }
    write(ofs);
    SPDLOG_INFO("Written {}", filename);
    return true;
  }

  int run(const LAEPAppConfig &config)
  {
    UTIL::TimePoint begin_time = UTIL::get_current_time();
    IO::BoundaryLoader loader(config.label_keys);
    IO::BoundaryLoadResult boundary = config.boundary_file.empty()
                                          ? loader.fallback()
                                          : loader.load_file(config.boundary_file);
    SPDLOG_INFO("Boundaries {} from {}: {} regions",
                IO::boundary_status_to_string(boundary.status), boundary.source,
                boundary.index->get_region_count());

    Box bbox = make_box(config.bbox[0], config.bbox[1], config.bbox[2], config.bbox[3]);
    std::mt19937 rng(config.seed);
    SAMPLE::ConstrainedSampler sampler(config.sampler_config);
    SAMPLE::SamplePoints samples = sampler.sample(*boundary.index, bbox, rng);
    SPDLOG_INFO("Sampled {} points", samples.size());

    if (!config.feature_file.empty())
    {
      FeatureCollection features = IO::read_geojson_file(config.feature_file);
      JOIN::AttributeJoin join(config.join_config);
      std::vector<JOIN::JoinResult> results;
      int resolved = 0;
      for (const Feature &feature : features)
      {
        results.push_back(join.resolve_region(feature, boundary.index.get()));
        if (results.back().resolved())
          ++resolved;
      }
      SPDLOG_INFO("Resolved {} of {} features", resolved, features.size());
      if (!write_output(config.feature_output, [&](std::ostream &os) {
            IO::write_join_csv(os, features, results);
          }))
        return EXIT_FAILURE;
    }

    std::vector<SAMPLE::SpeedCategory> speeds;
    for (const std::string &speed : config.speeds)
    {
      speeds.push_back(*SAMPLE::speed_category_from_string(speed));
    }
    SAMPLE::SamplePoints origins = SAMPLE::filter_samples(samples, {}, speeds);

    std::vector<ROUTING::PlannedRoute> routes;
    if (origins.empty())
    {
      SPDLOG_WARN("No origins left to plan routes from");
    }
    else
    {
      ROUTING::StraightLineOracle oracle(config.seconds_per_degree);
      ROUTING::RoutePlanner planner(oracle, bbox);
      routes = planner.plan(origins, config.planner_config, config.search_config,
                            config.seed);
    }

    if (!write_output(config.samples_output, [&](std::ostream &os) {
          IO::write_samples_geojson(os, samples);
        }) ||
        !write_output(config.routes_output, [&](std::ostream &os) {
          IO::write_routes_geojson(os, routes);
        }) ||
        !write_output(config.diagnostics_output, [&](std::ostream &os) {
          IO::write_route_diagnostics_csv(os, routes);
        }))
      return EXIT_FAILURE;

    UTIL::TimePoint end_time = UTIL::get_current_time();
    SPDLOG_INFO("Time takes {} s", UTIL::get_duration(begin_time, end_time));
    return EXIT_SUCCESS;
  }
}

int main(int argc, char **argv)
{
  try
  {
    LAEPAppConfig config(argc, argv);
    if (config.help_specified)
    {
      std::ostringstream oss;
      LAEPAppConfig::register_help(oss);
      std::cout << oss.str();
      return EXIT_SUCCESS;
    }
    if (!config.validate())
    {
      SPDLOG_CRITICAL("Validation fail, program stop");
      return EXIT_FAILURE;
    }
    config.print();
    return run(config);
  }
  catch (const std::exception &e)
  {
    SPDLOG_CRITICAL("laep failed: {}", e.what());
    return EXIT_FAILURE;
  }
}
