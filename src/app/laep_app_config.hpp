/**
 * LAEP core.
 *
 * Configuration of the laep command line application
 */

#ifndef LAEP_APP_LAEP_APP_CONFIG_HPP_
#define LAEP_APP_LAEP_APP_CONFIG_HPP_

#include "join/attribute_join.hpp"
#include "routing/duration_search.hpp"
#include "routing/route_planner.hpp"
#include "sample/constrained_sampler.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <cxxopts.hpp>

namespace LAEP
{
  namespace APP
  {
    /**
     * Bounding box of New York City used when no box is given
     */
    extern const double NYC_BBOX[4];

    /**
     * Configuration of the laep application, read from the command line
     * or from an XML file passed with --config.
     */
    class LAEPAppConfig
    {
    public:
      /**
       * Parse the command line. An argument of "--config file.xml" loads
       * every setting from the XML file instead.
       */
      LAEPAppConfig(int argc, char **argv);

      /**
       * Load configuration from an XML file
       */
      void load_xml(const std::string &file);

      /**
       * Load configuration from parsed arguments
       */
      void load_arguments(const cxxopts::ParseResult &result);

      /**
       * Register the command line options
       */
      static void register_arg(cxxopts::Options &options);

      /**
       * Print the help text of every option
       */
      static void register_help(std::ostringstream &oss);

      /**
       * Check input files, output directories and every algorithm config
       * @return true when the application can run
       */
      bool validate() const;

      void print() const;

      std::string boundary_file;    /**< region GeoJSON, empty for the built-in set */
      std::string feature_file;     /**< features to filter by region, optional */
      std::string feature_output;   /**< ids and regions of the joined features */
      std::string samples_output = "samples.geojson";
      std::string routes_output = "routes.geojson";
      std::string diagnostics_output = "routes.csv";
      std::vector<std::string> label_keys; /**< boundary label keys */
      std::vector<std::string> speeds;     /**< speed categories kept for routing */
      double bbox[4];                      /**< minx miny maxx maxy */
      unsigned int seed = 42;
      double seconds_per_degree = 6000;    /**< synthetic oracle speed */
      int log_level = 2;                   /**< 0 trace to 6 off */
      bool help_specified = false;

      SAMPLE::SamplerConfig sampler_config;
      ROUTING::DurationSearchConfig search_config;
      ROUTING::PlannerConfig planner_config;
      JOIN::JoinConfig join_config;
    };

  } // APP
} // LAEP

#endif // LAEP_APP_LAEP_APP_CONFIG_HPP_
