#include "app/laep_app_config.hpp"
#include "core/geometry.hpp"
#include "io/geojson_reader.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <limits>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

using namespace LAEP;
using namespace LAEP::APP;
using namespace LAEP::UTIL;

namespace pt = boost::property_tree;

const double LAEP::APP::NYC_BBOX[4] = {-74.25559, 40.49612, -73.70001, 40.91553};

namespace
{
  // minx,miny,maxx,maxy; leaves NaN corners on a bad string
  void parse_bbox(const std::string &str, double *bbox)
  {
    std::vector<std::string> parts = split_string(str);
    for (int i = 0; i < 4; ++i)
      bbox[i] = std::numeric_limits<double>::quiet_NaN();
    if (parts.size() != 4)
    {
      SPDLOG_CRITICAL("Bounding box {} should have 4 values", str);
      return;
    }
    try
    {
      for (int i = 0; i < 4; ++i)
        bbox[i] = std::stod(parts[i]);
    }
    catch (const std::exception &e)
    {
      SPDLOG_CRITICAL("Bounding box {} is not numeric: {}", str, e.what());
      for (int i = 0; i < 4; ++i)
        bbox[i] = std::numeric_limits<double>::quiet_NaN();
    }
  }

  bool output_folder_exists(const std::string &file)
  {
    if (file.empty())
      return true;
    std::string folder = get_file_directory(file);
    if (!folder_exist(folder))
    {
      SPDLOG_CRITICAL("Output folder {} not exists", folder);
      return false;
    }
    return true;
  }
}

LAEPAppConfig::LAEPAppConfig(int argc, char **argv)
    : label_keys(IO::DEFAULT_LABEL_KEYS)
{
  for (int i = 0; i < 4; ++i)
    bbox[i] = NYC_BBOX[i];
  spdlog::set_pattern("[%l][%s:%-3#] %v");
  if (argc == 2)
  {
    std::string first_arg(argv[1]);
    if (first_arg == "--help" || first_arg == "-h")
    {
      help_specified = true;
      return;
    }
  }
  if (argc == 3 && std::string(argv[1]) == "--config")
  {
    load_xml(argv[2]);
  }
  else
  {
    cxxopts::Options options("laep",
                             "Sample depots inside borough boundaries and "
                             "plan target-duration routes");
    register_arg(options);
    auto result = options.parse(argc, argv);
    if (result.count("help") > 0)
    {
      help_specified = true;
      return;
    }
    load_arguments(result);
  }
  spdlog::set_level(static_cast<spdlog::level::level_enum>(log_level));
}

void LAEPAppConfig::load_xml(const std::string &file)
{
  SPDLOG_INFO("Read configuration from xml file {}", file);
  pt::ptree tree;
  pt::read_xml(file, tree);
  boundary_file = tree.get("config.input.boundary", std::string());
  feature_file = tree.get("config.input.features", std::string());
  auto keys = tree.get_optional<std::string>("config.input.label_keys");
  if (keys)
    label_keys = split_string(*keys);
  auto box = tree.get_optional<std::string>("config.input.bbox");
  if (box)
    parse_bbox(*box, bbox);
  feature_output = tree.get("config.output.features", feature_output);
  samples_output = tree.get("config.output.samples", samples_output);
  routes_output = tree.get("config.output.routes", routes_output);
  diagnostics_output = tree.get("config.output.diagnostics", diagnostics_output);
  auto speed_list = tree.get_optional<std::string>("config.other.speeds");
  if (speed_list)
    speeds = split_string(*speed_list);
  seed = tree.get("config.other.seed", seed);
  seconds_per_degree = tree.get("config.other.seconds_per_degree", seconds_per_degree);
  log_level = tree.get("config.other.log_level", log_level);
  sampler_config = SAMPLE::SamplerConfig::load_from_ptree(tree);
  search_config = ROUTING::DurationSearchConfig::load_from_ptree(tree);
  planner_config = ROUTING::PlannerConfig::load_from_ptree(tree);
  join_config = JOIN::JoinConfig::load_from_ptree(tree);
  SPDLOG_INFO("Finish with reading xml configuration");
}

void LAEPAppConfig::load_arguments(const cxxopts::ParseResult &result)
{
  boundary_file = result["boundary"].as<std::string>();
  feature_file = result["features"].as<std::string>();
  feature_output = result["feature_output"].as<std::string>();
  samples_output = result["samples"].as<std::string>();
  routes_output = result["routes"].as<std::string>();
  diagnostics_output = result["diagnostics"].as<std::string>();
  if (result.count("label_keys") > 0)
    label_keys = split_string(result["label_keys"].as<std::string>());
  if (result.count("bbox") > 0)
    parse_bbox(result["bbox"].as<std::string>(), bbox);
  speeds = split_string(result["speeds"].as<std::string>());
  seed = result["seed"].as<unsigned int>();
  seconds_per_degree = result["seconds_per_degree"].as<double>();
  log_level = result["log_level"].as<int>();

  sampler_config.cols = result["cols"].as<int>();
  sampler_config.rows = result["rows"].as<int>();
  sampler_config.jitter_fraction = result["jitter"].as<double>();

  search_config.target_duration_s = result["target"].as<double>();
  search_config.max_attempts = result["max_attempts"].as<int>();
  search_config.tolerance_fraction = result["tolerance"].as<double>();
  search_config.growth_factor = result["growth"].as<double>();
  if (result.count("base_radius") > 0)
    search_config.base_radius = result["base_radius"].as<double>();
  search_config.strict_tolerance = result["strict"].as<bool>();

  planner_config.routes_per_region = result["routes_per_region"].as<int>();
  planner_config.candidates_per_region = result["candidates"].as<int>();
  planner_config.regions = split_string(result["regions"].as<std::string>());
  planner_config.num_threads = result["threads"].as<int>();

  join_config.verbose = result["verbose_join"].as<bool>();
}

void LAEPAppConfig::register_arg(cxxopts::Options &options)
{
  options.add_options()
      ("b,boundary", "Region GeoJSON file",
       cxxopts::value<std::string>()->default_value(""))
      ("f,features", "GeoJSON features filtered by region",
       cxxopts::value<std::string>()->default_value(""))
      ("feature_output", "CSV of the features kept",
       cxxopts::value<std::string>()->default_value(""))
      ("samples", "Sample point GeoJSON output",
       cxxopts::value<std::string>()->default_value("samples.geojson"))
      ("routes", "Route GeoJSON output",
       cxxopts::value<std::string>()->default_value("routes.geojson"))
      ("diagnostics", "Route diagnostics CSV output",
       cxxopts::value<std::string>()->default_value("routes.csv"))
      ("label_keys", "Boundary label keys",
       cxxopts::value<std::string>())
      ("bbox", "Sampling box minx,miny,maxx,maxy",
       cxxopts::value<std::string>())
      ("speeds", "Speed categories routed",
       cxxopts::value<std::string>()->default_value(""))
      ("seed", "Random seed",
       cxxopts::value<unsigned int>()->default_value("42"))
      ("seconds_per_degree", "Synthetic oracle speed",
       cxxopts::value<double>()->default_value("6000"))
      ("l,log_level", "Log level",
       cxxopts::value<int>()->default_value("2"))
      ("cols", "Lattice columns",
       cxxopts::value<int>()->default_value("18"))
      ("rows", "Lattice rows",
       cxxopts::value<int>()->default_value("12"))
      ("jitter", "Jitter fraction of a cell",
       cxxopts::value<double>()->default_value("0.2"))
      ("t,target", "Target duration in seconds",
       cxxopts::value<double>()->default_value("2700"))
      ("max_attempts", "Oracle calls per search",
       cxxopts::value<int>()->default_value("7"))
      ("tolerance", "Tolerance fraction of the target",
       cxxopts::value<double>()->default_value("0.1"))
      ("growth", "Radius growth factor",
       cxxopts::value<double>()->default_value("1.4"))
      ("base_radius", "Base radius in degrees",
       cxxopts::value<double>())
      ("strict", "Drop results outside the tolerance",
       cxxopts::value<bool>()->default_value("false"))
      ("routes_per_region", "Routes per region",
       cxxopts::value<int>()->default_value("3"))
      ("candidates", "Origins tried per region, 0 for all",
       cxxopts::value<int>()->default_value("0"))
      ("regions", "Regions planned",
       cxxopts::value<std::string>()->default_value(""))
      ("threads", "Worker threads",
       cxxopts::value<int>()->default_value("1"))
      ("verbose_join", "Log unresolved features",
       cxxopts::value<bool>()->default_value("false"))
      ("h,help", "Help information");
}

void LAEPAppConfig::register_help(std::ostringstream &oss)
{
  oss << "laep argument lists:\n";
  oss << "-b/--boundary (optional) <string>: region GeoJSON, built-in set if empty\n";
  oss << "-f/--features (optional) <string>: GeoJSON features filtered by region\n";
  oss << "--feature_output (optional) <string>: CSV of the features kept\n";
  oss << "--samples (optional) <string>: samples GeoJSON (samples.geojson)\n";
  oss << "--routes (optional) <string>: routes GeoJSON (routes.geojson)\n";
  oss << "--diagnostics (optional) <string>: route CSV (routes.csv)\n";
  oss << "--label_keys (optional) <string>: boundary label keys (boro_name,BoroName,borough)\n";
  oss << "--bbox (optional) <string>: minx,miny,maxx,maxy (New York City)\n";
  oss << "--speeds (optional) <string>: speed categories routed (all)\n";
  oss << "--seed (optional) <int>: random seed (42)\n";
  oss << "--seconds_per_degree (optional) <double>: synthetic oracle speed (6000)\n";
  oss << "-l/--log_level (optional) <int>: log level (2)\n";
  oss << "--cols (optional) <int>: lattice columns (18)\n";
  oss << "--rows (optional) <int>: lattice rows (12)\n";
  oss << "--jitter (optional) <double>: jitter fraction (0.2)\n";
  oss << "-t/--target (optional) <double>: target duration in seconds (2700)\n";
  oss << "--max_attempts (optional) <int>: oracle calls per search (7)\n";
  oss << "--tolerance (optional) <double>: tolerance fraction (0.1)\n";
  oss << "--growth (optional) <double>: radius growth factor (1.4)\n";
  oss << "--base_radius (optional) <double>: base radius in degrees\n";
  oss << "--strict (optional): drop results outside the tolerance\n";
  oss << "--routes_per_region (optional) <int>: routes per region (3)\n";
  oss << "--candidates (optional) <int>: origins tried per region (all)\n";
  oss << "--regions (optional) <string>: regions planned (all)\n";
  oss << "--threads (optional) <int>: worker threads (1)\n";
  oss << "--verbose_join (optional): log unresolved features\n";
  oss << "--config <string>: read every option from an XML file\n";
}

bool LAEPAppConfig::validate() const
{
  SPDLOG_DEBUG("Validate laep configuration");
  bool valid = true;
  if (!boundary_file.empty() && !file_exists(boundary_file))
  {
    // The loader falls back to the built-in set, report it only
    SPDLOG_WARN("Boundary file {} not found", boundary_file);
  }
  if (!feature_file.empty() && !file_exists(feature_file))
  {
    SPDLOG_CRITICAL("Feature file {} not found", feature_file);
    valid = false;
  }
  if (!feature_file.empty() && !check_file_extension(feature_file, "json,geojson"))
  {
    SPDLOG_CRITICAL("Feature file {} should be json or geojson", feature_file);
    valid = false;
  }
  if ((!samples_output.empty() && !check_file_extension(samples_output, "json,geojson")) ||
      (!routes_output.empty() && !check_file_extension(routes_output, "json,geojson")))
  {
    SPDLOG_CRITICAL("Sample and route outputs should be json or geojson");
    valid = false;
  }
  if ((!diagnostics_output.empty() && !check_file_extension(diagnostics_output, "csv,txt")) ||
      (!feature_output.empty() && !check_file_extension(feature_output, "csv,txt")))
  {
    SPDLOG_CRITICAL("Diagnostics and feature outputs should be csv or txt");
    valid = false;
  }
  if (!output_folder_exists(samples_output) ||
      !output_folder_exists(routes_output) ||
      !output_folder_exists(diagnostics_output) ||
      !output_folder_exists(feature_output))
  {
    valid = false;
  }
  if (CORE::is_degenerate(CORE::make_box(bbox[0], bbox[1], bbox[2], bbox[3])))
  {
    SPDLOG_CRITICAL("Bounding box should have a positive area");
    valid = false;
  }
  for (const std::string &speed : speeds)
  {
    if (!SAMPLE::speed_category_from_string(speed))
    {
      SPDLOG_CRITICAL("Speed category {} should be Fast, Medium or Slow", speed);
      valid = false;
    }
  }
  if (!(seconds_per_degree > 0))
  {
    SPDLOG_CRITICAL("Seconds per degree {} should be positive", seconds_per_degree);
    valid = false;
  }
  if (log_level < 0 || log_level > static_cast<int>(spdlog::level::off))
  {
    SPDLOG_CRITICAL("Invalid log_level {}, should be 0 - 6", log_level);
    valid = false;
  }
  if (!sampler_config.validate() || !search_config.validate() ||
      !planner_config.validate())
  {
    valid = false;
  }
  return valid;
}

void LAEPAppConfig::print() const
{
  SPDLOG_INFO("----   Print configuration    ----");
  SPDLOG_INFO("Boundary file {}", boundary_file.empty() ? "builtin" : boundary_file);
  SPDLOG_INFO("Label keys {}", label_keys);
  SPDLOG_INFO("Feature file {} output {}", feature_file, feature_output);
  SPDLOG_INFO("Outputs {} {} {}", samples_output, routes_output, diagnostics_output);
  SPDLOG_INFO("Bbox {} {} {} {}", bbox[0], bbox[1], bbox[2], bbox[3]);
  SPDLOG_INFO("Speeds {} seed {} seconds per degree {}", speeds, seed,
              seconds_per_degree);
  SPDLOG_INFO("Log level {}", log_level);
  sampler_config.print();
  search_config.print();
  planner_config.print();
  join_config.print();
  SPDLOG_INFO("---- Print configuration done ----");
}
