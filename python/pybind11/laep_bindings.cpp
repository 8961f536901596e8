// laep_bindings.cpp: pybind11 bindings for LAEP
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include "core/geometry.hpp"
#include "core/feature.hpp"
#include "region/region_index.hpp"
#include "io/geojson_reader.hpp"
#include "io/boundary_loader.hpp"
#include "io/result_writer.hpp"
#include "sample/constrained_sampler.hpp"
#include "join/attribute_join.hpp"
#include "routing/route_type.hpp"
#include "routing/routing_oracle.hpp"
#include "routing/osrm_oracle.hpp"
#include "routing/straight_line_oracle.hpp"
#include "routing/duration_search.hpp"
#include "routing/route_planner.hpp"
#include "util/debug.hpp"
#include "util/error.hpp"

#include <random>
#include <sstream>

namespace py = pybind11;
using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::REGION;
using namespace LAEP::IO;
using namespace LAEP::SAMPLE;
using namespace LAEP::JOIN;
using namespace LAEP::ROUTING;

namespace
{
    typedef std::tuple<double, double> XY;
    typedef std::tuple<double, double, double, double> XYBox;

    Point to_point(const XY &xy)
    {
        return Point(std::get<0>(xy), std::get<1>(xy));
    }

    XY from_point(const Point &p)
    {
        return XY(boost::geometry::get<0>(p), boost::geometry::get<1>(p));
    }

    Box to_box(const XYBox &b)
    {
        return make_box(std::get<0>(b), std::get<1>(b), std::get<2>(b), std::get<3>(b));
    }

    LineString to_linestring(const std::vector<XY> &coords)
    {
        LineString line;
        for (const XY &xy : coords)
            line.add_point(std::get<0>(xy), std::get<1>(xy));
        return line;
    }

    // Routing oracle implemented in Python. route() receives (lon, lat)
    // tuples and the timeout in seconds and returns an OracleReply.
    class PyRoutingOracle : public RoutingOracle
    {
    public:
        OracleReply route(const Point &origin, const Point &destination,
                          std::chrono::milliseconds timeout) override
        {
            py::gil_scoped_acquire gil;
            py::function override = py::get_override(
                static_cast<const RoutingOracle *>(this), "route");
            if (!override)
            {
                SPDLOG_ERROR("Python routing oracle does not implement route");
                return OracleReply::failure(RouteErrorCode::UNKNOWN_ERROR);
            }
            try
            {
                py::object reply = override(from_point(origin), from_point(destination),
                                            timeout.count() / 1000.0);
                return reply.cast<OracleReply>();
            }
            catch (const py::error_already_set &e)
            {
                SPDLOG_DEBUG("Python routing oracle raised {}", e.what());
                return OracleReply::failure(RouteErrorCode::TRANSPORT_EXCEPTION);
            }
            catch (const py::cast_error &e)
            {
                SPDLOG_DEBUG("Python routing oracle reply rejected: {}", e.what());
                return OracleReply::failure(RouteErrorCode::MALFORMED_RESPONSE);
            }
        }
    };

    class PyHttpTransport : public HttpTransport
    {
    public:
        HttpResponse get(const std::string &url,
                         std::chrono::milliseconds timeout) override
        {
            PYBIND11_OVERRIDE_PURE(HttpResponse, HttpTransport, get, url, timeout);
        }
    };
}

PYBIND11_MODULE(laep, m)
{
    m.doc() = "Local Area Energy Planning (LAEP) core Python bindings via pybind11";

    py::register_exception<GeometryError>(m, "GeometryError", PyExc_RuntimeError);
    py::register_exception<DegenerateInput>(m, "DegenerateInput", PyExc_ValueError);

    m.def("set_log_level", [](int level)
          { spdlog::set_level(static_cast<spdlog::level::level_enum>(level)); },
          py::arg("level"), R"pbdoc(
        Set the log level, 0 (trace) to 6 (off). Default is 2 (info).
    )pbdoc");

    // Enums
    py::enum_<SpeedCategory>(m, "SpeedCategory")
        .value("FAST", SpeedCategory::FAST, "Capacity gap below 250 kW")
        .value("MEDIUM", SpeedCategory::MEDIUM, "Capacity gap from 250 kW below 500 kW")
        .value("SLOW", SpeedCategory::SLOW, "Capacity gap of 500 kW or more")
        .export_values();

    py::enum_<JoinStatus>(m, "JoinStatus")
        .value("SPATIAL", JoinStatus::SPATIAL, "Label from the containing region")
        .value("PROPERTY", JoinStatus::PROPERTY, "Label from a feature property")
        .value("NOT_CONTAINED", JoinStatus::NOT_CONTAINED, "Point outside every region")
        .value("UNRESOLVABLE", JoinStatus::UNRESOLVABLE, "No usable geometry nor property")
        .export_values();

    py::enum_<RouteErrorCode>(m, "RouteErrorCode")
        .value("SUCCESS", RouteErrorCode::SUCCESS, "Route found")
        .value("TRANSPORT_STATUS", RouteErrorCode::TRANSPORT_STATUS, "Non-200 HTTP status")
        .value("NO_ROUTE", RouteErrorCode::NO_ROUTE, "Oracle reported no route")
        .value("MALFORMED_RESPONSE", RouteErrorCode::MALFORMED_RESPONSE, "Reply could not be read")
        .value("TRANSPORT_EXCEPTION", RouteErrorCode::TRANSPORT_EXCEPTION, "Transport raised an error")
        .value("UNKNOWN_ERROR", RouteErrorCode::UNKNOWN_ERROR, "Unknown error occurred")
        .export_values();

    py::enum_<BoundaryStatus>(m, "BoundaryStatus")
        .value("LOADED", BoundaryStatus::LOADED, "Boundaries read from the requested source")
        .value("FALLBACK", BoundaryStatus::FALLBACK, "Built-in boundaries substituted")
        .export_values();

    // RegionIndex class
    py::class_<RegionIndex, std::shared_ptr<RegionIndex>>(m, "RegionIndex", R"pbdoc(
        Labeled polygon regions with point containment and label lookup.

        Regions keep their insertion order. A point on a shared boundary or in an
        overlap gets the label of the region added first.

        Example:
            >>> index = laep.RegionIndex()
            >>> index.add_region("Manhattan", "MULTIPOLYGON(((0 0,1 0,1 1,0 1,0 0)))")
            >>> index.label_for_point((0.5, 0.5))
            'Manhattan'
    )pbdoc")
        .def(py::init<>())
        .def("add_region", [](RegionIndex &self, const std::string &label, const std::string &wkt)
             { return self.add_region(label, wkt2multipolygon(wkt)); },
             py::arg("label"), py::arg("wkt"), R"pbdoc(
            Add a region from a WKT polygon or multipolygon.

            Returns:
                bool: False when the geometry is invalid; the region is then skipped
        )pbdoc")
        .def("contains_point", [](const RegionIndex &self, const XY &p)
             { return self.contains_point(to_point(p)); }, py::arg("point"),
             "True when the (lon, lat) point lies in the union of all regions")
        .def("label_for_point", [](const RegionIndex &self, const XY &p)
             { return self.label_for_point(to_point(p)); }, py::arg("point"),
             "Label of the first region containing the point, or None")
        .def("get_region_count", &RegionIndex::get_region_count)
        .def("get_rejected_count", &RegionIndex::get_rejected_count)
        .def("get_labels", &RegionIndex::get_labels)
        .def("get_envelope", [](const RegionIndex &self)
             {
            Box box = self.get_envelope();
            return XYBox(box.min_corner().get<0>(), box.min_corner().get<1>(),
                         box.max_corner().get<0>(), box.max_corner().get<1>()); },
             "Envelope (minx, miny, maxx, maxy) of all regions");

    // Feature class
    py::class_<Feature>(m, "Feature", "A GeoJSON feature read by read_geojson_string or read_geojson_file")
        .def_readonly("id", &Feature::id, "Position of the feature in its collection")
        .def("get_property", [](const Feature &self, const std::string &key)
             { return lookup_property(self, {key}); }, py::arg("key"),
             "Property value as a string, or None when absent or null");

    m.def("read_geojson_string", &read_geojson_string, py::arg("text"),
          "Read a GeoJSON Feature or FeatureCollection");
    m.def("read_geojson_file", &read_geojson_file, py::arg("filename"),
          "Read a GeoJSON Feature or FeatureCollection file");

    // BoundaryLoader
    py::class_<BoundaryLoadResult>(m, "BoundaryLoadResult")
        .def_readonly("status", &BoundaryLoadResult::status)
        .def_readonly("source", &BoundaryLoadResult::source)
        .def_readonly("features", &BoundaryLoadResult::features)
        .def_readonly("index", &BoundaryLoadResult::index)
        .def("__repr__", [](const BoundaryLoadResult &r)
             { return "<Boundaries " + boundary_status_to_string(r.status) +
                      " source=" + r.source +
                      " regions=" + std::to_string(r.index->get_region_count()) + ">"; });

    py::class_<BoundaryLoader>(m, "BoundaryLoader", R"pbdoc(
        Loads region boundaries, substituting the built-in borough set when the
        source cannot be read or holds no usable polygon.
    )pbdoc")
        .def(py::init<const std::vector<std::string> &>(),
             py::arg("label_keys") = DEFAULT_LABEL_KEYS)
        .def("load_file", &BoundaryLoader::load_file, py::arg("filename"))
        .def("load_remote", &BoundaryLoader::load_remote, py::arg("fetch"), R"pbdoc(
            Load boundaries from a callable returning GeoJSON text.

            Any exception raised by the callable selects the built-in set.
        )pbdoc")
        .def("load_string", &BoundaryLoader::load_string, py::arg("text"),
             py::arg("source") = "string")
        .def("fallback", &BoundaryLoader::fallback);

    // Sampling
    py::class_<SamplePoint>(m, "SamplePoint")
        .def_readonly("id", &SamplePoint::id)
        .def_readonly("name", &SamplePoint::name)
        .def_property_readonly("point", [](const SamplePoint &self)
                               { return from_point(self.point); })
        .def_readonly("region", &SamplePoint::region)
        .def_readonly("existing_capacity", &SamplePoint::existing_capacity)
        .def_readonly("needed_capacity", &SamplePoint::needed_capacity)
        .def_readonly("capacity_gap", &SamplePoint::capacity_gap)
        .def_readonly("speed", &SamplePoint::speed)
        .def("__repr__", [](const SamplePoint &p)
             { return "<SamplePoint id=" + std::to_string(p.id) + " region=" + p.region +
                      " gap=" + std::to_string(p.capacity_gap) + " " +
                      speed_category_to_string(p.speed) + ">"; });

    py::class_<SamplerConfig>(m, "SamplerConfig")
        .def(py::init<int, int, double>(), py::arg("cols") = 18, py::arg("rows") = 12,
             py::arg("jitter_fraction") = 0.2)
        .def_readwrite("cols", &SamplerConfig::cols)
        .def_readwrite("rows", &SamplerConfig::rows)
        .def_readwrite("jitter_fraction", &SamplerConfig::jitter_fraction)
        .def_readwrite("existing_min", &SamplerConfig::existing_min)
        .def_readwrite("existing_max", &SamplerConfig::existing_max)
        .def_readwrite("needed_max", &SamplerConfig::needed_max)
        .def_readwrite("name_prefix", &SamplerConfig::name_prefix)
        .def_readwrite("unknown_label", &SamplerConfig::unknown_label)
        .def("validate", &SamplerConfig::validate);

    py::class_<ConstrainedSampler>(m, "ConstrainedSampler", R"pbdoc(
        Samples synthetic facility points on a jittered lattice over a box,
        keeping the points inside the regions.
    )pbdoc")
        .def(py::init<const SamplerConfig &>(), py::arg("config") = SamplerConfig())
        .def("sample", [](const ConstrainedSampler &self, const RegionIndex &index,
                          const XYBox &bbox, unsigned int seed)
             {
            std::mt19937 rng(seed);
            return self.sample(index, to_box(bbox), rng); },
             py::arg("index"), py::arg("bbox"), py::arg("seed"), R"pbdoc(
            Sample points over bbox (minx, miny, maxx, maxy).

            The same seed gives the same points.

            Raises:
                DegenerateInput: If the box has no area or the lattice is empty
        )pbdoc");

    m.def("filter_samples", [](const SamplePoints &points, const std::vector<std::string> &labels,
                               const std::vector<SpeedCategory> &speeds)
          { return filter_samples(points, labels, speeds); },
          py::arg("points"), py::arg("labels") = std::vector<std::string>(),
          py::arg("speeds") = std::vector<SpeedCategory>(),
          "Keep points in the given regions and speed categories, empty lists keep all");

    // Attribute join
    py::class_<JoinResult>(m, "JoinResult")
        .def_readonly("status", &JoinResult::status)
        .def_readonly("label", &JoinResult::label)
        .def("resolved", &JoinResult::resolved);

    py::class_<JoinConfig>(m, "JoinConfig")
        .def(py::init<>())
        .def_readwrite("property_keys", &JoinConfig::property_keys)
        .def_readwrite("verbose", &JoinConfig::verbose);

    py::class_<AttributeJoin>(m, "AttributeJoin", R"pbdoc(
        Resolves the region of arbitrary GeoJSON features, by containment of a
        representative point or by a region property when no index is given.
    )pbdoc")
        .def(py::init<const JoinConfig &>(), py::arg("config") = JoinConfig())
        .def("resolve_region", &AttributeJoin::resolve_region,
             py::arg("feature"), py::arg("index") = nullptr)
        .def("filter_features_by_region", &AttributeJoin::filter_features_by_region,
             py::arg("features"), py::arg("index"), py::arg("labels"))
        .def_static("representative_point", [](const Feature &feature)
                    {
                std::optional<Point> p = AttributeJoin::representative_point(feature);
                return p ? std::optional<XY>(from_point(*p)) : std::nullopt; },
                    py::arg("feature"));

    // Routing
    py::class_<RouteResult>(m, "RouteResult")
        .def(py::init<>())
        .def_property("geometry",
                      [](const RouteResult &self)
                      { return self.geometry.to_xy_pairs(); },
                      [](RouteResult &self, const std::vector<XY> &coords)
                      { self.geometry = to_linestring(coords); },
                      "Route vertices as a list of (lon, lat)")
        .def_readwrite("duration_s", &RouteResult::duration_s)
        .def_readwrite("distance_m", &RouteResult::distance_m)
        .def_readwrite("status", &RouteResult::status)
        .def_readwrite("attempts", &RouteResult::attempts)
        .def("__repr__", [](const RouteResult &r)
             { return "<Route duration=" + std::to_string(r.duration_s) +
                      " distance=" + std::to_string(r.distance_m) +
                      " attempts=" + std::to_string(r.attempts) + ">"; });

    py::class_<OracleReply>(m, "OracleReply")
        .def_readonly("error_code", &OracleReply::error_code)
        .def_readonly("route", &OracleReply::route)
        .def("ok", &OracleReply::ok)
        .def_static("failure", &OracleReply::failure, py::arg("code"))
        .def_static("success", &OracleReply::success, py::arg("route"));

    py::class_<RoutingOracle, PyRoutingOracle, std::shared_ptr<RoutingOracle>>(m, "RoutingOracle", R"pbdoc(
        Base class of routing oracles. Subclass it in Python and implement
        route(origin, destination, timeout_s) returning an OracleReply.
        Exceptions raised by route() count as a failed attempt.
    )pbdoc")
        .def(py::init<>());

    py::class_<StraightLineOracle, RoutingOracle, std::shared_ptr<StraightLineOracle>>(m, "StraightLineOracle")
        .def(py::init<double, double>(), py::arg("seconds_per_degree") = 6000,
             py::arg("meters_per_degree") = 111000);

    py::class_<HttpResponse>(m, "HttpResponse")
        .def(py::init([](int status, const std::string &body)
                      { return HttpResponse{status, body}; }),
             py::arg("status"), py::arg("body"))
        .def_readwrite("status", &HttpResponse::status)
        .def_readwrite("body", &HttpResponse::body);

    py::class_<HttpTransport, PyHttpTransport, std::shared_ptr<HttpTransport>>(m, "HttpTransport", R"pbdoc(
        Base class of HTTP transports. Implement get(url, timeout) returning an
        HttpResponse.
    )pbdoc")
        .def(py::init<>());

    py::class_<OsrmConfig>(m, "OsrmConfig")
        .def(py::init<>())
        .def_readwrite("base_url", &OsrmConfig::base_url);

    py::class_<OsrmRoutingOracle, RoutingOracle, std::shared_ptr<OsrmRoutingOracle>>(m, "OsrmRoutingOracle")
        .def(py::init<std::shared_ptr<HttpTransport>, const OsrmConfig &>(),
             py::arg("transport"), py::arg("config") = OsrmConfig())
        .def("build_url", [](const OsrmRoutingOracle &self, const XY &o, const XY &d)
             { return self.build_url(to_point(o), to_point(d)); },
             py::arg("origin"), py::arg("destination"))
        .def_static("parse_response", &OsrmRoutingOracle::parse_response, py::arg("body"));

    py::class_<DurationSearchConfig>(m, "DurationSearchConfig")
        .def(py::init<double, int, double, double>(), py::arg("target_duration_s") = 2700,
             py::arg("max_attempts") = 7, py::arg("tolerance_fraction") = 0.1,
             py::arg("growth_factor") = 1.4)
        .def_readwrite("target_duration_s", &DurationSearchConfig::target_duration_s)
        .def_readwrite("max_attempts", &DurationSearchConfig::max_attempts)
        .def_readwrite("tolerance_fraction", &DurationSearchConfig::tolerance_fraction)
        .def_readwrite("growth_factor", &DurationSearchConfig::growth_factor)
        .def_readwrite("base_radius", &DurationSearchConfig::base_radius)
        .def_readwrite("attempt_scale", &DurationSearchConfig::attempt_scale)
        .def_readwrite("oracle_timeout", &DurationSearchConfig::oracle_timeout)
        .def_readwrite("politeness_delay", &DurationSearchConfig::politeness_delay)
        .def_readwrite("strict_tolerance", &DurationSearchConfig::strict_tolerance)
        .def("get_base_radius", &DurationSearchConfig::get_base_radius)
        .def("validate", &DurationSearchConfig::validate);

    py::class_<SearchStats>(m, "SearchStats")
        .def_readonly("attempts", &SearchStats::attempts)
        .def_readonly("oracle_failures", &SearchStats::oracle_failures)
        .def_readonly("within_tolerance", &SearchStats::within_tolerance)
        .def_readonly("cancelled", &SearchStats::cancelled);

    py::class_<TargetDurationSearch>(m, "TargetDurationSearch", R"pbdoc(
        Searches for a route from an origin whose duration is close to a target,
        probing random bearings at growing radii inside a bounding box.
    )pbdoc")
        .def(py::init([](RoutingOracle &oracle, const XYBox &bbox)
                      { return new TargetDurationSearch(oracle, to_box(bbox)); }),
             py::arg("oracle"), py::arg("bbox"), py::keep_alive<1, 2>())
        .def("search", [](const TargetDurationSearch &self, const XY &origin,
                          const DurationSearchConfig &config, unsigned int seed)
             {
            std::mt19937 rng(seed);
            SearchStats stats;
            std::optional<RouteResult> route;
            {
                py::gil_scoped_release release;
                route = self.search(to_point(origin), config, rng, nullptr, &stats);
            }
            return std::make_pair(route, stats); },
             py::arg("origin"), py::arg("config"), py::arg("seed"), R"pbdoc(
            Run one search.

            Returns:
                (RouteResult or None, SearchStats)
        )pbdoc");

    py::class_<PlannerConfig>(m, "PlannerConfig")
        .def(py::init<>())
        .def_readwrite("routes_per_region", &PlannerConfig::routes_per_region)
        .def_readwrite("candidates_per_region", &PlannerConfig::candidates_per_region)
        .def_readwrite("regions", &PlannerConfig::regions)
        .def_readwrite("num_threads", &PlannerConfig::num_threads)
        .def_readwrite("origin_delay", &PlannerConfig::origin_delay);

    py::class_<PlannedRoute>(m, "PlannedRoute")
        .def_readonly("region", &PlannedRoute::region)
        .def_readonly("origin_id", &PlannedRoute::origin_id)
        .def_property_readonly("origin", [](const PlannedRoute &self)
                               { return from_point(self.origin); })
        .def_readonly("route", &PlannedRoute::route);

    py::class_<RoutePlanner>(m, "RoutePlanner")
        .def(py::init([](RoutingOracle &oracle, const XYBox &bbox)
                      { return new RoutePlanner(oracle, to_box(bbox)); }),
             py::arg("oracle"), py::arg("bbox"), py::keep_alive<1, 2>())
        .def("plan", [](const RoutePlanner &self, const SamplePoints &origins,
                        const PlannerConfig &planner_config,
                        const DurationSearchConfig &search_config, unsigned int seed)
             { return self.plan(origins, planner_config, search_config, seed); },
             py::arg("origins"), py::arg("planner_config"), py::arg("search_config"),
             py::arg("seed"), py::call_guard<py::gil_scoped_release>(), R"pbdoc(
            Plan routes from the origins, routes_per_region per region.

            Returns:
                List of PlannedRoute grouped by region
        )pbdoc");

    // Writers
    m.def("samples_to_geojson", [](const SamplePoints &points)
          {
        std::ostringstream oss;
        write_samples_geojson(oss, points);
        return oss.str(); }, py::arg("points"));
    m.def("routes_to_geojson", [](const std::vector<PlannedRoute> &routes)
          {
        std::ostringstream oss;
        write_routes_geojson(oss, routes);
        return oss.str(); }, py::arg("routes"));
    m.def("routes_to_csv", [](const std::vector<PlannedRoute> &routes)
          {
        std::ostringstream oss;
        write_route_diagnostics_csv(oss, routes);
        return oss.str(); }, py::arg("routes"));
}
