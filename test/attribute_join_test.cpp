#include "catch2/catch.hpp"

#include "util/debug.hpp"
#include "io/geojson_reader.hpp"
#include "join/attribute_join.hpp"

#include <boost/property_tree/ptree.hpp>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::IO;
using namespace LAEP::REGION;
using namespace LAEP::JOIN;

namespace
{
  Feature make_feature(const std::string &json)
  {
    FeatureCollection features = read_geojson_string(json);
    REQUIRE(features.size() == 1);
    return features[0];
  }
}

TEST_CASE("attribute join is tested", "[join]")
{
  spdlog::set_level(spdlog::level::warn);
  std::vector<RegionInput> inputs = {
      {"Manhattan", wkt2multipolygon("POLYGON((0 0,0 2,2 2,2 0,0 0))")},
      {"Brooklyn", wkt2multipolygon("POLYGON((3 0,3 2,5 2,5 0,3 0))")}};
  auto index = RegionIndex::build(inputs);
  AttributeJoin join;

  SECTION("point_feature_test")
  {
    Feature f = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"Point","coordinates":[1.0, 1.0]}})");
    JoinResult result = join.resolve_region(f, index.get());
    REQUIRE(result.status == JoinStatus::SPATIAL);
    REQUIRE(result.label == "Manhattan");
  }
  SECTION("polygon_centroid_test")
  {
    Feature f = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"Polygon","coordinates":[[[3.5,0.5],[4.5,0.5],[4.5,1.5],[3.5,1.5],[3.5,0.5]]]}})");
    std::optional<Point> p = AttributeJoin::representative_point(f);
    REQUIRE(p);
    REQUIRE(p->get<0>() == Approx(4.0));
    REQUIRE(p->get<1>() == Approx(1.0));
    JoinResult result = join.resolve_region(f, index.get());
    REQUIRE(result.status == JoinStatus::SPATIAL);
    REQUIRE(result.label == "Brooklyn");
  }
  SECTION("linestring_centroid_test")
  {
    Feature f = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"LineString","coordinates":[[0.5,1.0],[1.5,1.0]]}})");
    std::optional<Point> p = AttributeJoin::representative_point(f);
    REQUIRE(p);
    REQUIRE(p->get<0>() == Approx(1.0));
    REQUIRE(join.resolve_region(f, index.get()).label == "Manhattan");
  }
  SECTION("missing_geometry_test")
  {
    Feature f = make_feature(R"({"type":"Feature","properties":{"borough":"Queens"}})");
    JoinResult result;
    REQUIRE_NOTHROW(result = join.resolve_region(f, index.get()));
    REQUIRE(result.status == JoinStatus::UNRESOLVABLE);
    REQUIRE_FALSE(result.resolved());
  }
  SECTION("null_geometry_test")
  {
    Feature f = make_feature(R"({"type":"Feature","properties":{},"geometry":null})");
    REQUIRE(join.resolve_region(f, index.get()).status == JoinStatus::UNRESOLVABLE);
  }
  SECTION("malformed_coordinates_test")
  {
    Feature non_numeric = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"Point","coordinates":["a", 1.0]}})");
    Feature single = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"Point","coordinates":[1.0]}})");
    Feature empty = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"Point","coordinates":[]}})");
    Feature nested = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"Point","coordinates":[[1.0, 1.0], 2.0]}})");
    Feature quoted = make_feature(R"({"type":"Feature","properties":{},
      "geometry":{"type":"Point","coordinates":["1.0", "1.0"]}})");
    REQUIRE(join.resolve_region(non_numeric, index.get()).status == JoinStatus::UNRESOLVABLE);
    REQUIRE(join.resolve_region(single, index.get()).status == JoinStatus::UNRESOLVABLE);
    REQUIRE(join.resolve_region(empty, index.get()).status == JoinStatus::UNRESOLVABLE);
    REQUIRE(join.resolve_region(nested, index.get()).status == JoinStatus::UNRESOLVABLE);
    REQUIRE(join.resolve_region(quoted, index.get()).status == JoinStatus::UNRESOLVABLE);
    REQUIRE_FALSE(AttributeJoin::representative_point(quoted));
  }
  SECTION("not_contained_test")
  {
    Feature f = make_feature(R"({"type":"Feature","properties":{"borough":"Manhattan"},
      "geometry":{"type":"Point","coordinates":[2.5, 1.0]}})");
    JoinResult result = join.resolve_region(f, index.get());
    REQUIRE(result.status == JoinStatus::NOT_CONTAINED);
    REQUIRE(result.label.empty());
  }
  SECTION("property_fallback_test")
  {
    Feature f = make_feature(R"({"type":"Feature","properties":{"BoroName":"Bronx"},
      "geometry":{"type":"Point","coordinates":[100, 100]}})");
    JoinResult result = join.resolve_region(f, nullptr);
    REQUIRE(result.status == JoinStatus::PROPERTY);
    REQUIRE(result.label == "Bronx");
    RegionIndex empty_index;
    REQUIRE(join.resolve_region(f, &empty_index).label == "Bronx");
    Feature unlabeled = make_feature(R"({"type":"Feature","properties":{"borough":null}})");
    REQUIRE(join.resolve_region(unlabeled, nullptr).status == JoinStatus::UNRESOLVABLE);
  }
  SECTION("filter_features_by_region_test")
  {
    FeatureCollection features = read_geojson_string(R"({"type":"FeatureCollection","features":[
      {"type":"Feature","properties":{},"geometry":{"type":"Point","coordinates":[1, 1]}},
      {"type":"Feature","properties":{},"geometry":{"type":"Point","coordinates":[4, 1]}},
      {"type":"Feature","properties":{},"geometry":{"type":"Point","coordinates":[9, 9]}},
      {"type":"Feature","properties":{}},
      {"type":"Feature","properties":{},"geometry":{"type":"Point","coordinates":[0.5, 0.5]}}
    ]})");
    FeatureCollection manhattan = join.filter_features_by_region(
        features, index.get(), {"Manhattan"});
    REQUIRE(manhattan.size() == 2);
    REQUIRE(manhattan[0].id == 0);
    REQUIRE(manhattan[1].id == 4);
    FeatureCollection all = join.filter_features_by_region(features, index.get(), {});
    REQUIRE(all.size() == 3);
  }
}

TEST_CASE("geojson reader is tested", "[io]")
{
  spdlog::set_level(spdlog::level::warn);
  SECTION("feature_collection_test")
  {
    FeatureCollection features = read_geojson_string(R"({"type":"FeatureCollection","features":[
      {"type":"Feature","properties":{"boro_name":"Queens","name.with.dots":"x"},
       "geometry":{"type":"MultiPolygon","coordinates":[[[[0,0],[1,0],[1,1],[0,1],[0,0]]],
                                                        [[[2,0],[3,0],[3,1],[2,1],[2,0]]]]}},
      {"type":"Feature","properties":{},
       "geometry":{"type":"Polygon","coordinates":[[[0,0],[4,0],[4,4],[0,4],[0,0]],
                                                   [[1,1],[2,1],[2,2],[1,2],[1,1]]]}},
      {"type":"Feature","properties":{"boro_name":"Bronx"},
       "geometry":{"type":"Point","coordinates":[0,0]}}
    ]})");
    REQUIRE(features.size() == 3);
    REQUIRE(lookup_property(features[0], {"name.with.dots"}) == std::string("x"));
    REQUIRE(lookup_property(features[0], {"borough", "boro_name"}) == std::string("Queens"));
    REQUIRE_FALSE(lookup_property(features[1], {"boro_name"}));

    MultiPolygon mpoly;
    REQUIRE(parse_polygonal_geometry(features[0].node.get_child("geometry"), &mpoly));
    REQUIRE(mpoly.size() == 2);
    REQUIRE(parse_polygonal_geometry(features[1].node.get_child("geometry"), &mpoly));
    REQUIRE(mpoly.size() == 1);
    REQUIRE(mpoly[0].inners().size() == 1);
    REQUIRE_FALSE(parse_polygonal_geometry(features[2].node.get_child("geometry"), &mpoly));

    int skipped = 0;
    std::vector<RegionInput> inputs = features_to_regions(
        features, DEFAULT_LABEL_KEYS, &skipped);
    REQUIRE(inputs.size() == 2);
    REQUIRE(skipped == 1);
    REQUIRE(inputs[0].label == "Queens");
    REQUIRE(inputs[1].label == "Unknown");
  }
  SECTION("invalid_document_test")
  {
    REQUIRE_THROWS(read_geojson_string("{not json"));
    REQUIRE_THROWS(read_geojson_string(R"({"type":"FeatureCollection"})"));
    REQUIRE_THROWS(read_geojson_file("no_such_file.geojson"));
  }
}
