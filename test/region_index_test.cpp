#include "catch2/catch.hpp"

#include "util/debug.hpp"
#include "util/error.hpp"
#include "region/region_index.hpp"

#include <limits>

using namespace LAEP;
using namespace LAEP::CORE;
using namespace LAEP::REGION;

TEST_CASE("region index is tested", "[region]")
{
  spdlog::set_level(spdlog::level::warn);
  std::vector<RegionInput> inputs = {
      {"A", wkt2multipolygon("POLYGON((0 0,0 2,2 2,2 0,0 0))")},
      {"B", wkt2multipolygon("POLYGON((1 1,1 3,3 3,3 1,1 1))")}};
  std::shared_ptr<RegionIndex> index = RegionIndex::build(inputs);

  SECTION("contains_point_test")
  {
    REQUIRE(index->contains_point(Point(0.5, 0.5)));
    REQUIRE(index->contains_point(Point(2.5, 2.5)));
    REQUIRE_FALSE(index->contains_point(Point(5, 5)));
    REQUIRE_FALSE(index->contains_point(Point(2.5, 0.5)));
    // Boundary points are inside
    REQUIRE(index->contains_point(Point(0, 1)));
  }
  SECTION("label_first_match_wins_test")
  {
    REQUIRE(index->label_for_point(Point(0.5, 0.5)) == std::string("A"));
    REQUIRE(index->label_for_point(Point(1.5, 1.5)) == std::string("A"));
    REQUIRE(index->label_for_point(Point(2.5, 2.5)) == std::string("B"));
    REQUIRE_FALSE(index->label_for_point(Point(5, 5)));
    REQUIRE_FALSE(index->label_for_point(Point(2.5, 0.5)));
  }
  SECTION("shared_boundary_test")
  {
    std::vector<RegionInput> adjacent = {
        {"West", wkt2multipolygon("POLYGON((0 0,0 1,1 1,1 0,0 0))")},
        {"East", wkt2multipolygon("POLYGON((1 0,1 1,2 1,2 0,1 0))")}};
    auto adjacent_index = RegionIndex::build(adjacent);
    REQUIRE(adjacent_index->label_for_point(Point(1, 0.5)) == std::string("West"));
    REQUIRE(adjacent_index->contains_point(Point(1, 0.5)));
  }
  SECTION("non_finite_point_test")
  {
    double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_FALSE(index->contains_point(Point(nan, 1)));
    REQUIRE_FALSE(index->label_for_point(Point(1, nan)));
  }
  SECTION("accessors_test")
  {
    REQUIRE(index->get_region_count() == 2);
    REQUIRE(index->get_rejected_count() == 0);
    std::vector<std::string> expected_labels{"A", "B"};
    REQUIRE(index->get_labels() == expected_labels);
    Box envelope = index->get_envelope();
    REQUIRE(envelope.min_corner().get<0>() == Approx(0));
    REQUIRE(envelope.min_corner().get<1>() == Approx(0));
    REQUIRE(envelope.max_corner().get<0>() == Approx(3));
    REQUIRE(envelope.max_corner().get<1>() == Approx(3));
  }
  SECTION("union_refresh_test")
  {
    REQUIRE_FALSE(index->contains_point(Point(5.5, 5.5)));
    REQUIRE(index->add_region("C", wkt2multipolygon("POLYGON((5 5,5 6,6 6,6 5,5 5))")));
    REQUIRE(index->contains_point(Point(5.5, 5.5)));
    REQUIRE(index->label_for_point(Point(5.5, 5.5)) == std::string("C"));
    REQUIRE(index->get_envelope().max_corner().get<0>() == Approx(6));
  }
  SECTION("counter_clockwise_input_test")
  {
    REQUIRE(index->add_region("D", wkt2multipolygon("POLYGON((10 10,11 10,11 11,10 11,10 10))")));
    REQUIRE(index->label_for_point(Point(10.5, 10.5)) == std::string("D"));
  }
  SECTION("invalid_polygon_rejected_test")
  {
    // Self intersecting bow tie
    REQUIRE_FALSE(index->add_region("Bowtie", wkt2multipolygon("POLYGON((4 4,6 6,6 4,4 6,4 4))")));
    REQUIRE(index->get_rejected_count() == 1);
    REQUIRE(index->get_region_count() == 2);
    REQUIRE_FALSE(index->add_region("Empty", MultiPolygon()));
    REQUIRE(index->get_rejected_count() == 2);
  }
}

TEST_CASE("empty region index is tested", "[region]")
{
  spdlog::set_level(spdlog::level::warn);
  SECTION("build_empty_test")
  {
    REQUIRE_THROWS_AS(RegionIndex::build({}), GeometryError);
  }
  SECTION("build_only_invalid_test")
  {
    std::vector<RegionInput> inputs = {
        {"Bowtie", wkt2multipolygon("POLYGON((0 0,2 2,2 0,0 2,0 0))")}};
    REQUIRE_THROWS_AS(RegionIndex::build(inputs), GeometryError);
  }
  SECTION("queries_on_empty_test")
  {
    RegionIndex index;
    REQUIRE(index.empty());
    REQUIRE_FALSE(index.contains_point(Point(0, 0)));
    REQUIRE_FALSE(index.label_for_point(Point(0, 0)));
    REQUIRE_THROWS_AS(index.get_envelope(), GeometryError);
  }
}
