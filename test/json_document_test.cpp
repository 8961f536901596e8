#include "catch2/catch.hpp"

#include "io/json_document.hpp"

#include <sstream>

#include <boost/property_tree/json_parser.hpp>

using namespace LAEP;
using namespace LAEP::IO;

namespace pt = boost::property_tree;

TEST_CASE("json document reader is tested", "[io]")
{
  std::vector<std::string> numeric_keys = {"coordinates", "duration"};

  SECTION("numeric_key_test")
  {
    pt::ptree root = read_json_document(
        R"({"duration":"123","geometry":{"coordinates":[["1.0",2.5],[3,"x"]]}})",
        numeric_keys);
    REQUIRE(root.get<std::string>("duration") == "\"123\"");
    REQUIRE_FALSE(root.get_optional<double>("duration"));
    const pt::ptree &coordinates = root.get_child("geometry.coordinates");
    std::vector<std::string> values;
    for (const auto &position : coordinates)
    {
      for (const auto &component : position.second)
      {
        values.push_back(component.second.data());
      }
    }
    std::vector<std::string> expected = {"\"1.0\"", "2.5", "3", "\"x\""};
    REQUIRE(values == expected);
  }
  SECTION("other_keys_unchanged_test")
  {
    pt::ptree root = read_json_document(
        R"({"code":"Ok","properties":{"duration":"long","name":"Depot \"1\"",
        "speed":"12","coordinates_note":"5"},"duration":7.5})",
        numeric_keys);
    REQUIRE(root.get<std::string>("code") == "Ok");
    REQUIRE(root.get<std::string>("properties.name") == "Depot \"1\"");
    REQUIRE(root.get<std::string>("properties.speed") == "12");
    REQUIRE(root.get<std::string>("properties.coordinates_note") == "5");
    // Numeric keys apply at any depth
    REQUIRE(root.get<std::string>("properties.duration") == "\"long\"");
    REQUIRE(root.get<double>("duration") == Approx(7.5));
  }
  SECTION("same_tree_as_read_json_test")
  {
    std::string text =
        R"({"type":"FeatureCollection","features":[{"type":"Feature",
        "properties":{"BoroName":"Queens","flag":true,"note":null},
        "geometry":{"type":"Point","coordinates":[-73.9,40.7]}}]})";
    pt::ptree expected;
    std::istringstream iss(text);
    pt::read_json(iss, expected);
    REQUIRE(read_json_document(text, numeric_keys) == expected);
  }
  SECTION("invalid_json_test")
  {
    REQUIRE_THROWS_AS(read_json_document("{\"coordinates\":[1,", numeric_keys),
                      pt::json_parser_error);
  }
}
