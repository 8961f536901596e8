#include "sample/sample_type.hpp"

using namespace LAEP;
using namespace LAEP::SAMPLE;

SpeedCategory LAEP::SAMPLE::speed_category_from_gap(int gap)
{
  if (gap < FAST_GAP_LIMIT)
    return SpeedCategory::FAST;
  if (gap < MEDIUM_GAP_LIMIT)
    return SpeedCategory::MEDIUM;
  return SpeedCategory::SLOW;
}

std::string LAEP::SAMPLE::speed_category_to_string(SpeedCategory category)
{
  switch (category)
  {
  case SpeedCategory::FAST:
    return "Fast";
  case SpeedCategory::MEDIUM:
    return "Medium";
  case SpeedCategory::SLOW:
    return "Slow";
  }
  return "Unknown";
}

std::optional<SpeedCategory> LAEP::SAMPLE::speed_category_from_string(
    const std::string &str)
{
  if (str == "Fast")
    return SpeedCategory::FAST;
  if (str == "Medium")
    return SpeedCategory::MEDIUM;
  if (str == "Slow")
    return SpeedCategory::SLOW;
  return std::nullopt;
}
