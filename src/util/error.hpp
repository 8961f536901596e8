/**
 * LAEP core.
 *
 * Exceptions raised at the entry points of the library.
 *
 * Per-item problems (an invalid polygon, an oracle failure, a feature
 * with a malformed geometry) are never raised; they are reported through
 * the error codes of the result types and the item is omitted.
 */

#ifndef LAEP_UTIL_ERROR_HPP_
#define LAEP_UTIL_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace LAEP
{

  /**
   * No usable polygon geometry, e.g. an index built from a collection
   * where every polygon was rejected.
   */
  class GeometryError : public std::runtime_error
  {
  public:
    explicit GeometryError(const std::string &what_arg)
        : std::runtime_error(what_arg) {};
  };

  /**
   * Caller contract violation: zero-area bounding box, empty lattice,
   * non-finite origin, empty origin set.
   */
  class DegenerateInput : public std::invalid_argument
  {
  public:
    explicit DegenerateInput(const std::string &what_arg)
        : std::invalid_argument(what_arg) {};
  };

} // LAEP

#endif // LAEP_UTIL_ERROR_HPP_
