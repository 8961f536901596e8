/**
 * LAEP core.
 *
 * JSON reading on top of the boost property tree parser. The plain parser
 * keeps every scalar as text, so "1.0" and 1.0 end up identical. Here a
 * string found under one of the numeric keys keeps its quotes, and numeric
 * conversion of that node fails as it should.
 */

#ifndef LAEP_IO_JSON_DOCUMENT_HPP_
#define LAEP_IO_JSON_DOCUMENT_HPP_

#include <istream>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  namespace IO
  {

    /**
     * Read a JSON document into a property tree
     * @param is input stream
     * @param numeric_keys keys whose values, nested arrays included, hold
     * numbers only
     * @return the document tree, laid out as boost::property_tree::read_json
     * does
     * @throw boost::property_tree::json_parser_error on invalid JSON
     */
    boost::property_tree::ptree read_json_document(
        std::istream &is, const std::vector<std::string> &numeric_keys);

    boost::property_tree::ptree read_json_document(
        const std::string &text, const std::vector<std::string> &numeric_keys);

  } // IO
} // LAEP

#endif // LAEP_IO_JSON_DOCUMENT_HPP_
