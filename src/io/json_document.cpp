#include "io/json_document.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/json_parser/detail/read.hpp>

using namespace LAEP;

namespace pt = boost::property_tree;
namespace jpd = boost::property_tree::json_parser::detail;

namespace
{
  /**
   * Parser callbacks tracking the key each container and scalar belongs
   * to. The parser is a template on its callbacks, the hidden members
   * below are the ones it calls.
   */
  class NumericKeyCallbacks : public jpd::standard_callbacks<pt::ptree>
  {
  public:
    typedef jpd::standard_callbacks<pt::ptree> base_type;

    explicit NumericKeyCallbacks(const std::vector<std::string> &numeric_keys)
        : numeric_keys_(numeric_keys)
    {
    }

    void on_begin_string()
    {
      bool numeric = value_is_numeric();
      base_type::on_begin_string();
      string_is_key_ = is_key();
      string_is_numeric_ = !string_is_key_ && numeric;
    }

    void on_end_string()
    {
      if (string_is_key_)
      {
        last_key_ = current_value();
      }
      else if (string_is_numeric_)
      {
        current_value() = "\"" + current_value() + "\"";
      }
      base_type::on_end_string();
    }

    void on_begin_array()
    {
      open(false);
      base_type::on_begin_array();
    }

    void on_end_array()
    {
      base_type::on_end_array();
      containers_.pop_back();
    }

    void on_begin_object()
    {
      open(true);
      base_type::on_begin_object();
    }

    void on_end_object()
    {
      base_type::on_end_object();
      containers_.pop_back();
    }

  private:
    struct Container
    {
      bool object;
      bool numeric;
    };

    // A value inside an object belongs to the last key read, a value
    // inside an array inherits from the array.
    bool value_is_numeric() const
    {
      if (containers_.empty())
        return false;
      const Container &top = containers_.back();
      if (top.numeric)
        return true;
      return top.object &&
             std::find(numeric_keys_.begin(), numeric_keys_.end(),
                       last_key_) != numeric_keys_.end();
    }

    void open(bool object)
    {
      containers_.push_back({object, value_is_numeric()});
    }

    const std::vector<std::string> &numeric_keys_;
    std::vector<Container> containers_;
    std::string last_key_;
    bool string_is_key_ = false;
    bool string_is_numeric_ = false;
  };
}

pt::ptree LAEP::IO::read_json_document(
    std::istream &is, const std::vector<std::string> &numeric_keys)
{
  NumericKeyCallbacks callbacks(numeric_keys);
  jpd::utf8_utf8_encoding encoding;
  jpd::read_json_internal(std::istreambuf_iterator<char>(is),
                          std::istreambuf_iterator<char>(),
                          encoding, callbacks, std::string());
  pt::ptree root;
  root.swap(callbacks.output());
  return root;
}

pt::ptree LAEP::IO::read_json_document(
    const std::string &text, const std::vector<std::string> &numeric_keys)
{
  std::istringstream iss(text);
  return read_json_document(iss, numeric_keys);
}
