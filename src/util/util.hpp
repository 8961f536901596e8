/**
 * LAEP core.
 *
 * Utility functions
 */

#ifndef LAEP_UTIL_UTIL_HPP_
#define LAEP_UTIL_UTIL_HPP_

#include <chrono>
#include <string>
#include <vector>

namespace LAEP
{
  /**
   * Utility functions for timing, files and strings
   */
  namespace UTIL
  {

    typedef std::chrono::time_point<std::chrono::system_clock> TimePoint;

    /**
     * Get the current time
     */
    TimePoint get_current_time();

    /**
     * Duration in seconds between two time points
     */
    double get_duration(const TimePoint &t1, const TimePoint &t2);

    /**
     * Check if a file exists
     * @param filename file name
     * @return true if the file exists
     */
    bool file_exists(const std::string &filename);

    /**
     * Read a whole file into a string
     * @param filename file name
     * @return the content of the file
     * @throw std::runtime_error if the file cannot be opened
     */
    std::string read_file(const std::string &filename);

    /**
     * Split a comma separated string, trimming spaces around each item.
     * Empty items are dropped.
     */
    std::vector<std::string> split_string(const std::string &str);

    bool string2bool(const std::string &str);

    /**
     * Check the extension of a file against a comma separated list
     * @param filename file name
     * @param extension_list_str e.g. "geojson,json"
     */
    bool check_file_extension(const std::string &filename,
                              const std::string &extension_list_str);

    /**
     * Get the folder part of a path, empty if there is none
     */
    std::string get_file_directory(const std::string &fn);

    bool folder_exist(const std::string &folder_name);

  } // UTIL
} // LAEP

#endif // LAEP_UTIL_UTIL_HPP_
