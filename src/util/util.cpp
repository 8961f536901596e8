#include "util/util.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#ifdef _WIN32
#include <sys/types.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#endif

#if defined _WIN32 && !defined S_ISDIR
#define S_ISDIR(m) (((m) & _S_IFDIR) == _S_IFDIR)
#endif

namespace LAEP
{

  namespace UTIL
  {

    TimePoint get_current_time()
    {
      return std::chrono::system_clock::now();
    }

    double get_duration(const TimePoint &t1, const TimePoint &t2)
    {
      return std::chrono::duration_cast<
                 std::chrono::milliseconds>(t2 - t1)
                 .count() /
             1000.;
    }

    bool file_exists(const std::string &filename)
    {
#ifdef _WIN32
      struct _stat buf;
      return _stat(filename.c_str(), &buf) != -1;
#else
      struct stat buf;
      return stat(filename.c_str(), &buf) != -1;
#endif
    }

    std::string read_file(const std::string &filename)
    {
      std::ifstream ifs(filename, std::ios::binary);
      if (!ifs.is_open())
      {
        throw std::runtime_error("Cannot open file " + filename);
      }
      std::stringstream ss;
      ss << ifs.rdbuf();
      return ss.str();
    }

    std::vector<std::string> split_string(const std::string &str)
    {
      char delim = ',';
      std::vector<std::string> result;
      std::stringstream ss(str);
      std::string intermediate;
      while (getline(ss, intermediate, delim))
      {
        std::size_t first = intermediate.find_first_not_of(' ');
        if (first == std::string::npos)
          continue;
        std::size_t last = intermediate.find_last_not_of(' ');
        result.push_back(intermediate.substr(first, last - first + 1));
      }
      return result;
    }

    bool string2bool(const std::string &str)
    {
      return str == "true" || str == "t" || str == "1";
    }

    bool check_file_extension(const std::string &filename,
                              const std::string &extension_list_str)
    {
      std::size_t dot = filename.find_last_of('.');
      if (dot == std::string::npos)
        return false;
      std::string fn_extension = filename.substr(dot + 1);
      for (const auto &extension : split_string(extension_list_str))
      {
        if (fn_extension == extension)
          return true;
      }
      return false;
    }

    std::string get_file_directory(const std::string &fn)
    {
      std::size_t found = fn.find_last_of("/");
      if (found != std::string::npos)
      {
        return fn.substr(0, found);
      }
      return {};
    }

    bool folder_exist(const std::string &folder_name)
    {
      if (folder_name.empty())
        return true;
#ifdef _WIN32
      struct _stat sb;
      return _stat(folder_name.c_str(), &sb) == 0 && (sb.st_mode & _S_IFDIR);
#else
      struct stat sb;
      return stat(folder_name.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
#endif
    }

  } // UTIL
} // LAEP
