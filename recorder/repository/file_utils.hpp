#ifndef HTTPREC_RECORDER_REPOSITORY_FILE_UTILS_HPP_
#define HTTPREC_RECORDER_REPOSITORY_FILE_UTILS_HPP_

#include <boost/filesystem/path.hpp>
#include <string>
#include <string_view>

namespace httprec::recorder
{
  namespace fs = boost::filesystem;

  inline constexpr char kFilenameSubstitute = '_';

  /**
   * @brief Replaces every character that is illegal in a file name with '_'.
   *
   * Illegal means the union of what Windows and POSIX reject: control
   * characters, path separators and < > : " | ? *.
   */
  std::string make_valid_filename(std::string_view text);

  // @throws PersistenceIOFailure
  std::string read_file(const fs::path& path);

  /**
   * @brief Writes through a temporary file in the same directory, then renames it
   * over the target. Missing parent directories are created.
   * @throws PersistenceIOFailure
   */
  void write_file_atomically(const fs::path& path, std::string_view content);

  void create_directories(const fs::path& directory);
}

#endif // HTTPREC_RECORDER_REPOSITORY_FILE_UTILS_HPP_
