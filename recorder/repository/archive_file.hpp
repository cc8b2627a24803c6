#ifndef HTTPREC_RECORDER_REPOSITORY_ARCHIVE_FILE_HPP_
#define HTTPREC_RECORDER_REPOSITORY_ARCHIVE_FILE_HPP_

#include "har/har_types.hpp"
#include "repository/named_mutex_registry.hpp"
#include <boost/filesystem/path.hpp>
#include <vector>

namespace httprec::recorder
{
  /**
   * @brief A HAR file on disk shared by concurrent writers.
   *
   * append() holds the per-file mutex for the whole read-modify-write sequence,
   * so appends to the same file serialize while different files proceed in
   * parallel. Every write replaces the file atomically.
   */
  class ArchiveFile
  {
  public:
    explicit ArchiveFile(boost::filesystem::path path,
                         NamedMutexRegistry& locks = NamedMutexRegistry::instance());

    const boost::filesystem::path& path() const { return path_; }

    bool exists() const;

    // @throws PersistenceIOFailure, MalformedArchive
    har::HttpArchive read() const;

    /**
     * @brief Creates the archive or appends entries to it.
     *
     * Tries the splice fast path first and falls back to parse / append /
     * serialize when the existing document does not have the expected tail.
     * @throws PersistenceIOFailure, MalformedArchive (existing file unreadable as HAR)
     */
    void append(const std::vector<har::Entry>& entries);

  private:
    boost::filesystem::path path_;
    NamedMutexRegistry& locks_;
  };
}

#endif // HTTPREC_RECORDER_REPOSITORY_ARCHIVE_FILE_HPP_
