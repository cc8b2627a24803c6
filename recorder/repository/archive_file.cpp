// recorder/repository/archive_file.cpp
#include "archive_file.hpp"
#include "repository/file_utils.hpp"
#include "har/http_archive.hpp"
#include <boost/filesystem/operations.hpp>
#include <utility>

namespace httprec::recorder
{
  ArchiveFile::ArchiveFile(boost::filesystem::path path, NamedMutexRegistry& locks)
    : path_(std::move(path)), locks_(locks)
  {
  }

  bool ArchiveFile::exists() const
  {
    boost::system::error_code ec;
    return fs::is_regular_file(path_, ec);
  }

  har::HttpArchive ArchiveFile::read() const
  {
    return har::parse(read_file(path_));
  }

  void ArchiveFile::append(const std::vector<har::Entry>& entries)
  {
    if (entries.empty())
    {
      return;
    }

    auto named = locks_.get(fs::absolute(path_).lexically_normal().string());
    std::lock_guard<std::mutex> lock(*named);

    if (!exists())
    {
      auto archive = har::to_archive(Interaction{});
      archive.log.entries = entries;
      write_file_atomically(path_, har::serialize(archive));
      return;
    }

    const auto document = read_file(path_);
    if (auto spliced = har::append_entries(document, entries))
    {
      write_file_atomically(path_, *spliced);
      return;
    }

    auto archive = har::parse(document);
    archive.log.entries.insert(archive.log.entries.end(), entries.begin(), entries.end());
    write_file_atomically(path_, har::serialize(archive));
  }
}
