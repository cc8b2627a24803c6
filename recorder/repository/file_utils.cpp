// recorder/repository/file_utils.cpp
#include "file_utils.hpp"
#include "exception/recorder_exception.hpp"
#include <boost/filesystem/operations.hpp>
#include <fmt/core.h>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace httprec::recorder
{
  namespace
  {
    bool is_illegal_filename_char(char c)
    {
      if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F)
      {
        return true;
      }
      switch (c)
      {
      case '<':
      case '>':
      case ':':
      case '"':
      case '/':
      case '\\':
      case '|':
      case '?':
      case '*':
        return true;
      default:
        return false;
      }
    }

    boost::system::error_code last_errno()
    {
      return {errno, boost::system::generic_category()};
    }
  }

  std::string make_valid_filename(std::string_view text)
  {
    std::string result(text);
    for (auto& c : result)
    {
      if (is_illegal_filename_char(c))
      {
        c = kFilenameSubstitute;
      }
    }
    return result;
  }

  std::string read_file(const fs::path& path)
  {
    std::ifstream in(path.string(), std::ios::in | std::ios::binary);
    if (!in)
    {
      throw PersistenceIOFailure(fmt::format("Error while reading file '{}'", path.string()), last_errno());
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad())
    {
      throw PersistenceIOFailure(fmt::format("Error while reading file '{}'", path.string()), last_errno());
    }
    return content.str();
  }

  void create_directories(const fs::path& directory)
  {
    if (directory.empty())
    {
      return;
    }
    boost::system::error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
    {
      throw PersistenceIOFailure(fmt::format("Error while creating directory '{}'", directory.string()), ec);
    }
  }

  void write_file_atomically(const fs::path& path, std::string_view content)
  {
    recorder::create_directories(path.parent_path());

    const fs::path temp = path.parent_path() / fs::unique_path(path.filename().string() + ".%%%%-%%%%-%%%%.tmp");
    {
      std::ofstream out(temp.string(), std::ios::out | std::ios::binary | std::ios::trunc);
      if (!out)
      {
        throw PersistenceIOFailure(fmt::format("Error while writing file '{}'", path.string()), last_errno());
      }
      out.write(content.data(), static_cast<std::streamsize>(content.size()));
      out.flush();
      if (!out)
      {
        const auto cause = last_errno();
        out.close();
        boost::system::error_code ignored;
        fs::remove(temp, ignored);
        throw PersistenceIOFailure(fmt::format("Error while writing file '{}'", path.string()), cause);
      }
    }

    boost::system::error_code ec;
    fs::rename(temp, path, ec);
    if (ec)
    {
      boost::system::error_code ignored;
      fs::remove(temp, ignored);
      throw PersistenceIOFailure(fmt::format("Error while replacing file '{}'", path.string()), ec);
    }
  }
}
