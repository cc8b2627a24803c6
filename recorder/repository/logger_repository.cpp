// recorder/repository/logger_repository.cpp
#include "logger_repository.hpp"
#include "repository/archive_file.hpp"
#include "repository/file_utils.hpp"
#include "har/http_archive.hpp"
#include "exception/recorder_exception.hpp"
#include <boost/beast/http/write.hpp>
#include <fmt/core.h>
#include <sstream>
#include <thread>
#include <utility>

namespace httprec::recorder
{
  namespace
  {
    std::string current_thread_id()
    {
      std::ostringstream os;
      os << std::this_thread::get_id();
      return os.str();
    }

    std::string dump(const InteractionMessage& message)
    {
      std::ostringstream os;
      try
      {
        os << "Started: " << har::format_timestamp(message.timings.start) << "\n";
        os << "Elapsed: " << static_cast<double>(message.timings.elapsed.count()) / 1000.0 << " ms\n\n";
        os << message.request << "\n\n";
        os << message.response << "\n";
      }
      catch (const boost::system::system_error& e)
      {
        throw PersistenceIOFailure("Error while formatting HTTP message", e.code());
      }
      return os.str();
    }
  }

  LoggerRepository::LoggerRepository(std::shared_ptr<Logger> logger, boost::filesystem::path log_directory,
                                     LoggerRepositoryOptions options)
    : logger_(logger ? std::move(logger) : std::make_shared<NullLogger>()),
      log_directory_(std::move(log_directory)),
      options_(std::move(options))
  {
  }

  bool LoggerRepository::exists(const std::string&)
  {
    return false;
  }

  Interaction LoggerRepository::load(const std::string& interaction_name)
  {
    throw UnsupportedOperation(
      fmt::format("Error while loading interaction '{}': this mode is not supported", interaction_name));
  }

  boost::filesystem::path LoggerRepository::trace_directory(const std::string& interaction_name) const
  {
    return log_directory_ / "trace" / make_valid_filename(interaction_name);
  }

  boost::filesystem::path LoggerRepository::archive_path(const std::string& interaction_name) const
  {
    if (options_.aggregate_archive.has_value())
    {
      return log_directory_ / "trace" / (make_valid_filename(*options_.aggregate_archive) + ".har");
    }
    return trace_directory(interaction_name) / (make_valid_filename(interaction_name) + ".har");
  }

  std::optional<Interaction> LoggerRepository::store(const Interaction& interaction)
  {
    if (!logger_->is_enabled(LogLevel::trace))
    {
      return std::nullopt;
    }
    if (interaction.messages.empty() || log_directory_.empty())
    {
      return std::nullopt;
    }

    const auto folder = trace_directory(interaction.name);
    recorder::create_directories(folder);

    std::vector<har::Entry> entries;
    for (const auto& message : interaction.messages)
    {
      const auto log_id = ++log_counter_;
      if (options_.write_text_dump)
      {
        const auto filename = make_valid_filename(
          fmt::format("{}_{} {} {} {}.txt", current_thread_id(), log_id, message.response.result_int(),
                      request_method(message.request), request_host(message.request)));
        write_file_atomically(folder / filename, dump(message));
      }
      entries.push_back(har::to_entry(message));
    }

    if (options_.write_archive)
    {
      ArchiveFile(archive_path(interaction.name)).append(entries);
    }

    logger_->trace("HAR log: {} message(s) of '{}' written to {}", entries.size(), interaction.name,
                   folder.string());

    // 返回空，调用方不会再次存储
    return std::nullopt;
  }
}
