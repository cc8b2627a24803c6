#ifndef HTTPREC_RECORDER_REPOSITORY_LOGGER_REPOSITORY_HPP_
#define HTTPREC_RECORDER_REPOSITORY_LOGGER_REPOSITORY_HPP_

#include "repository/interaction_repository.hpp"
#include "logging/logger.hpp"
#include <boost/filesystem/path.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace httprec::recorder
{
  struct LoggerRepositoryOptions
  {
    // Append every interaction to <log dir>/trace/<aggregate_archive>.har instead
    // of one archive per interaction name.
    std::optional<std::string> aggregate_archive;
    bool write_text_dump = true;
    bool write_archive = true;
  };

  /**
   * @brief Write-only repository for HAR logging.
   *
   * Layout under the log directory:
   *   trace/<sanitized interaction>/<thread>_<n> <status> <method> <host>.txt
   *   trace/<sanitized interaction>/<sanitized interaction>.har
   *
   * Nothing is written unless the logger has trace enabled. store() never
   * reports anything as stored, and load() is not supported.
   */
  class LoggerRepository : public InteractionRepository
  {
  public:
    LoggerRepository(std::shared_ptr<Logger> logger, boost::filesystem::path log_directory,
                     LoggerRepositoryOptions options = {});

    bool exists(const std::string& interaction_name) override;
    Interaction load(const std::string& interaction_name) override;
    std::optional<Interaction> store(const Interaction& interaction) override;

    boost::filesystem::path trace_directory(const std::string& interaction_name) const;
    boost::filesystem::path archive_path(const std::string& interaction_name) const;

  private:
    std::shared_ptr<Logger> logger_;
    boost::filesystem::path log_directory_;
    LoggerRepositoryOptions options_;
    std::atomic<int> log_counter_{0};
  };
}

#endif // HTTPREC_RECORDER_REPOSITORY_LOGGER_REPOSITORY_HPP_
