#ifndef HTTPREC_RECORDER_INTERCEPTOR_HAR_LOGGING_HPP_
#define HTTPREC_RECORDER_INTERCEPTOR_HAR_LOGGING_HPP_

#include "interceptor/interceptor.hpp"
#include "logging/logger.hpp"
#include "repository/interaction_repository.hpp"
#include <boost/filesystem/path.hpp>
#include <memory>
#include <string>

namespace httprec::recorder
{
  /**
   * @brief Builds the interceptor behind HAR logging.
   * @param name Interaction name used for the trace files.
   * @param logger Decides whether anything is captured (trace level).
   * @param repository Where to record; defaults to a LoggerRepository under log_directory.
   * @param log_directory Root of the trace/ tree when no repository is given.
   * @param install_when_disabled Install the recorder even while trace is off, so that
   *        raising the logger's level later starts capturing.
   * @return A Record-mode RecorderInterceptor when trace is enabled (or install_when_disabled
   *         is set), a PassthroughInterceptor otherwise.
   */
  std::shared_ptr<Interceptor> make_har_logging_interceptor(
    std::string name, std::shared_ptr<Logger> logger,
    std::shared_ptr<InteractionRepository> repository = nullptr,
    boost::filesystem::path log_directory = ".",
    bool install_when_disabled = false);
}

#endif // HTTPREC_RECORDER_INTERCEPTOR_HAR_LOGGING_HPP_
