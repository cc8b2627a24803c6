// recorder/interceptor/har_logging.cpp
#include "har_logging.hpp"
#include "interceptor/recorder_interceptor.hpp"
#include "repository/logger_repository.hpp"
#include <utility>

namespace httprec::recorder
{
  std::shared_ptr<Interceptor> make_har_logging_interceptor(
    std::string name, std::shared_ptr<Logger> logger,
    std::shared_ptr<InteractionRepository> repository,
    boost::filesystem::path log_directory,
    bool install_when_disabled)
  {
    if (!logger || (!install_when_disabled && !logger->is_enabled(LogLevel::trace)))
    {
      return std::make_shared<PassthroughInterceptor>();
    }

    RecorderConfiguration configuration;
    configuration.interaction_name = std::move(name);
    configuration.mode = RecorderMode::Record;
    configuration.repository = repository
                                 ? std::move(repository)
                                 : std::make_shared<LoggerRepository>(logger, std::move(log_directory));
    configuration.logger = std::move(logger);
    return std::make_shared<RecorderInterceptor>(std::move(configuration));
  }
}
