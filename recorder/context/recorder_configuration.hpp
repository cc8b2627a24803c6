#ifndef HTTPREC_RECORDER_CONTEXT_RECORDER_CONFIGURATION_HPP_
#define HTTPREC_RECORDER_CONTEXT_RECORDER_CONFIGURATION_HPP_

#include "interceptor/recorder_mode.hpp"
#include "matcher/rules_matcher.hpp"
#include "anonymizer/rules_anonymizer.hpp"
#include "repository/har_file_repository.hpp"
#include "logging/logger.hpp"
#include "io_context_pool.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/filesystem/path.hpp>
#include <memory>
#include <string>

namespace httprec::recorder
{
  /**
   * @brief Every recorder option with its default.
   *
   * Passed by value and reusable: every RecorderInterceptor clones the matcher,
   * so match-once bookkeeping is never shared between sessions.
   */
  struct RecorderConfiguration
  {
    // When false nothing is persisted (the repository is replaced by NullRepository).
    bool enabled = true;

    // Archive key, e.g. the name of the running test. Must not be empty.
    std::string interaction_name;

    RecorderMode mode = RecorderMode::Auto;

    std::shared_ptr<RequestMatcher> matcher = RulesMatcher::match_once()->by_http_method()->by_request_uri();

    std::shared_ptr<InteractionAnonymizer> anonymizer = RulesAnonymizer::defaults();

    // Null means a HarFileRepository in archive_directory; records are anonymized
    // once, with the anonymizer above.
    std::shared_ptr<InteractionRepository> repository;
    boost::filesystem::path archive_directory = boost::filesystem::path(".");

    std::shared_ptr<Logger> logger = std::make_shared<NullLogger>();

    // Where archive loads and stores run.
    boost::asio::any_io_executor executor = IoContextPool::instance().executor();
  };
}

#endif // HTTPREC_RECORDER_CONTEXT_RECORDER_CONFIGURATION_HPP_
