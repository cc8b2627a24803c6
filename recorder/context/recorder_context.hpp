#ifndef HTTPREC_RECORDER_CONTEXT_RECORDER_CONTEXT_HPP_
#define HTTPREC_RECORDER_CONTEXT_RECORDER_CONTEXT_HPP_

#include "context/recorder_configuration.hpp"
#include "context/session_manager.hpp"
#include "interceptor/recorder_interceptor.hpp"
#include <memory>

namespace httprec::recorder
{
  /**
   * @brief Scope in which calls through a ContextInterceptor are recorded or replayed.
   *
   *   {
   *     RecorderConfiguration configuration;
   *     configuration.interaction_name = "search";
   *     RecorderContext context(configuration);
   *     client->request_sync(...);
   *   }
   *
   * Only one context may be live per SessionManager; a second one throws
   * MultipleActiveContexts.
   */
  class RecorderContext
  {
  public:
    explicit RecorderContext(RecorderConfiguration configuration,
                             SessionManager& sessions = SessionManager::instance());
    ~RecorderContext();

    RecorderContext(const RecorderContext&) = delete;
    RecorderContext& operator=(const RecorderContext&) = delete;

    const std::shared_ptr<RecorderInterceptor>& interceptor() const { return interceptor_; }

  private:
    SessionManager& sessions_;
    std::shared_ptr<RecorderInterceptor> interceptor_;
  };
}

#endif // HTTPREC_RECORDER_CONTEXT_RECORDER_CONTEXT_HPP_
