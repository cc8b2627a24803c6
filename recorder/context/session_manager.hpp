#ifndef HTTPREC_RECORDER_CONTEXT_SESSION_MANAGER_HPP_
#define HTTPREC_RECORDER_CONTEXT_SESSION_MANAGER_HPP_

#include "interceptor/interceptor.hpp"
#include <memory>
#include <mutex>

namespace httprec::recorder
{
  /**
   * @brief Tracks the single live recorder context.
   *
   * Tests that need isolation create their own manager and pass it to both
   * RecorderContext and ContextInterceptor; everything else shares instance().
   */
  class SessionManager
  {
  public:
    SessionManager() = default;
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    static SessionManager& instance();

    // Throws MultipleActiveContexts when a context is already live.
    void acquire(std::shared_ptr<Interceptor> interceptor);

    void release();

    std::shared_ptr<Interceptor> current() const;

    bool has_active_context() const;

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<Interceptor> active_;
  };
}

#endif // HTTPREC_RECORDER_CONTEXT_SESSION_MANAGER_HPP_
