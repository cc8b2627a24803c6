#ifndef HTTPREC_RECORDER_CONTEXT_CONTEXT_INTERCEPTOR_HPP_
#define HTTPREC_RECORDER_CONTEXT_CONTEXT_INTERCEPTOR_HPP_

#include "context/session_manager.hpp"
#include "interceptor/interceptor.hpp"

namespace httprec::recorder
{
  // Installed once in a client; routes each call through the live RecorderContext, if any.
  class ContextInterceptor : public Interceptor
  {
  public:
    explicit ContextInterceptor(SessionManager& sessions = SessionManager::instance());

    void intercept(Request request, NextHandler next, ResponseCallback callback) override;

  private:
    SessionManager& sessions_;
  };
}

#endif // HTTPREC_RECORDER_CONTEXT_CONTEXT_INTERCEPTOR_HPP_
