// recorder/context/recorder_context.cpp
#include "recorder_context.hpp"
#include <utility>

namespace httprec::recorder
{
  RecorderContext::RecorderContext(RecorderConfiguration configuration, SessionManager& sessions)
    : sessions_(sessions),
      interceptor_(std::make_shared<RecorderInterceptor>(std::move(configuration)))
  {
    sessions_.acquire(interceptor_);
  }

  RecorderContext::~RecorderContext()
  {
    sessions_.release();
  }
}
