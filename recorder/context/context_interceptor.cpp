// recorder/context/context_interceptor.cpp
#include "context_interceptor.hpp"
#include <utility>

namespace httprec::recorder
{
  ContextInterceptor::ContextInterceptor(SessionManager& sessions)
    : sessions_(sessions)
  {
  }

  void ContextInterceptor::intercept(Request request, NextHandler next, ResponseCallback callback)
  {
    // 取快照，调用期间上下文结束不影响本次调用
    if (auto active = sessions_.current())
    {
      active->intercept(std::move(request), std::move(next), std::move(callback));
      return;
    }
    next(std::move(request), std::move(callback));
  }
}
