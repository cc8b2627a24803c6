// recorder/context/session_manager.cpp
#include "session_manager.hpp"
#include "exception/recorder_exception.hpp"
#include <utility>

namespace httprec::recorder
{
  SessionManager& SessionManager::instance()
  {
    static SessionManager manager;
    return manager;
  }

  void SessionManager::acquire(std::shared_ptr<Interceptor> interceptor)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_)
    {
      throw MultipleActiveContexts();
    }
    active_ = std::move(interceptor);
  }

  void SessionManager::release()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.reset();
  }

  std::shared_ptr<Interceptor> SessionManager::current() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
  }

  bool SessionManager::has_active_context() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ != nullptr;
  }
}
