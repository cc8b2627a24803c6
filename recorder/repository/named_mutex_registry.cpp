// recorder/repository/named_mutex_registry.cpp
#include "named_mutex_registry.hpp"

namespace httprec::recorder
{
  std::shared_ptr<std::mutex> NamedMutexRegistry::get(const std::string& name)
  {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = mutexes_.begin(); it != mutexes_.end();)
    {
      if (it->second.expired()) it = mutexes_.erase(it);
      else ++it;
    }

    auto& slot = mutexes_[name];
    auto named = slot.lock();
    if (!named)
    {
      named = std::make_shared<std::mutex>();
      slot = named;
    }
    return named;
  }

  std::size_t NamedMutexRegistry::size()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : mutexes_)
    {
      if (!entry.second.expired()) ++count;
    }
    return count;
  }
}
