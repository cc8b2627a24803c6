#ifndef HTTPREC_RECORDER_REPOSITORY_NAMED_MUTEX_REGISTRY_HPP_
#define HTTPREC_RECORDER_REPOSITORY_NAMED_MUTEX_REGISTRY_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace httprec::recorder
{
  /**
   * @brief One mutex per name, shared by everyone asking for the same name.
   *
   * Entries are released once no caller holds the mutex any more, so the registry
   * does not grow with the number of archives ever written.
   */
  class NamedMutexRegistry
  {
  public:
    static NamedMutexRegistry& instance()
    {
      static NamedMutexRegistry registry;
      return registry;
    }

    NamedMutexRegistry() = default;
    NamedMutexRegistry(const NamedMutexRegistry&) = delete;
    NamedMutexRegistry& operator=(const NamedMutexRegistry&) = delete;

    std::shared_ptr<std::mutex> get(const std::string& name);

    // Number of names currently in use.
    std::size_t size();

  private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> mutexes_;
  };
}

#endif // HTTPREC_RECORDER_REPOSITORY_NAMED_MUTEX_REGISTRY_HPP_
