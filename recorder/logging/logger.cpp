// recorder/logging/logger.cpp
#include "logger.hpp"

namespace httprec::recorder
{
  std::string_view to_string(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::trace: return "trace";
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
    case LogLevel::critical: return "critical";
    case LogLevel::off: return "off";
    }
    return "unknown";
  }

  ConsoleLogger::ConsoleLogger(LogLevel threshold, std::string name)
    : threshold_(threshold), name_(std::move(name))
  {
  }

  bool ConsoleLogger::is_enabled(LogLevel level) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::off && level >= threshold_;
  }

  void ConsoleLogger::log(LogLevel level, std::string_view message)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fmt::print(stderr, "[{}] [{}] {}\n", name_, to_string(level), message);
  }

  void ConsoleLogger::set_threshold(LogLevel threshold)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = threshold;
  }
}
