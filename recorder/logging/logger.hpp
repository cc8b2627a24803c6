#ifndef HTTPREC_RECORDER_LOGGING_LOGGER_HPP_
#define HTTPREC_RECORDER_LOGGING_LOGGER_HPP_

#include <fmt/core.h>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace httprec::recorder
{
  enum class LogLevel
  {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    off
  };

  std::string_view to_string(LogLevel level);

  /**
   * @brief Logging sink used by the recorder.
   *
   * is_enabled() is also the capture switch of the HAR logging mode: when trace is
   * disabled nothing is written at all.
   */
  class Logger
  {
  public:
    virtual ~Logger() = default;

    virtual bool is_enabled(LogLevel level) const = 0;
    virtual void log(LogLevel level, std::string_view message) = 0;

    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args)
    {
      write(LogLevel::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args)
    {
      write(LogLevel::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args)
    {
      write(LogLevel::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args)
    {
      write(LogLevel::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args)
    {
      write(LogLevel::error, format, std::forward<Args>(args)...);
    }

  private:
    template <typename... Args>
    void write(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
    {
      // 未启用时不做格式化
      if (!is_enabled(level)) return;
      log(level, fmt::format(format, std::forward<Args>(args)...));
    }
  };

  // Writes "[name] [level] message" lines to stderr.
  class ConsoleLogger : public Logger
  {
  public:
    explicit ConsoleLogger(LogLevel threshold = LogLevel::info, std::string name = "httprec");

    bool is_enabled(LogLevel level) const override;
    void log(LogLevel level, std::string_view message) override;

    void set_threshold(LogLevel threshold);

  private:
    mutable std::mutex mutex_;
    LogLevel threshold_;
    std::string name_;
  };

  class NullLogger : public Logger
  {
  public:
    bool is_enabled(LogLevel) const override { return false; }

    void log(LogLevel, std::string_view) override
    {
    }
  };
}

#endif // HTTPREC_RECORDER_LOGGING_LOGGER_HPP_
