// recorder/exception/recorder_exception.cpp
#include "recorder_exception.hpp"
#include <fmt/core.h>
#include <utility>

namespace httprec::recorder
{
  namespace
  {
    class RecorderCategory : public boost::system::error_category
    {
    public:
      const char* name() const noexcept override
      {
        return "httprec.recorder";
      }

      std::string message(int ev) const override
      {
        switch (static_cast<recorder_errc>(ev))
        {
        case recorder_errc::malformed_archive:
          return "malformed archive";
        case recorder_errc::no_such_interaction:
          return "no such interaction";
        case recorder_errc::no_matching_interaction:
          return "no matching interaction";
        case recorder_errc::multiple_active_contexts:
          return "multiple active recorder contexts";
        case recorder_errc::persistence_io_failure:
          return "persistence I/O failure";
        case recorder_errc::unsupported_operation:
          return "unsupported operation";
        }
        return "unknown recorder error";
      }
    };
  }

  const boost::system::error_category& recorder_category() noexcept
  {
    static const RecorderCategory category;
    return category;
  }

  boost::system::error_code make_error_code(recorder_errc e) noexcept
  {
    return {static_cast<int>(e), recorder_category()};
  }

  NoSuchInteraction::NoSuchInteraction(const std::string& interaction_name)
    : RecorderException(recorder_errc::no_such_interaction,
                        fmt::format("No recorded interaction named '{}'", interaction_name)),
      interaction_name_(interaction_name)
  {
  }

  NoMatchingInteraction::NoMatchingInteraction(std::string method, std::string url)
    : RecorderException(recorder_errc::no_matching_interaction,
                        fmt::format("Unable to find a matching interaction for request {} {}", method, url)),
      method_(std::move(method)),
      url_(std::move(url))
  {
  }

  MultipleActiveContexts::MultipleActiveContexts()
    : RecorderException(recorder_errc::multiple_active_contexts,
                        "Cannot activate a recorder context: multiple active contexts are not supported")
  {
  }
}
