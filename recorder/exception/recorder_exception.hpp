#ifndef HTTPREC_RECORDER_EXCEPTION_RECORDER_EXCEPTION_HPP_
#define HTTPREC_RECORDER_EXCEPTION_RECORDER_EXCEPTION_HPP_

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <string>
#include <type_traits>

namespace httprec::recorder
{
  enum class recorder_errc
  {
    malformed_archive = 1,
    no_such_interaction,
    no_matching_interaction,
    multiple_active_contexts,
    persistence_io_failure,
    unsupported_operation
  };

  const boost::system::error_category& recorder_category() noexcept;

  boost::system::error_code make_error_code(recorder_errc e) noexcept;

  /**
   * @brief Base class of every error raised by the recorder.
   *
   * code() always belongs to recorder_category(), so callers can assert on the
   * failure kind either by catching the concrete subclass or by comparing codes.
   */
  class RecorderException : public boost::system::system_error
  {
  public:
    RecorderException(recorder_errc code, const std::string& what)
      : boost::system::system_error(make_error_code(code), what)
    {
    }
  };

  // On-disk data failed schema validation. Never auto-repaired.
  class MalformedArchive : public RecorderException
  {
  public:
    explicit MalformedArchive(const std::string& what)
      : RecorderException(recorder_errc::malformed_archive, what)
    {
    }
  };

  class NoSuchInteraction : public RecorderException
  {
  public:
    explicit NoSuchInteraction(const std::string& interaction_name);

    const std::string& interaction_name() const { return interaction_name_; }

  private:
    std::string interaction_name_;
  };

  class NoMatchingInteraction : public RecorderException
  {
  public:
    NoMatchingInteraction(std::string method, std::string url);

    const std::string& method() const { return method_; }
    const std::string& url() const { return url_; }

  private:
    std::string method_;
    std::string url_;
  };

  class MultipleActiveContexts : public RecorderException
  {
  public:
    MultipleActiveContexts();
  };

  // Storage read/write or JSON encode failure. cause() keeps the root error code when there is one.
  class PersistenceIOFailure : public RecorderException
  {
  public:
    explicit PersistenceIOFailure(const std::string& what, boost::system::error_code cause = {})
      : RecorderException(recorder_errc::persistence_io_failure,
                          cause ? what + ": " + cause.message() : what),
        cause_(cause)
    {
    }

    const boost::system::error_code& cause() const { return cause_; }

  private:
    boost::system::error_code cause_;
  };

  class UnsupportedOperation : public RecorderException
  {
  public:
    explicit UnsupportedOperation(const std::string& what)
      : RecorderException(recorder_errc::unsupported_operation, what)
    {
    }
  };
}

namespace boost::system
{
  template <>
  struct is_error_code_enum<httprec::recorder::recorder_errc> : std::true_type
  {
  };
}

#endif // HTTPREC_RECORDER_EXCEPTION_RECORDER_EXCEPTION_HPP_
