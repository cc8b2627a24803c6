#ifndef HTTPREC_RECORDER_INTERCEPTOR_INTERCEPTOR_HPP_
#define HTTPREC_RECORDER_INTERCEPTOR_INTERCEPTOR_HPP_

#include "model/interaction.hpp"
#include <exception>
#include <functional>
#include <utility>

namespace httprec::recorder
{
  /**
   * @brief Completion handler of an outgoing call.
   *
   * Exactly one of the arguments is meaningful: a non-null exception_ptr reports
   * a failure (transport errors arrive as boost::system::system_error, recorder
   * errors as RecorderException), otherwise the response is valid.
   */
  using ResponseCallback = std::function<void(std::exception_ptr, Response)>;

  // Continues the call with the rest of the pipeline (next interceptor or the network).
  using NextHandler = std::function<void(Request, ResponseCallback)>;

  class Interceptor
  {
  public:
    virtual ~Interceptor() = default;

    /**
     * @brief Handles one outgoing call.
     * @param request The outgoing request, absolute-form target.
     * @param next Forwards the request down the pipeline.
     * @param callback Must be invoked exactly once, possibly on another thread.
     *
     * The default implementation forwards the call unchanged.
     */
    virtual void intercept(Request request, NextHandler next, ResponseCallback callback)
    {
      next(std::move(request), std::move(callback));
    }
  };

  // Forwards every call untouched.
  class PassthroughInterceptor : public Interceptor
  {
  };
}

#endif // HTTPREC_RECORDER_INTERCEPTOR_INTERCEPTOR_HPP_
