#ifndef HTTPREC_RECORDER_INTERCEPTOR_RECORDER_INTERCEPTOR_HPP_
#define HTTPREC_RECORDER_INTERCEPTOR_RECORDER_INTERCEPTOR_HPP_

#include "interceptor/interceptor.hpp"
#include "context/recorder_configuration.hpp"
#include <memory>
#include <mutex>
#include <optional>

namespace httprec::recorder
{
  /**
   * @brief Records, replays or forwards outgoing calls.
   *
   * The execution mode is resolved on the first call and cached for the lifetime
   * of the interceptor. HTTP_RECORDER_MODE, when set to a valid mode name, wins
   * over the configured mode; Auto becomes Replay when the repository already
   * has the interaction and Record otherwise.
   *
   * Record: the call goes to the network, then the exchange is anonymized and
   * stored. Failed or cancelled calls are reported as-is and nothing is stored.
   * Replay: the interaction is loaded once and every call is answered by the
   * matcher, without touching the network.
   *
   * Must be owned by a std::shared_ptr.
   */
  class RecorderInterceptor : public Interceptor, public std::enable_shared_from_this<RecorderInterceptor>
  {
  public:
    static constexpr const char* kOverridingEnvironmentVariableName = "HTTP_RECORDER_MODE";

    explicit RecorderInterceptor(RecorderConfiguration configuration);

    void intercept(Request request, NextHandler next, ResponseCallback callback) override;

    // Thread-safe; concurrent first calls resolve once.
    RecorderMode resolve_mode();

    const std::string& interaction_name() const { return configuration_.interaction_name; }
    RecorderMode mode() const { return configuration_.mode; }
    const RecorderConfiguration& configuration() const { return configuration_; }

  private:
    void record(Request request, NextHandler next, ResponseCallback callback);
    void replay(Request request, ResponseCallback callback);
    void persist(InteractionMessage message);
    Response find_recorded_response(const Request& request);

    RecorderConfiguration configuration_;

    std::mutex mutex_;
    std::optional<RecorderMode> execution_mode_;
    std::shared_ptr<const Interaction> replay_interaction_;
  };
}

#endif // HTTPREC_RECORDER_INTERCEPTOR_RECORDER_INTERCEPTOR_HPP_
