#ifndef HTTPREC_RECORDER_MATCHER_REQUEST_MATCHER_HPP_
#define HTTPREC_RECORDER_MATCHER_REQUEST_MATCHER_HPP_

#include "model/interaction.hpp"
#include <memory>
#include <optional>

namespace httprec::recorder
{
  class RequestMatcher
  {
  public:
    virtual ~RequestMatcher() = default;

    /**
     * @brief Finds the recorded message answering a live request.
     * @param request The live request (absolute-form target).
     * @param interaction The recorded interaction to search.
     * @return The matching message, or std::nullopt when nothing matches.
     */
    virtual std::optional<InteractionMessage> match(const Request& request, const Interaction& interaction) = 0;

    // Same rules, no per-session state. Each replay session works on its own copy.
    virtual std::shared_ptr<RequestMatcher> clone() const = 0;
  };
}

#endif // HTTPREC_RECORDER_MATCHER_REQUEST_MATCHER_HPP_
