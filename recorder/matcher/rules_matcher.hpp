#ifndef HTTPREC_RECORDER_MATCHER_RULES_MATCHER_HPP_
#define HTTPREC_RECORDER_MATCHER_RULES_MATCHER_HPP_

#include "matcher/request_matcher.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httprec::recorder
{
  /**
   * @brief Matcher built from composable rules; every rule must agree.
   *
   * Builders are immutable and return a new matcher, so a configured matcher can be
   * shared as a template:
   *
   *   auto matcher = RulesMatcher::match_once()->by_http_method()->by_request_uri();
   *
   * In match-once mode each recorded message answers at most one live request
   * for the lifetime of the matcher instance. RecorderInterceptor clones the
   * configured matcher, so every replay session starts with nothing consumed.
   */
  class RulesMatcher : public RequestMatcher
  {
  public:
    using Rule = std::function<bool(const Request&, const InteractionMessage&)>;

    RulesMatcher(bool match_once, std::vector<Rule> rules);

    static std::shared_ptr<RulesMatcher> match_once();
    static std::shared_ptr<RulesMatcher> match_multiple();

    std::shared_ptr<RulesMatcher> by(Rule rule) const;
    std::shared_ptr<RulesMatcher> by_http_method() const;
    std::shared_ptr<RulesMatcher> by_request_uri() const;
    std::shared_ptr<RulesMatcher> by_header(std::string name) const;
    std::shared_ptr<RulesMatcher> by_content() const;

    std::optional<InteractionMessage> match(const Request& request, const Interaction& interaction) override;
    std::shared_ptr<RequestMatcher> clone() const override;

    bool is_match_once() const { return match_once_; }

    // Forgets consumed messages, e.g. to replay the same interaction again.
    void reset();

  private:
    bool match_once_;
    std::vector<Rule> rules_;

    std::mutex mutex_;
    std::set<std::pair<std::string, std::size_t>> consumed_;
  };

  /**
   * @brief Compares two absolute URLs.
   *
   * Scheme and host are case-insensitive, default ports are implied, an empty path
   * equals "/", the fragment is ignored and query parameters are compared as an
   * unordered multiset of decoded key/value pairs.
   */
  bool equivalent_urls(std::string_view lhs, std::string_view rhs);
}

#endif // HTTPREC_RECORDER_MATCHER_RULES_MATCHER_HPP_
