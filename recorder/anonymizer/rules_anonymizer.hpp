#ifndef HTTPREC_RECORDER_ANONYMIZER_RULES_ANONYMIZER_HPP_
#define HTTPREC_RECORDER_ANONYMIZER_RULES_ANONYMIZER_HPP_

#include "anonymizer/interaction_anonymizer.hpp"
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace httprec::recorder
{
  /**
   * @brief Anonymizer built from per-message rules, applied in order.
   *
   * Header and query parameter values are replaced with kSentinel. Body rules
   * replace each regex match (or its first capture group, when the pattern has
   * one) with kMaskChar, character for character, so body sizes do not change.
   */
  class RulesAnonymizer : public InteractionAnonymizer
  {
  public:
    using Rule = std::function<void(InteractionMessage&)>;

    static constexpr const char* kSentinel = "********";
    static constexpr char kMaskChar = '*';

    explicit RulesAnonymizer(std::vector<Rule> rules = {});

    static std::shared_ptr<RulesAnonymizer> create();

    // Authorization and Proxy-Authorization request headers, password=... in request bodies.
    static std::shared_ptr<RulesAnonymizer> defaults();

    std::shared_ptr<RulesAnonymizer> with(Rule rule) const;
    std::shared_ptr<RulesAnonymizer> anonymize_request_header(std::string name) const;
    std::shared_ptr<RulesAnonymizer> anonymize_response_header(std::string name) const;
    std::shared_ptr<RulesAnonymizer> anonymize_request_query_parameter(std::string name) const;
    std::shared_ptr<RulesAnonymizer> anonymize_request_body(
      const std::string& pattern, std::regex::flag_type flags = std::regex::ECMAScript) const;
    // Masks what follows each key_pattern match, up to the first terminator character or the end of the body.
    std::shared_ptr<RulesAnonymizer> anonymize_request_body_value(
      const std::string& key_pattern, std::string terminators,
      std::regex::flag_type flags = std::regex::ECMAScript) const;
    std::shared_ptr<RulesAnonymizer> anonymize_response_body(
      const std::string& pattern, std::regex::flag_type flags = std::regex::ECMAScript) const;

    Interaction anonymize(Interaction interaction) const override;

  private:
    std::vector<Rule> rules_;
  };

  // Building blocks of the rules above.
  void mask_query_parameter(Request& request, const std::string& name);
  void mask_body(std::string& body, const std::regex& pattern);
  void mask_body_values(std::string& body, const std::regex& key, std::string_view terminators);
}

#endif // HTTPREC_RECORDER_ANONYMIZER_RULES_ANONYMIZER_HPP_
