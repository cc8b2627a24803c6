// recorder/anonymizer/rules_anonymizer.cpp
#include "rules_anonymizer.hpp"
#include <boost/beast/core/string.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <algorithm>
#include <utility>

namespace httprec::recorder
{
  namespace
  {
    template <class Fields>
    void mask_header(Fields& fields, const std::string& name)
    {
      if (fields.find(name) == fields.end())
      {
        return;
      }

      // beast 不支持原地修改字段值，整体重建以保持原有顺序
      std::vector<std::pair<std::string, std::string>> copy;
      for (auto const& field : fields)
      {
        copy.emplace_back(std::string(field.name_string()),
                          boost::beast::iequals(field.name_string(), name)
                            ? std::string(RulesAnonymizer::kSentinel)
                            : std::string(field.value()));
      }
      for (auto const& entry : copy)
      {
        fields.erase(entry.first);
      }
      for (auto const& entry : copy)
      {
        fields.insert(entry.first, entry.second);
      }
    }
  }

  void mask_query_parameter(Request& request, const std::string& name)
  {
    const std::string target(request.target());
    auto parsed = boost::urls::parse_uri_reference(target);
    if (!parsed.has_value() || !parsed->has_query())
    {
      return;
    }

    boost::urls::url url(*parsed);
    std::vector<boost::urls::param> params;
    bool changed = false;
    for (auto param : url.params())
    {
      boost::urls::param p;
      p.key = std::string(param.key);
      p.value = std::string(param.value);
      p.has_value = param.has_value;
      if (p.has_value && p.key == name && p.value != RulesAnonymizer::kSentinel)
      {
        p.value = RulesAnonymizer::kSentinel;
        changed = true;
      }
      params.push_back(std::move(p));
    }
    if (!changed)
    {
      return;
    }

    url.params().assign(params.begin(), params.end());
    request.target(std::string(url.buffer()));
  }

  void mask_body(std::string& body, const std::regex& pattern)
  {
    if (body.empty())
    {
      return;
    }

    std::string masked = body;
    const std::sregex_iterator end;
    for (std::sregex_iterator it(body.begin(), body.end(), pattern); it != end; ++it)
    {
      const auto& match = *it;
      const std::size_t group = match.size() > 1 && match[1].matched ? 1 : 0;
      const auto position = static_cast<std::size_t>(match.position(group));
      const auto length = static_cast<std::size_t>(match.length(group));
      std::fill_n(masked.begin() + static_cast<std::ptrdiff_t>(position), length, RulesAnonymizer::kMaskChar);
    }
    body = std::move(masked);
  }

  void mask_body_values(std::string& body, const std::regex& key, std::string_view terminators)
  {
    if (body.empty())
    {
      return;
    }

    // 正则只定位 key, 值用线性扫描, 避免 std::regex 在长值上递归过深
    std::size_t offset = 0;
    std::smatch match;
    while (offset < body.size() &&
      std::regex_search(body.cbegin() + static_cast<std::ptrdiff_t>(offset), body.cend(), match, key))
    {
      auto position = offset + static_cast<std::size_t>(match.position(0) + match.length(0));
      const auto value_end = std::min(body.find_first_of(terminators, position), body.size());
      std::fill(body.begin() + static_cast<std::ptrdiff_t>(position),
                body.begin() + static_cast<std::ptrdiff_t>(value_end), RulesAnonymizer::kMaskChar);
      offset = match.length(0) == 0 && value_end == position ? value_end + 1 : value_end;
    }
  }

  RulesAnonymizer::RulesAnonymizer(std::vector<Rule> rules)
    : rules_(std::move(rules))
  {
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::create()
  {
    return std::make_shared<RulesAnonymizer>();
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::defaults()
  {
    return create()
           ->anonymize_request_header("Authorization")
           ->anonymize_request_header("Proxy-Authorization")
           ->anonymize_request_body_value("password=", "&\t\r\n ", std::regex::ECMAScript | std::regex::icase)
           ->anonymize_request_body_value(R"("password"\s*:\s*")", "\"", std::regex::ECMAScript | std::regex::icase);
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::with(Rule rule) const
  {
    auto rules = rules_;
    rules.push_back(std::move(rule));
    return std::make_shared<RulesAnonymizer>(std::move(rules));
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::anonymize_request_header(std::string name) const
  {
    return with([name = std::move(name)](InteractionMessage& message)
    {
      mask_header(message.request, name);
    });
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::anonymize_response_header(std::string name) const
  {
    return with([name = std::move(name)](InteractionMessage& message)
    {
      mask_header(message.response, name);
    });
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::anonymize_request_query_parameter(std::string name) const
  {
    return with([name = std::move(name)](InteractionMessage& message)
    {
      mask_query_parameter(message.request, name);
    });
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::anonymize_request_body(
    const std::string& pattern, std::regex::flag_type flags) const
  {
    return with([regex = std::regex(pattern, flags)](InteractionMessage& message)
    {
      mask_body(message.request.body(), regex);
    });
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::anonymize_request_body_value(
    const std::string& key_pattern, std::string terminators, std::regex::flag_type flags) const
  {
    return with([key = std::regex(key_pattern, flags), terminators = std::move(terminators)](InteractionMessage& message)
    {
      mask_body_values(message.request.body(), key, terminators);
    });
  }

  std::shared_ptr<RulesAnonymizer> RulesAnonymizer::anonymize_response_body(
    const std::string& pattern, std::regex::flag_type flags) const
  {
    return with([regex = std::regex(pattern, flags)](InteractionMessage& message)
    {
      mask_body(message.response.body(), regex);
    });
  }

  Interaction RulesAnonymizer::anonymize(Interaction interaction) const
  {
    for (auto& message : interaction.messages)
    {
      for (const auto& rule : rules_)
      {
        rule(message);
      }
    }
    return interaction;
  }
}
