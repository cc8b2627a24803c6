// recorder/matcher/rules_matcher.cpp
#include "rules_matcher.hpp"
#include <boost/beast/core/string.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <algorithm>
#include <cctype>

namespace httprec::recorder
{
  namespace
  {
    struct NormalizedUrl
    {
      std::string scheme;
      std::string host;
      std::string port;
      std::string path;
      std::vector<std::pair<std::string, std::string>> query;

      bool operator==(const NormalizedUrl& other) const
      {
        return scheme == other.scheme && host == other.host && port == other.port && path == other.path
          && query == other.query;
      }
    };

    std::string to_lower(std::string text)
    {
      std::transform(text.begin(), text.end(), text.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return text;
    }

    std::optional<NormalizedUrl> normalize_url(std::string_view text)
    {
      auto parsed = boost::urls::parse_uri_reference(text);
      if (!parsed.has_value())
      {
        return std::nullopt;
      }

      boost::urls::url url(*parsed);
      url.normalize();

      NormalizedUrl result;
      result.scheme = to_lower(std::string(url.scheme()));
      result.host = to_lower(std::string(url.host()));
      result.port = std::string(url.port());
      if (result.port.empty())
      {
        if (result.scheme == "http") result.port = "80";
        else if (result.scheme == "https") result.port = "443";
      }
      result.path = std::string(url.encoded_path());
      if (result.path.empty())
      {
        result.path = "/";
      }
      for (auto param : url.params())
      {
        result.query.emplace_back(std::string(param.key), param.has_value ? std::string(param.value) : std::string());
      }
      std::sort(result.query.begin(), result.query.end());
      return result;
    }

    template <class Fields>
    std::vector<std::string> header_values(const Fields& fields, const std::string& name)
    {
      std::vector<std::string> values;
      auto range = fields.equal_range(name);
      for (auto it = range.first; it != range.second; ++it)
      {
        values.emplace_back(it->value());
      }
      return values;
    }
  }

  bool equivalent_urls(std::string_view lhs, std::string_view rhs)
  {
    auto left = normalize_url(lhs);
    auto right = normalize_url(rhs);
    if (!left.has_value() || !right.has_value())
    {
      return lhs == rhs;
    }
    return *left == *right;
  }

  RulesMatcher::RulesMatcher(bool match_once, std::vector<Rule> rules)
    : match_once_(match_once), rules_(std::move(rules))
  {
  }

  std::shared_ptr<RulesMatcher> RulesMatcher::match_once()
  {
    return std::make_shared<RulesMatcher>(true, std::vector<Rule>{});
  }

  std::shared_ptr<RulesMatcher> RulesMatcher::match_multiple()
  {
    return std::make_shared<RulesMatcher>(false, std::vector<Rule>{});
  }

  std::shared_ptr<RequestMatcher> RulesMatcher::clone() const
  {
    return std::make_shared<RulesMatcher>(match_once_, rules_);
  }

  std::shared_ptr<RulesMatcher> RulesMatcher::by(Rule rule) const
  {
    auto rules = rules_;
    rules.push_back(std::move(rule));
    return std::make_shared<RulesMatcher>(match_once_, std::move(rules));
  }

  std::shared_ptr<RulesMatcher> RulesMatcher::by_http_method() const
  {
    return by([](const Request& request, const InteractionMessage& message)
    {
      return boost::beast::iequals(request.method_string(), message.request.method_string());
    });
  }

  std::shared_ptr<RulesMatcher> RulesMatcher::by_request_uri() const
  {
    return by([](const Request& request, const InteractionMessage& message)
    {
      return equivalent_urls(request_url(request), request_url(message.request));
    });
  }

  std::shared_ptr<RulesMatcher> RulesMatcher::by_header(std::string name) const
  {
    return by([name = std::move(name)](const Request& request, const InteractionMessage& message)
    {
      return header_values(request, name) == header_values(message.request, name);
    });
  }

  std::shared_ptr<RulesMatcher> RulesMatcher::by_content() const
  {
    return by([](const Request& request, const InteractionMessage& message)
    {
      return request.body() == message.request.body();
    });
  }

  std::optional<InteractionMessage> RulesMatcher::match(const Request& request, const Interaction& interaction)
  {
    // 查找与标记消费必须是一个原子操作
    std::lock_guard<std::mutex> lock(mutex_);

    for (std::size_t i = 0; i < interaction.messages.size(); ++i)
    {
      auto key = std::make_pair(interaction.name, i);
      if (match_once_ && consumed_.count(key) != 0)
      {
        continue;
      }

      const auto& candidate = interaction.messages[i];
      const bool matched = std::all_of(rules_.begin(), rules_.end(), [&](const Rule& rule)
      {
        return rule(request, candidate);
      });
      if (!matched)
      {
        continue;
      }

      if (match_once_)
      {
        consumed_.insert(std::move(key));
      }
      return candidate;
    }
    return std::nullopt;
  }

  void RulesMatcher::reset()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    consumed_.clear();
  }
}
