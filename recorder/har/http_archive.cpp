// recorder/har/http_archive.cpp
#include "http_archive.hpp"
#include "dto/TagInvoke.hpp"
#include "exception/recorder_exception.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/url/parse.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>

#ifndef HTTPREC_VERSION
#define HTTPREC_VERSION "0.0.0"
#endif

namespace httprec::recorder::har
{
  namespace
  {
    namespace pt = boost::posix_time;

    const pt::ptime& unix_epoch()
    {
      static const pt::ptime epoch(boost::gregorian::date(1970, 1, 1));
      return epoch;
    }

    template <class Fields>
    std::vector<NameValue> to_name_values(const Fields& fields)
    {
      std::vector<NameValue> result;
      for (auto const& field : fields)
      {
        result.push_back({std::string(field.name_string()), std::string(field.value())});
      }
      return result;
    }

    std::vector<NameValue> to_query_string(const std::string& url)
    {
      std::vector<NameValue> result;
      auto parsed = boost::urls::parse_uri_reference(url);
      if (!parsed.has_value())
      {
        return result;
      }
      for (auto param : parsed->params())
      {
        result.push_back({std::string(param.key), std::string(param.value)});
      }
      return result;
    }

    std::vector<PostDataParam> to_form_params(const std::string& body)
    {
      std::vector<PostDataParam> result;
      // url_view 引用 query 的内存，query 必须活到循环结束
      const std::string query = "?" + body;
      auto parsed = boost::urls::parse_relative_ref(query);
      if (!parsed.has_value())
      {
        return result;
      }
      for (auto param : parsed->params())
      {
        PostDataParam p;
        p.name = std::string(param.key);
        if (param.has_value)
        {
          p.value = std::string(param.value);
        }
        result.push_back(std::move(p));
      }
      return result;
    }

    void encode_body(const std::string& body, std::optional<std::string>& text, std::optional<std::string>& encoding)
    {
      if (is_text(body))
      {
        text = body;
      }
      else
      {
        text = base64_encode(body);
        encoding = "base64";
      }
    }

    std::string decode_body(const std::string& text, const std::optional<std::string>& encoding)
    {
      if (!encoding.has_value() || encoding->empty())
      {
        return text;
      }
      if (*encoding == "base64")
      {
        return base64_decode(text);
      }
      throw MalformedArchive(fmt::format("Unsupported content encoding '{}'", *encoding));
    }

    template <class Fields>
    std::string header_value(const Fields& fields, http::field name)
    {
      return std::string(fields[name]);
    }

    template <class Message>
    void insert_headers(Message& message, const std::vector<NameValue>& headers)
    {
      for (const auto& header : headers)
      {
        if (header.name.empty())
        {
          throw MalformedArchive("Archive contains a header without a name");
        }
        message.insert(header.name, header.value);
      }
    }
  }

  bool is_text(std::string_view data)
  {
    std::size_t i = 0;
    while (i < data.size())
    {
      const auto c = static_cast<unsigned char>(data[i]);
      if (c == 0)
      {
        return false;
      }
      if (c < 0x80)
      {
        ++i;
        continue;
      }

      std::size_t extra = 0;
      unsigned char lower = 0x80;
      unsigned char upper = 0xBF;
      if (c >= 0xC2 && c <= 0xDF)
      {
        extra = 1;
      }
      else if (c >= 0xE0 && c <= 0xEF)
      {
        extra = 2;
        if (c == 0xE0) lower = 0xA0; // overlong
        if (c == 0xED) upper = 0x9F; // surrogates
      }
      else if (c >= 0xF0 && c <= 0xF4)
      {
        extra = 3;
        if (c == 0xF0) lower = 0x90;
        if (c == 0xF4) upper = 0x8F;
      }
      else
      {
        return false;
      }

      if (data.size() - i <= extra)
      {
        return false;
      }
      for (std::size_t k = 1; k <= extra; ++k)
      {
        const auto cc = static_cast<unsigned char>(data[i + k]);
        const auto lo = k == 1 ? lower : static_cast<unsigned char>(0x80);
        const auto hi = k == 1 ? upper : static_cast<unsigned char>(0xBF);
        if (cc < lo || cc > hi)
        {
          return false;
        }
      }
      i += extra + 1;
    }
    return true;
  }

  std::string base64_encode(std::string_view data)
  {
    using namespace boost::archive::iterators;
    using It = base64_from_binary<transform_width<std::string_view::const_iterator, 6, 8>>;

    std::string result(It(data.begin()), It(data.end()));
    result.append((3 - data.size() % 3) % 3, '=');
    return result;
  }

  std::string base64_decode(std::string_view text)
  {
    using namespace boost::archive::iterators;
    using It = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    if (text.size() % 4 != 0)
    {
      throw MalformedArchive("Invalid base64 content: length is not a multiple of 4");
    }

    std::string input(text);
    const auto padding = input.size() - std::min(input.size(), input.find_last_not_of('=') + 1);
    if (padding > 2)
    {
      throw MalformedArchive("Invalid base64 content: too much padding");
    }
    std::replace(input.end() - static_cast<std::ptrdiff_t>(padding), input.end(), '=', 'A');

    std::string result;
    try
    {
      result.assign(It(input.cbegin()), It(input.cend()));
    }
    catch (const std::exception& e)
    {
      throw MalformedArchive(fmt::format("Invalid base64 content: {}", e.what()));
    }
    result.erase(result.size() - std::min(result.size(), padding));
    return result;
  }

  std::string format_timestamp(std::chrono::system_clock::time_point time)
  {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
    return pt::to_iso_extended_string(unix_epoch() + pt::microseconds(us)) + "Z";
  }

  std::chrono::system_clock::time_point parse_timestamp(const std::string& input)
  {
    std::string text = input;
    long offset_minutes = 0;

    try
    {
      if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
      {
        text.pop_back();
      }
      else if (text.size() > 6 && (text[text.size() - 6] == '+' || text[text.size() - 6] == '-')
        && text[text.size() - 3] == ':')
      {
        const int sign = text[text.size() - 6] == '-' ? -1 : 1;
        const int hours = std::stoi(text.substr(text.size() - 5, 2));
        const int minutes = std::stoi(text.substr(text.size() - 2, 2));
        offset_minutes = sign * (hours * 60 + minutes);
        text.resize(text.size() - 6);
      }

      const pt::ptime local = pt::from_iso_extended_string(text);
      if (local.is_special())
      {
        throw std::invalid_argument("not a date time");
      }
      const pt::ptime utc = local - pt::minutes(offset_minutes);
      const auto us = (utc - unix_epoch()).total_microseconds();
      return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(us)));
    }
    catch (const std::exception& e)
    {
      throw MalformedArchive(fmt::format("Invalid startedDateTime '{}': {}", input, e.what()));
    }
  }

  std::string format_http_version(unsigned version)
  {
    return fmt::format("HTTP/{}.{}", version / 10, version % 10);
  }

  unsigned parse_http_version(std::string_view text)
  {
    constexpr std::string_view prefix = "HTTP/";
    if (text.size() < prefix.size() + 1
      || !boost::beast::iequals(boost::beast::string_view(text.data(), prefix.size()),
                                boost::beast::string_view(prefix.data(), prefix.size())))
    {
      return 11;
    }
    const auto major = text[prefix.size()];
    if (!std::isdigit(static_cast<unsigned char>(major)))
    {
      return 11;
    }
    unsigned version = static_cast<unsigned>(major - '0') * 10;
    if (text.size() >= prefix.size() + 3 && text[prefix.size() + 1] == '.'
      && std::isdigit(static_cast<unsigned char>(text[prefix.size() + 2])))
    {
      version += static_cast<unsigned>(text[prefix.size() + 2] - '0');
    }
    return version;
  }

  Entry to_entry(const InteractionMessage& message)
  {
    Entry entry;
    entry.startedDateTime = format_timestamp(message.timings.start);
    entry.time = static_cast<double>(message.timings.elapsed.count()) / 1000.0;

    const auto& req = message.request;
    entry.request.method = std::string(req.method_string());
    entry.request.url = std::string(req.target());
    entry.request.httpVersion = format_http_version(req.version());
    entry.request.headers = to_name_values(req);
    entry.request.queryString = to_query_string(entry.request.url);
    entry.request.bodySize = static_cast<std::int64_t>(req.body().size());
    if (!req.body().empty())
    {
      PostData post_data;
      post_data.mimeType = header_value(req, http::field::content_type);
      encode_body(req.body(), post_data.text, post_data.encoding);
      if (!post_data.encoding.has_value()
        && boost::beast::iequals(post_data.mimeType.substr(0, 33), "application/x-www-form-urlencoded"))
      {
        post_data.params = to_form_params(req.body());
      }
      entry.request.postData = std::move(post_data);
    }

    const auto& res = message.response;
    entry.response.status = res.result_int();
    entry.response.statusText = std::string(res.reason());
    entry.response.httpVersion = format_http_version(res.version());
    entry.response.headers = to_name_values(res);
    entry.response.content.size = static_cast<std::int64_t>(res.body().size());
    entry.response.content.mimeType = header_value(res, http::field::content_type);
    if (!res.body().empty())
    {
      encode_body(res.body(), entry.response.content.text, entry.response.content.encoding);
    }
    entry.response.redirectURL = header_value(res, http::field::location);
    entry.response.bodySize = static_cast<std::int64_t>(res.body().size());

    entry.timings.send = 0;
    entry.timings.wait = entry.time;
    entry.timings.receive = 0;
    return entry;
  }

  HttpArchive to_archive(const Interaction& interaction)
  {
    HttpArchive archive;
    archive.log.version = std::string(kArchiveVersion);
    archive.log.creator.name = std::string(kCreatorName);
    archive.log.creator.version = HTTPREC_VERSION;
    archive.log.entries.reserve(interaction.messages.size());
    for (const auto& message : interaction.messages)
    {
      archive.log.entries.push_back(to_entry(message));
    }
    return archive;
  }

  InteractionMessage from_entry(const Entry& entry)
  {
    if (entry.request.method.empty())
    {
      throw MalformedArchive("Archive entry has an empty request method");
    }
    if (entry.request.url.empty())
    {
      throw MalformedArchive("Archive entry has an empty request url");
    }
    if (entry.response.status < 0 || entry.response.status > 999)
    {
      throw MalformedArchive(fmt::format("Archive entry has an invalid status {}", entry.response.status));
    }

    InteractionMessage message;

    auto& req = message.request;
    const auto verb = http::string_to_verb(entry.request.method);
    if (verb == http::verb::unknown)
    {
      req.method_string(entry.request.method);
    }
    else
    {
      req.method(verb);
    }
    req.target(entry.request.url);
    req.version(parse_http_version(entry.request.httpVersion));
    insert_headers(req, entry.request.headers);
    if (entry.request.postData.has_value() && entry.request.postData->text.has_value())
    {
      req.body() = decode_body(*entry.request.postData->text, entry.request.postData->encoding);
    }

    auto& res = message.response;
    res.result(static_cast<unsigned>(entry.response.status));
    res.reason(entry.response.statusText);
    res.version(parse_http_version(entry.response.httpVersion));
    insert_headers(res, entry.response.headers);
    if (entry.response.content.text.has_value())
    {
      res.body() = decode_body(*entry.response.content.text, entry.response.content.encoding);
    }

    message.timings.start = parse_timestamp(entry.startedDateTime);
    message.timings.elapsed = std::chrono::microseconds(std::llround(entry.time * 1000.0));
    return message;
  }

  Interaction from_archive(const HttpArchive& archive, const std::string& name)
  {
    if (archive.log.version != "1.2" && archive.log.version != "1.1")
    {
      throw MalformedArchive(fmt::format("Unsupported archive version '{}'", archive.log.version));
    }

    Interaction interaction;
    interaction.name = name;
    interaction.messages.reserve(archive.log.entries.size());
    for (const auto& entry : archive.log.entries)
    {
      interaction.messages.push_back(from_entry(entry));
    }
    return interaction;
  }

  std::string serialize(const HttpArchive& archive)
  {
    return boost::json::serialize(boost::json::value_from(archive));
  }

  std::string serialize_entry(const Entry& entry)
  {
    return boost::json::serialize(boost::json::value_from(entry));
  }

  HttpArchive parse(std::string_view document)
  {
    boost::json::error_code ec;
    auto jv = boost::json::parse(document, ec);
    if (ec)
    {
      throw MalformedArchive(fmt::format("Invalid archive JSON: {}", ec.message()));
    }

    try
    {
      return boost::json::value_to<HttpArchive>(jv);
    }
    catch (const std::exception& e)
    {
      throw MalformedArchive(fmt::format("Invalid archive structure: {}", e.what()));
    }
  }

  namespace
  {
    // 检查 pos 之前 (跳过空白) 是否为 "key":
    bool preceded_by_key(std::string_view text, std::size_t pos, std::string_view key)
    {
      if (pos == 0)
      {
        return false;
      }
      auto end = text.find_last_not_of(" \t\r\n", pos - 1);
      if (end == std::string_view::npos || end == 0 || text[end] != ':')
      {
        return false;
      }
      end = text.find_last_not_of(" \t\r\n", end - 1);
      if (end == std::string_view::npos)
      {
        return false;
      }
      const auto quoted = fmt::format("\"{}\"", key);
      return end + 1 >= quoted.size() && text.substr(end + 1 - quoted.size(), quoted.size()) == quoted;
    }

    /**
     * @brief Finds the '[' opening the array whose ']' sits at close_at.
     *
     * Scans the document up to close_at, skipping string contents, and only
     * accepts the bracket when it is the value of "entries" inside the root
     * "log" object.
     */
    std::optional<std::size_t> find_entries_open(std::string_view body, std::size_t close_at)
    {
      std::vector<std::size_t> open;
      bool in_string = false;
      for (std::size_t i = 0; i < body.size(); ++i)
      {
        const char c = body[i];
        if (in_string)
        {
          if (c == '\\')
          {
            ++i;
          }
          else if (c == '"')
          {
            in_string = false;
          }
          continue;
        }
        switch (c)
        {
        case '"':
          in_string = true;
          break;
        case '{':
        case '[':
          open.push_back(i);
          break;
        case '}':
        case ']':
          if (open.empty())
          {
            return std::nullopt;
          }
          if (i == close_at)
          {
            if (c != ']' || open.size() != 3 || body[open[0]] != '{' || body[open[1]] != '{' ||
              !preceded_by_key(body, open[1], "log") || !preceded_by_key(body, open[2], "entries"))
            {
              return std::nullopt;
            }
            return open[2];
          }
          open.pop_back();
          break;
        default:
          break;
        }
      }
      return std::nullopt;
    }
  }

  std::optional<std::string> append_entries(std::string_view document, const std::vector<Entry>& entries)
  {
    constexpr std::string_view tail = "]}}";

    const auto last = document.find_last_not_of(" \t\r\n");
    if (last == std::string_view::npos || entries.empty())
    {
      return std::nullopt;
    }

    const auto body = document.substr(0, last + 1);
    if (body.size() <= tail.size() || body.substr(body.size() - tail.size()) != tail)
    {
      return std::nullopt;
    }

    const auto insert_at = body.size() - tail.size();
    const auto open_at = find_entries_open(body, insert_at);
    if (!open_at)
    {
      return std::nullopt;
    }

    bool first = false;
    const auto before = body.find_last_not_of(" \t\r\n", insert_at - 1);
    if (before == *open_at)
    {
      first = true;
    }
    else if (body[before] != '}')
    {
      return std::nullopt;
    }

    std::string result(body.substr(0, insert_at));
    for (const auto& entry : entries)
    {
      if (!first)
      {
        result += ',';
      }
      result += serialize_entry(entry);
      first = false;
    }
    result += tail;
    return result;
  }
}
