// recorder/model/interaction.cpp
#include "interaction.hpp"
#include <boost/url/parse.hpp>

namespace httprec::recorder
{
  std::string request_url(const Request& request)
  {
    return std::string(request.target());
  }

  std::string request_host(const Request& request)
  {
    if (auto url = boost::urls::parse_uri(request.target()); url.has_value() && url->has_authority())
    {
      return std::string(url->host());
    }
    return std::string(request[http::field::host]);
  }

  std::string request_method(const Request& request)
  {
    return std::string(request.method_string());
  }

  void normalize_response(Response& response)
  {
    if (response.body().empty() && response.find(http::field::content_length) == response.end())
    {
      return;
    }
    response.content_length(response.body().size());
  }
}
