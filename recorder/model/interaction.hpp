#ifndef HTTPREC_RECORDER_MODEL_INTERACTION_HPP_
#define HTTPREC_RECORDER_MODEL_INTERACTION_HPP_

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace httprec::recorder
{
  namespace http = boost::beast::http;

  // Inside the interceptor pipeline the request target is kept in absolute-form
  // ("https://host/path?query"); the network transport rewrites it to origin-form.
  using Request = http::request<http::string_body>;
  using Response = http::response<http::string_body>;

  struct InteractionMessageTimings
  {
    std::chrono::system_clock::time_point start;
    std::chrono::microseconds elapsed{0};
  };

  struct InteractionMessage
  {
    Request request;
    Response response;
    InteractionMessageTimings timings;
  };

  /**
   * @brief A named, ordered set of captured request/response pairs.
   *
   * Messages keep call order and are never reordered. An interaction without
   * messages is never persisted.
   */
  struct Interaction
  {
    std::string name;
    std::vector<InteractionMessage> messages;
  };

  std::string request_url(const Request& request);

  // Host of the absolute-form target, falling back to the Host header.
  std::string request_host(const Request& request);

  std::string request_method(const Request& request);

  /**
   * @brief Makes a response look like a fresh network response.
   *
   * Recomputes the content length from the body and sets it explicitly when the
   * response carries a body or already announced a length.
   */
  void normalize_response(Response& response);
}

#endif // HTTPREC_RECORDER_MODEL_INTERACTION_HPP_
