#ifndef HTTPREC_RECORDER_CLIENT_HTTP_CLIENT_HPP_
#define HTTPREC_RECORDER_CLIENT_HTTP_CLIENT_HPP_

#include "interceptor/interceptor.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/url.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace httprec::recorder::client
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace net = boost::asio;
  namespace ssl = boost::asio::ssl;
  using tcp = boost::asio::ip::tcp;

  /**
   * @brief Asynchronous HTTP/HTTPS client with an interceptor pipeline.
   *
   * Every call runs through the installed interceptors in installation order;
   * the last one hands the request to the network. Inside the pipeline the
   * request target is absolute-form, and the network layer rewrites it to
   * origin-form with a matching Host header.
   *
   * Must be owned by a std::shared_ptr.
   */
  class HttpClient : public std::enable_shared_from_this<HttpClient>
  {
  public:
    // 全局 IO 池 + 默认 SSL
    HttpClient();

    // 全局 IO 池 + 自定义 SSL
    explicit HttpClient(ssl::context& ssl_ctx);

    // 指定外部 IO Context
    explicit HttpClient(net::io_context& ioc);
    HttpClient(net::io_context& ioc, ssl::context& ssl_ctx);

    virtual ~HttpClient() = default;

    // Configuration
    void set_base_url(const std::string& url);
    void set_default_header(const std::string& key, const std::string& value);
    void set_timeout(std::chrono::seconds seconds);

    // Appended to the end of the pipeline.
    void add_interceptor(std::shared_ptr<Interceptor> interceptor);

    void request(http::verb method,
                 std::string path, // relative path or full url
                 const std::map<std::string, std::string>& query_params,
                 const std::string& body,
                 const std::map<std::string, std::string>& headers,
                 ResponseCallback callback);

    // Sends a prepared request; its target must be absolute-form.
    void send(Request request, ResponseCallback callback);

    // Blocks until the pipeline answers; failures are rethrown. Do not call from a pool thread.
    Response request_sync(
      http::verb method,
      std::string path,
      const std::map<std::string, std::string>& query_params = {},
      const std::string& body = {},
      const std::map<std::string, std::string>& headers = {});

  private:
    using Pipeline = std::vector<std::shared_ptr<Interceptor>>;

    boost::urls::url resolve_url(const std::string& path, const std::map<std::string, std::string>& query) const;

    void dispatch(std::shared_ptr<const Pipeline> pipeline, std::size_t index, Request request,
                  ResponseCallback callback);
    void transmit(Request request, ResponseCallback callback);

    net::io_context& ioc_;

    // SSL Context Management
    std::shared_ptr<ssl::context> own_ssl_ctx_; // Holds ownership if created internally
    ssl::context* ssl_ctx_ptr_ = nullptr; // Points to the active context

    std::optional<boost::urls::url> base_url_;
    std::map<std::string, std::string> default_headers_;
    std::chrono::seconds timeout_{30};

    mutable std::mutex pipeline_mutex_;
    std::shared_ptr<const Pipeline> pipeline_ = std::make_shared<const Pipeline>();
  };
}

#endif // HTTPREC_RECORDER_CLIENT_HTTP_CLIENT_HPP_
