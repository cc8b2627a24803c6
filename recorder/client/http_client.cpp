#include "http_client.hpp"
#include "io_context_pool.hpp"
#include <boost/asio/connect.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <future>
#include <stdexcept>

namespace httprec::recorder::client
{
  // ==========================================
  // Abstract Session to handle common logic
  // ==========================================
  class Session : public std::enable_shared_from_this<Session>
  {
  protected:
    ResponseCallback callback_;
    Request req_;
    Response res_;
    beast::flat_buffer buffer_;
    std::chrono::seconds timeout_;

  public:
    Session(ResponseCallback callback, std::chrono::seconds timeout)
      : callback_(std::move(callback)), timeout_(timeout)
    {
    }

    virtual ~Session() = default;
    virtual void run(const std::string& host, const std::string& port, Request req) = 0;

  protected:
    void on_fail(beast::error_code ec, const char* what)
    {
      // operation_aborted (取消) 也原样上报
      if (callback_) callback_(std::make_exception_ptr(boost::system::system_error(ec, what)), {});
    }

    void on_success()
    {
      if (callback_) callback_(nullptr, std::move(res_));
    }
  };

  // ==========================================
  // Plain HTTP Session
  // ==========================================
  class HttpSession : public Session
  {
    beast::tcp_stream stream_;
    tcp::resolver resolver_;

    // Helper: Downcast shared_from_this to avoid template deduction errors
    std::shared_ptr<HttpSession> get_shared()
    {
      return std::static_pointer_cast<HttpSession>(shared_from_this());
    }

  public:
    HttpSession(net::io_context& ioc, ResponseCallback cb, std::chrono::seconds timeout)
      : Session(std::move(cb), timeout), stream_(ioc), resolver_(ioc)
    {
    }

    void run(const std::string& host, const std::string& port, Request req) override
    {
      req_ = std::move(req);
      stream_.expires_after(timeout_);
      resolver_.async_resolve(host, port,
                              beast::bind_front_handler(&HttpSession::on_resolve, get_shared()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
    {
      if (ec) return on_fail(ec, "resolve");
      stream_.expires_after(timeout_);
      stream_.async_connect(results,
                            beast::bind_front_handler(&HttpSession::on_connect, get_shared()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
    {
      if (ec) return on_fail(ec, "connect");
      stream_.expires_after(timeout_);
      http::async_write(stream_, req_,
                        beast::bind_front_handler(&HttpSession::on_write, get_shared()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred)
    {
      boost::ignore_unused(bytes_transferred);
      if (ec) return on_fail(ec, "write");

      http::async_read(stream_, buffer_, res_,
                       beast::bind_front_handler(&HttpSession::on_read, get_shared()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred)
    {
      boost::ignore_unused(bytes_transferred);
      if (ec) return on_fail(ec, "read");

      // 关闭失败不影响已收到的响应
      stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
      on_success();
    }
  };

  // ==========================================
  // HTTPS Session
  // ==========================================
  class HttpsSession : public Session
  {
    beast::ssl_stream<beast::tcp_stream> stream_;
    tcp::resolver resolver_;

    std::shared_ptr<HttpsSession> get_shared()
    {
      return std::static_pointer_cast<HttpsSession>(shared_from_this());
    }

  public:
    HttpsSession(net::io_context& ioc, ssl::context& ctx, ResponseCallback cb, std::chrono::seconds timeout)
      : Session(std::move(cb), timeout), stream_(ioc, ctx), resolver_(ioc)
    {
    }

    void run(const std::string& host, const std::string& port, Request req) override
    {
      req_ = std::move(req);
      if (!SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str()))
      {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        return on_fail(ec, "ssl_setup");
      }

      stream_.next_layer().expires_after(timeout_);
      resolver_.async_resolve(host, port,
                              beast::bind_front_handler(&HttpsSession::on_resolve, get_shared()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
    {
      if (ec) return on_fail(ec, "resolve");
      stream_.next_layer().expires_after(timeout_);
      beast::get_lowest_layer(stream_).async_connect(results,
                                                     beast::bind_front_handler(
                                                       &HttpsSession::on_connect, get_shared()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
    {
      if (ec) return on_fail(ec, "connect");
      stream_.next_layer().expires_after(timeout_);
      stream_.async_handshake(ssl::stream_base::client,
                              beast::bind_front_handler(&HttpsSession::on_handshake, get_shared()));
    }

    void on_handshake(beast::error_code ec)
    {
      if (ec) return on_fail(ec, "handshake");
      stream_.next_layer().expires_after(timeout_);
      http::async_write(stream_, req_,
                        beast::bind_front_handler(&HttpsSession::on_write, get_shared()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred)
    {
      boost::ignore_unused(bytes_transferred);
      if (ec) return on_fail(ec, "write");
      http::async_read(stream_, buffer_, res_,
                       beast::bind_front_handler(&HttpsSession::on_read, get_shared()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred)
    {
      boost::ignore_unused(bytes_transferred);
      if (ec) return on_fail(ec, "read");

      stream_.async_shutdown(beast::bind_front_handler(&HttpsSession::on_shutdown, get_shared()));
    }

    void on_shutdown(beast::error_code)
    {
      // eof / stream_truncated 等关闭错误忽略，响应已完整读取
      on_success();
    }
  };

  namespace
  {
    std::shared_ptr<ssl::context> make_default_ssl_context()
    {
      auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
      ctx->set_default_verify_paths();
      ctx->set_verify_mode(ssl::verify_none);
      return ctx;
    }
  }

  HttpClient::HttpClient()
    : ioc_(IoContextPool::instance().get_io_context()),
      own_ssl_ctx_(make_default_ssl_context()),
      ssl_ctx_ptr_(own_ssl_ctx_.get())
  {
  }

  HttpClient::HttpClient(ssl::context& ssl_ctx)
    : ioc_(IoContextPool::instance().get_io_context()),
      ssl_ctx_ptr_(&ssl_ctx)
  {
  }

  HttpClient::HttpClient(net::io_context& ioc)
    : ioc_(ioc),
      own_ssl_ctx_(make_default_ssl_context()),
      ssl_ctx_ptr_(own_ssl_ctx_.get())
  {
  }

  HttpClient::HttpClient(net::io_context& ioc, ssl::context& ssl_ctx)
    : ioc_(ioc),
      ssl_ctx_ptr_(&ssl_ctx)
  {
  }

  void HttpClient::set_base_url(const std::string& url)
  {
    auto result = boost::urls::parse_uri(url);
    if (result.has_value())
    {
      base_url_ = result.value();
      return;
    }

    // Fallback for missing scheme
    auto with_scheme = boost::urls::parse_uri("http://" + url);
    if (!with_scheme.has_value())
    {
      throw std::invalid_argument("invalid base url: " + url);
    }
    base_url_ = with_scheme.value();
  }

  void HttpClient::set_default_header(const std::string& key, const std::string& value)
  {
    default_headers_[key] = value;
  }

  void HttpClient::set_timeout(std::chrono::seconds seconds)
  {
    timeout_ = seconds;
  }

  void HttpClient::add_interceptor(std::shared_ptr<Interceptor> interceptor)
  {
    if (!interceptor)
    {
      throw std::invalid_argument("interceptor must not be null");
    }

    // 写时复制，进行中的调用继续使用旧的管线
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    auto pipeline = std::make_shared<Pipeline>(*pipeline_);
    pipeline->push_back(std::move(interceptor));
    pipeline_ = std::move(pipeline);
  }

  boost::urls::url HttpClient::resolve_url(const std::string& path_in,
                                           const std::map<std::string, std::string>& query) const
  {
    boost::urls::url u;

    auto absolute = boost::urls::parse_uri(path_in);
    if (absolute.has_value())
    {
      u = absolute.value();
    }
    else if (base_url_.has_value())
    {
      u = base_url_.value();
      if (!path_in.empty())
      {
        if (path_in.front() != '/')
        {
          std::string base_path = u.path();
          if (base_path.empty() || base_path.back() != '/') base_path += '/';
          u.set_path(base_path + path_in);
        }
        else
        {
          u.set_path(path_in);
        }
      }
    }
    else
    {
      throw std::invalid_argument("relative path without base url: " + path_in);
    }

    for (const auto& [k, v] : query)
    {
      u.params().append({k, v});
    }

    if (u.encoded_path().empty()) u.set_path("/");
    return u;
  }

  void HttpClient::request(http::verb method,
                           std::string path,
                           const std::map<std::string, std::string>& query_params,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers,
                           ResponseCallback callback)
  {
    Request req;
    try
    {
      auto url = resolve_url(path, query_params);

      req = Request{method, std::string(url.buffer()), 11};
      req.set(http::field::host, std::string(url.encoded_host_and_port()));
      req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

      for (const auto& h : default_headers_) req.set(h.first, h.second);
      for (const auto& h : headers) req.set(h.first, h.second);

      if (!body.empty())
      {
        req.body() = body;
        req.prepare_payload();
      }
    }
    catch (const std::exception&)
    {
      if (callback) callback(std::current_exception(), {});
      return;
    }

    send(std::move(req), std::move(callback));
  }

  void HttpClient::send(Request request, ResponseCallback callback)
  {
    std::shared_ptr<const Pipeline> pipeline;
    {
      std::lock_guard<std::mutex> lock(pipeline_mutex_);
      pipeline = pipeline_;
    }
    dispatch(std::move(pipeline), 0, std::move(request), std::move(callback));
  }

  void HttpClient::dispatch(std::shared_ptr<const Pipeline> pipeline, std::size_t index, Request request,
                            ResponseCallback callback)
  {
    if (index == pipeline->size())
    {
      transmit(std::move(request), std::move(callback));
      return;
    }

    auto self = shared_from_this();
    auto& interceptor = (*pipeline)[index];
    interceptor->intercept(std::move(request),
                           [self, pipeline, index](Request next_request, ResponseCallback next_callback)
                           {
                             self->dispatch(pipeline, index + 1, std::move(next_request), std::move(next_callback));
                           },
                           std::move(callback));
  }

  void HttpClient::transmit(Request request, ResponseCallback callback)
  {
    auto parsed = boost::urls::parse_uri(std::string_view(request.target().data(), request.target().size()));
    if (!parsed.has_value())
    {
      if (callback)
        callback(std::make_exception_ptr(boost::system::system_error(parsed.error(), "parse target")), {});
      return;
    }

    const boost::urls::url_view url = parsed.value();
    const std::string scheme(url.scheme());
    std::string host(url.encoded_host());
    std::string port(url.port());
    std::string target(url.encoded_target());
    if (port.empty()) port = (scheme == "https") ? "443" : "80";
    if (target.empty()) target = "/";

    // 网络层使用 origin-form
    request.target(target);
    if (request.find(http::field::host) == request.end())
    {
      request.set(http::field::host, std::string(url.encoded_host_and_port()));
    }

    std::shared_ptr<Session> session;
    if (scheme == "https")
    {
      if (!ssl_ctx_ptr_)
      {
        if (callback)
          callback(std::make_exception_ptr(boost::system::system_error(
                     beast::error_code(beast::errc::operation_not_supported, beast::system_category()),
                     "ssl_setup")), {});
        return;
      }
      session = std::make_shared<HttpsSession>(ioc_, *ssl_ctx_ptr_, std::move(callback), timeout_);
    }
    else
    {
      session = std::make_shared<HttpSession>(ioc_, std::move(callback), timeout_);
    }
    session->run(host, port, std::move(request));
  }

  Response HttpClient::request_sync(
    http::verb method,
    std::string path,
    const std::map<std::string, std::string>& query_params,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
  {
    auto p = std::make_shared<std::promise<Response>>();
    auto f = p->get_future();

    this->request(method, std::move(path), query_params, body, headers,
                  [p](std::exception_ptr eptr, Response res)
                  {
                    if (eptr) p->set_exception(eptr);
                    else p->set_value(std::move(res));
                  });

    return f.get();
  }
}
