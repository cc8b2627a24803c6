#ifndef HTTPREC_RECORDER_TESTS_TEST_SUPPORT_HPP_
#define HTTPREC_RECORDER_TESTS_TEST_SUPPORT_HPP_

#include "recorder/interceptor/interceptor.hpp"
#include "recorder/model/interaction.hpp"
#include <boost/filesystem.hpp>
#include <boost/system/system_error.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace httprec::recorder::testing
{
  namespace fs = boost::filesystem;

  inline Request make_request(http::verb method, const std::string& url, std::string body = {})
  {
    Request request{method, url, 11};
    if (!body.empty())
    {
      request.set(http::field::content_type, "application/x-www-form-urlencoded");
      request.body() = std::move(body);
      request.prepare_payload();
    }
    return request;
  }

  inline Response make_response(http::status status, std::string body = {},
                                const std::string& content_type = "text/plain")
  {
    Response response{status, 11};
    response.set(http::field::content_type, content_type);
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
  }

  inline InteractionMessage make_message(http::verb method, const std::string& url, http::status status,
                                         std::string body)
  {
    InteractionMessage message;
    message.request = make_request(method, url);
    message.response = make_response(status, std::move(body));
    message.timings.start = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    message.timings.elapsed = std::chrono::milliseconds(42);
    return message;
  }

  // 每个测试一个独立的临时目录
  class TempDirectory
  {
  public:
    TempDirectory()
      : path_(fs::temp_directory_path() / fs::unique_path("httprec-test-%%%%-%%%%-%%%%"))
    {
      fs::create_directories(path_);
    }

    ~TempDirectory()
    {
      boost::system::error_code ec;
      fs::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const fs::path& path() const { return path_; }

  private:
    fs::path path_;
  };

  // Stands in for the network: answers every request with a canned response.
  class FakeNetwork
  {
  public:
    explicit FakeNetwork(Response response = make_response(http::status::ok, "from network"))
      : response_(std::move(response))
    {
    }

    NextHandler handler()
    {
      return [this](Request request, ResponseCallback callback)
      {
        ++calls_;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          last_target_ = std::string(request.target());
        }
        if (error_)
        {
          callback(std::make_exception_ptr(boost::system::system_error(error_)), Response{});
          return;
        }
        callback(nullptr, response_);
      };
    }

    void fail_with(boost::system::error_code error) { error_ = error; }

    int calls() const { return calls_.load(); }
    std::string last_target() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return last_target_;
    }

  private:
    Response response_;
    boost::system::error_code error_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::string last_target_;
  };

  struct CallResult
  {
    std::exception_ptr error;
    Response response;
  };

  // Runs one intercepted call and waits for its callback.
  template <typename InterceptorT>
  CallResult call(InterceptorT& interceptor, Request request, NextHandler next,
                  std::chrono::seconds timeout = std::chrono::seconds(10))
  {
    auto promise = std::make_shared<std::promise<CallResult>>();
    auto future = promise->get_future();
    interceptor.intercept(std::move(request), std::move(next), [promise](std::exception_ptr error, Response response)
    {
      promise->set_value(CallResult{error, std::move(response)});
    });
    if (future.wait_for(timeout) != std::future_status::ready)
    {
      throw std::runtime_error("interceptor did not complete in time");
    }
    return future.get();
  }

  template <typename Exception>
  bool holds(const std::exception_ptr& error)
  {
    if (!error) return false;
    try
    {
      std::rethrow_exception(error);
    }
    catch (const Exception&)
    {
      return true;
    }
    catch (const std::exception&)
    {
      return false;
    }
  }
}

#endif // HTTPREC_RECORDER_TESTS_TEST_SUPPORT_HPP_
