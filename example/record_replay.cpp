// Records a call to httpbin.org on the first run and replays it afterwards.
//
//   ./record_replay                          # Auto: record, then replay
//   HTTP_RECORDER_MODE=Record ./record_replay  # force a fresh recording
#include "recorder/client/http_client.hpp"
#include "recorder/context/context_interceptor.hpp"
#include "recorder/context/recorder_context.hpp"
#include "recorder/interceptor/har_logging.hpp"
#include <fmt/core.h>
#include <exception>

using namespace httprec::recorder;

int main()
{
  auto logger = std::make_shared<ConsoleLogger>(LogLevel::debug, "example");

  auto client = std::make_shared<client::HttpClient>();
  client->set_base_url("https://httpbin.org");
  client->add_interceptor(std::make_shared<ContextInterceptor>());
  // 仅在 trace 级别时写 HAR 日志
  client->add_interceptor(make_har_logging_interceptor("example", logger, nullptr, "logs"));

  RecorderConfiguration configuration;
  configuration.interaction_name = "httpbin_get";
  configuration.repository = std::make_shared<HarFileRepository>("recordings");
  configuration.logger = logger;

  try
  {
    RecorderContext context(configuration);
    auto res = client->request_sync(http::verb::get, "/get", {{"hello", "world"}});
    fmt::print("{} ({} bytes, mode {})\n", res.result_int(), res.body().size(),
               to_string(context.interceptor()->resolve_mode()));
  }
  catch (const std::exception& e)
  {
    fmt::print(stderr, "request failed: {}\n", e.what());
    return 1;
  }
  return 0;
}
