// recorder/interceptor/recorder_interceptor.cpp
#include "recorder_interceptor.hpp"
#include "exception/recorder_exception.hpp"
#include "repository/null_repository.hpp"
#include <boost/asio/post.hpp>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace httprec::recorder
{
  RecorderInterceptor::RecorderInterceptor(RecorderConfiguration configuration)
    : configuration_(std::move(configuration))
  {
    if (configuration_.interaction_name.empty())
    {
      throw std::invalid_argument("interaction name must not be empty");
    }

    if (!configuration_.logger) configuration_.logger = std::make_shared<NullLogger>();
    configuration_.matcher = configuration_.matcher
                               ? configuration_.matcher->clone()
                               : RulesMatcher::match_once()->by_http_method()->by_request_uri();
    if (!configuration_.anonymizer) configuration_.anonymizer = std::make_shared<NullAnonymizer>();
    if (!configuration_.executor) configuration_.executor = IoContextPool::instance().executor();
    if (!configuration_.enabled)
    {
      configuration_.repository = std::make_shared<NullRepository>();
    }
    else if (!configuration_.repository)
    {
      // persist() 已经用 configuration_.anonymizer 脱敏
      configuration_.repository = std::make_shared<HarFileRepository>(configuration_.archive_directory,
                                                                      std::make_shared<NullAnonymizer>());
    }
  }

  RecorderMode RecorderInterceptor::resolve_mode()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (execution_mode_.has_value())
    {
      return *execution_mode_;
    }

    auto mode = configuration_.mode;
    if (const char* value = std::getenv(kOverridingEnvironmentVariableName))
    {
      if (auto overriding = parse_recorder_mode(value))
      {
        configuration_.logger->info("{}={} overrides mode {} of '{}'", kOverridingEnvironmentVariableName, value,
                                    to_string(mode), configuration_.interaction_name);
        mode = *overriding;
      }
      else if (*value != '\0')
      {
        configuration_.logger->warn("Ignoring {}={}: not a recorder mode", kOverridingEnvironmentVariableName, value);
      }
    }

    if (mode == RecorderMode::Auto)
    {
      mode = configuration_.repository->exists(configuration_.interaction_name)
               ? RecorderMode::Replay
               : RecorderMode::Record;
    }

    configuration_.logger->debug("Interaction '{}' runs in {} mode", configuration_.interaction_name, to_string(mode));
    execution_mode_ = mode;
    return mode;
  }

  void RecorderInterceptor::intercept(Request request, NextHandler next, ResponseCallback callback)
  {
    RecorderMode mode = RecorderMode::Auto;
    try
    {
      mode = resolve_mode();
    }
    catch (const std::exception& e)
    {
      configuration_.logger->error("Cannot resolve recorder mode of '{}': {}", configuration_.interaction_name,
                                   e.what());
      callback(std::current_exception(), Response{});
      return;
    }

    switch (mode)
    {
    case RecorderMode::Replay:
      replay(std::move(request), std::move(callback));
      return;
    case RecorderMode::Passthrough:
      next(std::move(request), [callback = std::move(callback)](std::exception_ptr eptr, Response response)
      {
        if (!eptr)
        {
          normalize_response(response);
        }
        callback(eptr, std::move(response));
      });
      return;
    default:
      record(std::move(request), std::move(next), std::move(callback));
      return;
    }
  }

  void RecorderInterceptor::record(Request request, NextHandler next, ResponseCallback callback)
  {
    auto self = shared_from_this();
    // 发送前保留一份请求，下游可能会改写 target
    auto recorded_request = std::make_shared<Request>(request);
    const auto start = std::chrono::system_clock::now();
    const auto clock_start = std::chrono::steady_clock::now();

    next(std::move(request),
         [self, recorded_request, start, clock_start, callback = std::move(callback)](
         std::exception_ptr eptr, Response response)
         {
           if (eptr)
           {
             // 传输失败或被取消: 不落盘
             self->configuration_.logger->debug("{} {} failed, nothing recorded", request_method(*recorded_request),
                                                request_url(*recorded_request));
             callback(eptr, Response{});
             return;
           }

           InteractionMessage message{
             *recorded_request, response,
             {start, std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - clock_start)}
           };

           boost::asio::post(self->configuration_.executor,
                             [self, message = std::move(message), response = std::move(response), callback]() mutable
                             {
                               std::exception_ptr failure;
                               try
                               {
                                 self->persist(std::move(message));
                               }
                               catch (const std::exception& e)
                               {
                                 self->configuration_.logger->error("Recording '{}' failed: {}",
                                                                    self->configuration_.interaction_name, e.what());
                                 failure = std::current_exception();
                               }

                               if (failure)
                               {
                                 callback(failure, Response{});
                                 return;
                               }
                               normalize_response(response);
                               callback(nullptr, std::move(response));
                             });
         });
  }

  void RecorderInterceptor::persist(InteractionMessage message)
  {
    Interaction interaction{configuration_.interaction_name, {}};
    interaction.messages.push_back(std::move(message));
    interaction = configuration_.anonymizer->anonymize(std::move(interaction));

    const auto& recorded = interaction.messages.front();
    if (configuration_.repository->store(interaction).has_value())
    {
      configuration_.logger->debug("Recorded {} {} -> {} into '{}'", request_method(recorded.request),
                                   request_url(recorded.request), recorded.response.result_int(),
                                   configuration_.interaction_name);
    }
  }

  void RecorderInterceptor::replay(Request request, ResponseCallback callback)
  {
    auto self = shared_from_this();
    boost::asio::post(configuration_.executor,
                      [self, request = std::move(request), callback = std::move(callback)]()
                      {
                        Response response;
                        std::exception_ptr failure;
                        try
                        {
                          response = self->find_recorded_response(request);
                        }
                        catch (const std::exception& e)
                        {
                          self->configuration_.logger->warn("Replay of '{}' failed: {}",
                                                            self->configuration_.interaction_name, e.what());
                          failure = std::current_exception();
                        }

                        if (failure)
                        {
                          callback(failure, Response{});
                          return;
                        }
                        normalize_response(response);
                        callback(nullptr, std::move(response));
                      });
  }

  Response RecorderInterceptor::find_recorded_response(const Request& request)
  {
    std::shared_ptr<const Interaction> interaction;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!replay_interaction_)
      {
        replay_interaction_ = std::make_shared<const Interaction>(
          configuration_.repository->load(configuration_.interaction_name));
        configuration_.logger->debug("Loaded {} recorded message(s) of '{}'", replay_interaction_->messages.size(),
                                     configuration_.interaction_name);
      }
      interaction = replay_interaction_;
    }

    auto matched = configuration_.matcher->match(request, *interaction);
    if (!matched.has_value())
    {
      throw NoMatchingInteraction(request_method(request), request_url(request));
    }
    configuration_.logger->trace("Replaying {} {} -> {}", request_method(request), request_url(request),
                                 matched->response.result_int());
    return std::move(matched->response);
  }
}
