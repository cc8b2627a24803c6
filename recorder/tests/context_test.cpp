#include "recorder/context/recorder_context.hpp"
#include "recorder/context/context_interceptor.hpp"
#include "recorder/context/session_manager.hpp"
#include "recorder/exception/recorder_exception.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>

using namespace httprec::recorder;
using namespace httprec::recorder::testing;

class RecorderContextTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ::unsetenv(RecorderInterceptor::kOverridingEnvironmentVariableName);
  }

  RecorderConfiguration configuration(const std::string& name, RecorderMode mode = RecorderMode::Auto)
  {
    RecorderConfiguration config;
    config.interaction_name = name;
    config.mode = mode;
    config.repository = std::make_shared<HarFileRepository>(dir.path());
    return config;
  }

  TempDirectory dir;
  SessionManager sessions;
};

TEST_F(RecorderContextTest, OnlyOneActiveContext)
{
  EXPECT_FALSE(sessions.has_active_context());
  {
    RecorderContext context(configuration("first"), sessions);
    EXPECT_TRUE(sessions.has_active_context());
    EXPECT_EQ(sessions.current(), context.interceptor());

    EXPECT_THROW(RecorderContext(configuration("second"), sessions), MultipleActiveContexts);
    // 失败的第二个上下文不能释放第一个
    EXPECT_EQ(sessions.current(), context.interceptor());
  }
  EXPECT_FALSE(sessions.has_active_context());

  RecorderContext next(configuration("third"), sessions);
  EXPECT_TRUE(sessions.has_active_context());
}

TEST_F(RecorderContextTest, SeparateManagersDoNotConflict)
{
  SessionManager other;
  RecorderContext a(configuration("a"), sessions);
  RecorderContext b(configuration("b"), other);
  EXPECT_NE(sessions.current(), other.current());
}

TEST_F(RecorderContextTest, ContextOwnsConfiguredInterceptor)
{
  RecorderContext context(configuration("owned", RecorderMode::Replay), sessions);
  EXPECT_EQ(context.interceptor()->interaction_name(), "owned");
  EXPECT_EQ(context.interceptor()->mode(), RecorderMode::Replay);
}

TEST_F(RecorderContextTest, InvalidConfigurationLeavesSlotFree)
{
  EXPECT_THROW(RecorderContext(configuration(""), sessions), std::invalid_argument);
  EXPECT_FALSE(sessions.has_active_context());
}

TEST_F(RecorderContextTest, ContextInterceptorForwardsWithoutContext)
{
  FakeNetwork network;
  ContextInterceptor interceptor(sessions);

  auto result = call(interceptor, make_request(http::verb::get, "https://api.example.com/free"), network.handler());
  ASSERT_FALSE(result.error);
  EXPECT_EQ(result.response.body(), "from network");
  EXPECT_EQ(network.calls(), 1);
}

TEST_F(RecorderContextTest, ContextInterceptorRoutesThroughActiveContext)
{
  FakeNetwork network(make_response(http::status::ok, "live"));
  ContextInterceptor interceptor(sessions);

  {
    RecorderContext context(configuration("routed"), sessions);
    auto result = call(interceptor, make_request(http::verb::get, "https://api.example.com/r"), network.handler());
    ASSERT_FALSE(result.error);
  }
  EXPECT_EQ(network.calls(), 1);
  ASSERT_TRUE(fs::exists(dir.path() / "routed.har"));

  {
    RecorderContext context(configuration("routed"), sessions);
    auto result = call(interceptor, make_request(http::verb::get, "https://api.example.com/r"), network.handler());
    ASSERT_FALSE(result.error);
    EXPECT_EQ(result.response.body(), "live");
  }
  // 第二次是回放，没有访问网络
  EXPECT_EQ(network.calls(), 1);
}

TEST_F(RecorderContextTest, SharedInstanceIsUsedByDefault)
{
  EXPECT_EQ(&SessionManager::instance(), &SessionManager::instance());
  {
    RecorderContext context(configuration("global"));
    EXPECT_TRUE(SessionManager::instance().has_active_context());
  }
  EXPECT_FALSE(SessionManager::instance().has_active_context());
}

TEST_F(RecorderContextTest, SlotIsReleasedWhenScopeExitsByException)
{
  try
  {
    RecorderContext context(configuration("unwound"), sessions);
    EXPECT_TRUE(sessions.has_active_context());
    throw std::runtime_error("test body failed");
  }
  catch (const std::runtime_error&)
  {
  }
  EXPECT_FALSE(sessions.has_active_context());

  RecorderContext next(configuration("after"), sessions);
  EXPECT_TRUE(sessions.has_active_context());
}

TEST_F(RecorderContextTest, ReusedConfigurationReplaysFromScratch)
{
  FakeNetwork network(make_response(http::status::ok, "x"));
  ContextInterceptor interceptor(sessions);
  auto config = configuration("reused", RecorderMode::Record);
  {
    RecorderContext context(config, sessions);
    for (int i = 0; i < 2; ++i)
    {
      ASSERT_FALSE(call(interceptor, make_request(http::verb::get, "https://api.example.com/x"), network.handler()).error);
    }
  }
  ASSERT_EQ(network.calls(), 2);

  // 同一份配置开两次回放会话, 每次都从头匹配
  config.mode = RecorderMode::Replay;
  for (int session = 0; session < 2; ++session)
  {
    RecorderContext context(config, sessions);
    for (int i = 0; i < 2; ++i)
    {
      auto result = call(interceptor, make_request(http::verb::get, "https://api.example.com/x"), network.handler());
      ASSERT_FALSE(result.error) << "session " << session << " call " << i;
      EXPECT_EQ(result.response.body(), "x");
    }
    auto exhausted = call(interceptor, make_request(http::verb::get, "https://api.example.com/x"), network.handler());
    EXPECT_TRUE(holds<NoMatchingInteraction>(exhausted.error));
  }
  EXPECT_EQ(network.calls(), 2);
}
