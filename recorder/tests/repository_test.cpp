#include "recorder/repository/har_file_repository.hpp"
#include "recorder/repository/logger_repository.hpp"
#include "recorder/repository/null_repository.hpp"
#include "recorder/repository/archive_file.hpp"
#include "recorder/repository/file_utils.hpp"
#include "recorder/repository/named_mutex_registry.hpp"
#include "recorder/har/http_archive.hpp"
#include "recorder/dto/TagInvoke.hpp"
#include "recorder/exception/recorder_exception.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <mutex>
#include <thread>
#include <vector>

using namespace httprec::recorder;
using namespace httprec::recorder::testing;

namespace
{
  Interaction make_interaction(const std::string& name, int count, const std::string& prefix = "body")
  {
    Interaction interaction;
    interaction.name = name;
    for (int i = 0; i < count; ++i)
    {
      interaction.messages.push_back(make_message(http::verb::get, "https://example.com/items/" + std::to_string(i),
                                                  http::status::ok, prefix + std::to_string(i)));
    }
    return interaction;
  }

  // Collects the messages written at each level.
  class CapturingLogger : public Logger
  {
  public:
    explicit CapturingLogger(LogLevel threshold)
      : threshold_(threshold)
    {
    }

    bool is_enabled(LogLevel level) const override
    {
      return level >= threshold_ && threshold_ != LogLevel::off;
    }

    void log(LogLevel, std::string_view message) override
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lines.emplace_back(message);
    }

    std::vector<std::string> lines;

  private:
    std::mutex mutex_;
    LogLevel threshold_;
  };

  std::size_t count_files(const fs::path& directory, const std::string& extension)
  {
    std::size_t count = 0;
    for (fs::recursive_directory_iterator it(directory), end; it != end; ++it)
    {
      if (fs::is_regular_file(it->path()) && it->path().extension() == extension)
      {
        ++count;
      }
    }
    return count;
  }
}

TEST(FileUtilsTest, MakeValidFilename)
{
  EXPECT_EQ(make_valid_filename("Suite.Test/Case"), "Suite.Test_Case");
  EXPECT_EQ(make_valid_filename("a<b>c:d\"e\\f|g?h*i"), "a_b_c_d_e_f_g_h_i");
  EXPECT_EQ(make_valid_filename(std::string("tab\there\nnew", 12)), "tab_here_new");
  EXPECT_EQ(make_valid_filename("plain-name_1"), "plain-name_1");
}

TEST(FileUtilsTest, AtomicWriteReplacesContent)
{
  TempDirectory dir;
  const auto path = dir.path() / "nested" / "file.txt";

  write_file_atomically(path, "first");
  write_file_atomically(path, "second");

  EXPECT_EQ(read_file(path), "second");
  // 不残留临时文件
  EXPECT_EQ(count_files(dir.path(), ".tmp"), 0u);
}

TEST(FileUtilsTest, ReadingMissingFileFails)
{
  TempDirectory dir;
  try
  {
    read_file(dir.path() / "missing.har");
    FAIL() << "reading a missing file succeeded";
  }
  catch (const PersistenceIOFailure& e)
  {
    EXPECT_EQ(e.code(), make_error_code(recorder_errc::persistence_io_failure));
    EXPECT_TRUE(static_cast<bool>(e.cause()));
  }
}

TEST(NamedMutexRegistryTest, SameNameSameMutex)
{
  NamedMutexRegistry registry;
  auto a = registry.get("/tmp/a.har");
  auto b = registry.get("/tmp/a.har");
  auto c = registry.get("/tmp/c.har");

  EXPECT_EQ(a.get(), b.get());
  EXPECT_NE(a.get(), c.get());
  EXPECT_EQ(registry.size(), 2u);

  a.reset();
  b.reset();
  c.reset();
  EXPECT_EQ(registry.size(), 0u);
}

class HarFileRepositoryTest : public ::testing::Test
{
protected:
  TempDirectory dir;
};

TEST_F(HarFileRepositoryTest, StoreThenLoad)
{
  HarFileRepository repository(dir.path());
  EXPECT_FALSE(repository.exists("foo"));

  auto stored = repository.store(make_interaction("foo", 2));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->messages.size(), 2u);

  EXPECT_TRUE(repository.exists("foo"));
  EXPECT_TRUE(fs::exists(dir.path() / "foo.har"));

  const auto loaded = repository.load("foo");
  EXPECT_EQ(loaded.name, "foo");
  ASSERT_EQ(loaded.messages.size(), 2u);
  EXPECT_EQ(loaded.messages[0].request.target(), "https://example.com/items/0");
  EXPECT_EQ(loaded.messages[1].response.body(), "body1");
}

TEST_F(HarFileRepositoryTest, FileNames)
{
  HarFileRepository repository(dir.path());
  EXPECT_EQ(repository.archive_path("Suite/Test"), dir.path() / "Suite_Test.har");
  EXPECT_EQ(repository.archive_path("recorded.json"), dir.path() / "recorded.json");
}

TEST_F(HarFileRepositoryTest, StoreAppendsToExistingArchive)
{
  HarFileRepository repository(dir.path());
  repository.store(make_interaction("foo", 1, "a"));
  repository.store(make_interaction("foo", 2, "b"));

  const auto loaded = repository.load("foo");
  ASSERT_EQ(loaded.messages.size(), 3u);
  EXPECT_EQ(loaded.messages[0].response.body(), "a0");
  EXPECT_EQ(loaded.messages[1].response.body(), "b0");
  EXPECT_EQ(loaded.messages[2].response.body(), "b1");
}

TEST_F(HarFileRepositoryTest, EmptyInteractionIsNotPersisted)
{
  HarFileRepository repository(dir.path());
  EXPECT_FALSE(repository.store(Interaction{"empty", {}}).has_value());
  EXPECT_FALSE(repository.exists("empty"));
}

TEST_F(HarFileRepositoryTest, StoreAnonymizes)
{
  HarFileRepository repository(dir.path());
  auto interaction = make_interaction("secret", 1);
  interaction.messages[0].request.set(http::field::authorization, "Bearer token");

  auto stored = repository.store(interaction);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->messages[0].request[http::field::authorization], RulesAnonymizer::kSentinel);

  const auto document = read_file(repository.archive_path("secret"));
  EXPECT_EQ(document.find("Bearer token"), std::string::npos);
}

TEST_F(HarFileRepositoryTest, LoadErrors)
{
  HarFileRepository repository(dir.path());
  EXPECT_THROW(repository.load("missing"), NoSuchInteraction);

  write_file_atomically(dir.path() / "broken.har", "{\"log\":");
  EXPECT_THROW(repository.load("broken"), MalformedArchive);
}

TEST_F(HarFileRepositoryTest, HandEditedArchiveFallsBackToRewrite)
{
  HarFileRepository repository(dir.path());
  repository.store(make_interaction("edited", 1, "a"));

  // entries 不在最后，只能走完整解析
  const auto path = repository.archive_path("edited");
  auto archive = har::parse(read_file(path));
  boost::json::object root;
  boost::json::object log;
  log["entries"] = boost::json::value_from(archive.log.entries);
  log["version"] = "1.2";
  log["creator"] = {{"name", "editor"}, {"version", "1"}};
  root["log"] = std::move(log);
  write_file_atomically(path, boost::json::serialize(root));

  repository.store(make_interaction("edited", 1, "b"));

  const auto loaded = repository.load("edited");
  ASSERT_EQ(loaded.messages.size(), 2u);
  EXPECT_EQ(loaded.messages[0].response.body(), "a0");
  EXPECT_EQ(loaded.messages[1].response.body(), "b0");
}

TEST_F(HarFileRepositoryTest, FastAndSlowAppendProduceSameBytes)
{
  const auto first = make_interaction("bytes", 2, "a");
  const auto second = make_interaction("bytes", 2, "b");

  HarFileRepository repository(dir.path(), std::make_shared<NullAnonymizer>());
  repository.store(first);
  repository.store(second);
  const auto appended = read_file(repository.archive_path("bytes"));

  auto all = first;
  all.messages.insert(all.messages.end(), second.messages.begin(), second.messages.end());
  EXPECT_EQ(appended, har::serialize(har::to_archive(all)));
}

TEST_F(HarFileRepositoryTest, ConcurrentStoresKeepEveryEntry)
{
  HarFileRepository repository(dir.path());
  constexpr int kThreads = 16;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back([&repository, t]()
    {
      repository.store(make_interaction("concurrent", 1, "t" + std::to_string(t) + "-"));
    });
  }
  for (auto& thread : threads) thread.join();

  const auto loaded = repository.load("concurrent");
  EXPECT_EQ(loaded.messages.size(), static_cast<std::size_t>(kThreads));
  EXPECT_EQ(count_files(dir.path(), ".tmp"), 0u);
}

TEST(NullRepositoryTest, NothingExistsNothingIsStored)
{
  NullRepository repository;
  EXPECT_FALSE(repository.exists("anything"));
  EXPECT_THROW(repository.load("anything"), NoSuchInteraction);
  EXPECT_FALSE(repository.store(make_interaction("anything", 1)).has_value());
}

TEST(LoggerRepositoryTest, DisabledTraceWritesNothing)
{
  TempDirectory dir;
  LoggerRepository repository(std::make_shared<CapturingLogger>(LogLevel::debug), dir.path());

  EXPECT_FALSE(repository.store(make_interaction("quiet", 1)).has_value());
  EXPECT_FALSE(fs::exists(dir.path() / "trace"));
}

TEST(LoggerRepositoryTest, TraceWritesDumpsAndArchive)
{
  TempDirectory dir;
  auto logger = std::make_shared<CapturingLogger>(LogLevel::trace);
  LoggerRepository repository(logger, dir.path());

  EXPECT_FALSE(repository.exists("calls"));
  EXPECT_THROW(repository.load("calls"), UnsupportedOperation);

  EXPECT_FALSE(repository.store(make_interaction("calls", 2)).has_value());
  EXPECT_FALSE(repository.store(make_interaction("calls", 1)).has_value());

  const auto folder = dir.path() / "trace" / "calls";
  EXPECT_EQ(repository.trace_directory("calls"), folder);
  EXPECT_EQ(count_files(folder, ".txt"), 3u);

  const auto archive = har::parse(read_file(folder / "calls.har"));
  EXPECT_EQ(archive.log.entries.size(), 3u);

  bool found = false;
  for (fs::directory_iterator it(folder), end; it != end; ++it)
  {
    const auto name = it->path().filename().string();
    if (name.find(" 200 GET example.com.txt") != std::string::npos)
    {
      found = true;
      const auto dump = read_file(it->path());
      EXPECT_NE(dump.find("GET https://example.com/items/"), std::string::npos);
      EXPECT_NE(dump.find("HTTP/1.1 200 OK"), std::string::npos);
    }
  }
  EXPECT_TRUE(found);
  EXPECT_FALSE(logger->lines.empty());
}

TEST(LoggerRepositoryTest, AggregateArchiveCollectsAllNames)
{
  TempDirectory dir;
  LoggerRepositoryOptions options;
  options.aggregate_archive = "all";
  options.write_text_dump = false;
  LoggerRepository repository(std::make_shared<CapturingLogger>(LogLevel::trace), dir.path(), options);

  repository.store(make_interaction("one", 1));
  repository.store(make_interaction("two", 2));

  EXPECT_EQ(repository.archive_path("one"), dir.path() / "trace" / "all.har");
  const auto archive = har::parse(read_file(dir.path() / "trace" / "all.har"));
  EXPECT_EQ(archive.log.entries.size(), 3u);
  EXPECT_EQ(count_files(dir.path(), ".txt"), 0u);
}
