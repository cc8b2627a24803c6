#ifndef HTTPREC_RECORDER_IO_CONTEXT_POOL_HPP_
#define HTTPREC_RECORDER_IO_CONTEXT_POOL_HPP_

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace httprec::recorder
{
  /**
   * @brief Process-wide io_context served by a small thread pool.
   *
   * Default executor of the HTTP client and of archive loads and stores. The first
   * call to instance() decides the thread count; later arguments are ignored.
   */
  class IoContextPool
  {
  public:
    // 获取单例实例，0 表示按 CPU 核心数
    static IoContextPool& instance(unsigned int num_threads = 0)
    {
      static IoContextPool instance{num_threads};
      return instance;
    }

    boost::asio::io_context& get_io_context()
    {
      return ioc_;
    }

    boost::asio::any_io_executor executor()
    {
      return ioc_.get_executor();
    }

    // 把任务投递到池中任一线程
    template <typename Handler>
    void post(Handler&& handler)
    {
      boost::asio::post(ioc_, std::forward<Handler>(handler));
    }

    size_t get_thread_count() const
    {
      return threads_.size();
    }

    ~IoContextPool()
    {
      stop();
    }

    void stop()
    {
      // 析构和显式 stop 只执行一次
      std::call_once(stop_flag_, [this]()
      {
        work_guard_.reset();
        ioc_.stop();

        for (auto& t : threads_)
        {
          if (t.joinable() && t.get_id() != std::this_thread::get_id())
          {
            t.join();
          }
          else if (t.joinable())
          {
            t.detach();
          }
        }
        threads_.clear();
      });
    }

  private:
    explicit IoContextPool(unsigned int count)
      : work_guard_(boost::asio::make_work_guard(ioc_))
    {
      if (count == 0) count = std::thread::hardware_concurrency();
      // hardware_concurrency 可能返回 0，且至少需要两个线程，避免回调里同步等待时死锁
      count = std::max(count, 2u);

      threads_.reserve(count);
      for (unsigned int i = 0; i < count; ++i)
      {
        threads_.emplace_back([this]()
        {
          ioc_.run();
        });
      }
    }

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
    std::once_flag stop_flag_;
  };
}

#endif // HTTPREC_RECORDER_IO_CONTEXT_POOL_HPP_
