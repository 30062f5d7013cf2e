#ifndef TOOLS__THREAD_SAFE_QUEUE_HPP
#define TOOLS__THREAD_SAFE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>

namespace tools
{
/**
 * @brief 有界线程安全队列（多生产者/单消费者）
 * @tparam T 元素类型
 * @note 队列满时调用 full_handler 并丢弃新元素，由调用方决定是否重试
 */
template <typename T>
class ThreadSafeQueue
{
public:
  ThreadSafeQueue(size_t max_size, std::function<void(void)> full_handler = [] {})
  : max_size_(max_size), full_handler_(full_handler)
  {
  }

  /// @return 元素是否入队，队列已满时返回false
  bool push(const T & value)
  {
    {
      std::unique_lock<std::mutex> lock(mutex_);

      if (queue_.size() >= max_size_) {
        lock.unlock();
        full_handler_();
        return false;
      }

      queue_.push(value);
    }
    not_empty_condition_.notify_all();
    return true;
  }

  /**
   * @brief 限时出队
   * @return 超时仍为空时返回false，value 不变
   * @note 工作线程用它轮询退出标志，避免永久阻塞在空队列上
   */
  template <typename Rep, typename Period>
  bool pop_for(T & value, const std::chrono::duration<Rep, Period> & timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_condition_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return false;
    }

    value = std::move(queue_.front());
    queue_.pop();
    return true;
  }

private:
  std::queue<T> queue_;
  size_t max_size_;
  std::mutex mutex_;
  std::condition_variable not_empty_condition_;
  std::function<void(void)> full_handler_;
};

}  // namespace tools

#endif  // TOOLS__THREAD_SAFE_QUEUE_HPP
