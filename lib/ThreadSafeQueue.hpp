#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace hr {

/**
 * ThreadSafeQueue - A thread-safe wrapper around std::queue
 *
 * Producers push from any thread; a consumer either polls or blocks in
 * waitPoll() with a timeout.
 *
 * @tparam T The type of elements stored in the queue
 */
template <typename T> class ThreadSafeQueue {
public:
  ThreadSafeQueue() = default;
  ~ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue &) = delete;
  ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  void push(const T &value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(value);
    }
    cv_.notify_one();
  }

  void push(T &&value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(std::move(value));
    }
    cv_.notify_one();
  }

  /**
   * Poll an element from the front of the queue
   * @param t Reference to store the popped element
   * @return true if an element was popped, false if queue was empty
   */
  bool poll(T &t) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  /**
   * Like poll(), but waits up to timeout for an element to arrive
   */
  template <typename Rep, typename Period>
  bool waitPoll(T &t, const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    return true;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
};

} // namespace hr
