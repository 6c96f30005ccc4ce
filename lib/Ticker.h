#pragma once

#include "Service.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace hr {

/**
 * Ticker - invokes a callback at a fixed interval on its own thread.
 *
 * stop() wakes the thread immediately and joins it; no callback runs after
 * stop() returns.
 */
class Ticker : public Service {
public:
  using Callback = std::function<void()>;

  Ticker(std::chrono::milliseconds interval, Callback callback);
  ~Ticker() override;

  std::chrono::milliseconds getInterval() const { return interval_; }

  void stop();

protected:
  void runLoop() override;

private:
  std::chrono::milliseconds interval_;
  Callback callback_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_{ false };
};

} // namespace hr
