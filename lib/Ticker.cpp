#include "Ticker.h"

namespace hr {

Ticker::Ticker(std::chrono::milliseconds interval, Callback callback)
    : Service("ticker"), interval_(interval), callback_(std::move(callback)) {}

Ticker::~Ticker() { stop(); }

void Ticker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
  Service::stop();
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = false;
}

void Ticker::runLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!isStopSet() && !cancelled_) {
    if (cv_.wait_for(lock, interval_, [this] { return cancelled_; })) {
      break;
    }
    lock.unlock();
    if (callback_) {
      callback_();
    }
    lock.lock();
  }
}

} // namespace hr
