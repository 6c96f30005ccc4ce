#include "EventHub.h"

namespace hr {

uint64_t EventHub::getLastSeq() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lastSeq_;
}

size_t EventHub::getSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

size_t EventHub::getSubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

EventHub::Page EventHub::since(uint64_t afterSeq, size_t maxCount) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Page page;
  page.nextSeq = afterSeq;
  if (events_.empty() || afterSeq >= lastSeq_) {
    return page;
  }

  uint64_t firstSeq = events_.front().seq;
  size_t offset = 0;
  if (afterSeq + 1 < firstSeq) {
    page.truncated = true;
  } else {
    offset = static_cast<size_t>(afterSeq + 1 - firstSeq);
  }

  for (size_t i = offset; i < events_.size() && page.events.size() < maxCount;
       ++i) {
    page.events.push_back(events_[i]);
  }
  if (!page.events.empty()) {
    page.nextSeq = page.events.back().seq;
  }
  return page;
}

uint64_t EventHub::publish(Event event) {
  std::vector<Callback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    event.seq = ++lastSeq_;
    events_.push_back(event);
    if (events_.size() > CAPACITY) {
      events_.pop_front();
    }
    callbacks.reserve(subscribers_.size());
    for (const auto &[id, callback] : subscribers_) {
      callbacks.push_back(callback);
    }
  }
  for (const auto &callback : callbacks) {
    callback(event);
  }
  return event.seq;
}

uint64_t EventHub::subscribe(Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t id = nextSubscriptionId_++;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

bool EventHub::unsubscribe(uint64_t subscriptionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.erase(subscriptionId) > 0;
}

} // namespace hr
