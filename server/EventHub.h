#ifndef HR_EVENT_HUB_H
#define HR_EVENT_HUB_H

#include "../consensus/Types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace hr {

/**
 * EventHub - bounded history of consensus events with push subscribers.
 *
 * Every published event gets the next sequence number (starting at 1).
 * Only the latest CAPACITY events are kept; remote readers page through
 * them with since(). Callbacks run on the publishing thread, outside the
 * hub lock, and may unsubscribe themselves.
 */
class EventHub {
public:
  using Event = consensus::ConsensusEvent;
  using Callback = std::function<void(const Event &)>;

  constexpr static size_t CAPACITY = 1024;

  struct Page {
    std::vector<Event> events;
    uint64_t nextSeq{ 0 }; // cursor for the following call
    bool truncated{ false }; // events before the first returned were dropped
  };

  // ----- accessors -----
  uint64_t getLastSeq() const;
  size_t getSize() const;
  size_t getSubscriberCount() const;

  /**
   * Events with seq > afterSeq, oldest first, at most maxCount
   */
  Page since(uint64_t afterSeq, size_t maxCount) const;

  // ----- methods -----
  uint64_t publish(Event event);
  uint64_t subscribe(Callback callback);
  bool unsubscribe(uint64_t subscriptionId);

private:
  mutable std::mutex mutex_;
  std::deque<Event> events_;
  uint64_t lastSeq_{ 0 };
  std::map<uint64_t, Callback> subscribers_;
  uint64_t nextSubscriptionId_{ 1 };
};

} // namespace hr

#endif // HR_EVENT_HUB_H
