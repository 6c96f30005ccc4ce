#ifndef HR_CLOCK_H
#define HR_CLOCK_H

#include <atomic>
#include <cstdint>

namespace hr {

/**
 * Source of time in milliseconds. Components never read the system clock
 * directly so that timeouts can be driven by tests.
 */
class Clock {
public:
  virtual ~Clock() = default;
  virtual int64_t nowMs() const = 0;
};

class SystemClock : public Clock {
public:
  int64_t nowMs() const override;
};

class ManualClock : public Clock {
public:
  explicit ManualClock(int64_t startMs = 0) : nowMs_(startMs) {}

  int64_t nowMs() const override { return nowMs_; }

  void setMs(int64_t ms) { nowMs_ = ms; }
  void advanceMs(int64_t deltaMs) { nowMs_ += deltaMs; }

private:
  std::atomic<int64_t> nowMs_;
};

} // namespace hr

#endif // HR_CLOCK_H
