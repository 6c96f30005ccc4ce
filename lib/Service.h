#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace hr {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Derived classes implement runLoop(), which executes in the service thread
 * (start) or in the calling thread (run) and returns once isStopSet().
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_RUNNING = -1;
  constexpr static int32_t E_START = -2;

  explicit Service(const std::string &name);

  /**
   * Derived classes must call stop() in their own destructor when runLoop()
   * touches their members.
   */
  ~Service() override;

  bool isRunning() const { return isRunning_; }
  bool isStopSet() const { return isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  virtual void runLoop() = 0;

  // Called in the caller thread before runLoop() begins
  virtual Roe<void> onStart() { return {}; }

  // Called in the caller thread after runLoop() has returned
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ true };
  std::atomic<bool> isRunning_{ false };
  std::thread thread_;
};

} // namespace hr
