#include "Service.h"

namespace hr {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() { stop(); }

Service::Roe<void> Service::start() {
  if (isRunning_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (!isRunning_) {
    return;
  }

  log().info << "Stopping service";
  isStopSet_ = true;

  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
  isRunning_ = false;

  onStop();
  log().info << "Service stopped";
}

Service::Roe<void> Service::run() {
  if (isRunning_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  log().info << "Service running in current thread";
  runLoop();
  isStopSet_ = true;
  isRunning_ = false;
  onStop();
  log().info << "Service stopped (current thread)";
  return {};
}

} // namespace hr
