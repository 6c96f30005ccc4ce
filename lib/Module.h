#pragma once

#include "Logger.h"
#include <string>

namespace hr {

/**
 * Base class for components that log.
 * Each module owns a handle on a named logger; owners usually place the
 * loggers of their sub-components under their own with redirectLogger().
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "consensus.engine")
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Log through another logger from now on
   * @param targetLoggerName Full name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  logging::Logger &log() const;

private:
  mutable logging::Logger logger_;
};

} // namespace hr
