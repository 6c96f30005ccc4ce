#include "Module.h"

namespace hr {

Module::Module(const std::string &name) : logger_(logging::getLogger(name)) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_.switchTo(targetLoggerName);
}

logging::Logger &Module::log() const { return logger_; }

} // namespace hr
