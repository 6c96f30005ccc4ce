#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace hr {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &
getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

Level parseLevel(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    return Level::DEBUG;
  }
  if (lower == "warning" || lower == "warn") {
    return Level::WARNING;
  }
  if (lower == "error") {
    return Level::ERROR;
  }
  if (lower == "critical") {
    return Level::CRITICAL;
  }
  return Level::INFO;
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

void ConsoleHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::ERROR) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
  }
}

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name,
                       std::shared_ptr<LoggerNode> parent)
    : name_(name), spParent_(std::move(parent)) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  const LoggerNode *current = this;
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent().get();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(std::move(spHandler));
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }
  dispatch(level, message, getFullName());
}

void LoggerNode::dispatch(Level level, const std::string &message,
                          const std::string &origin) {
  std::vector<std::shared_ptr<Handler>> handlers;
  bool propagate = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
    propagate = propagate_;
  }

  if (!handlers.empty()) {
    std::string formatted = formatMessage(level, message, origin);
    for (auto &spHandler : handlers) {
      spHandler->emit(level, formatted);
    }
  }

  if (propagate && spParent_) {
    spParent_->dispatch(level, message, origin);
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &origin) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!origin.empty()) {
    ss << "[" << origin << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(std::move(node)) {}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

void Logger::switchTo(const std::string &targetLoggerName) {
  spNode_ = getLogger(targetLoggerName).spNode_;
}

// ========== Registry ==========

static std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &name) {
  auto &registry = getLoggerRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> parent;
  std::string nodeName = name;
  if (!name.empty()) {
    auto lastDot = name.rfind('.');
    if (lastDot != std::string::npos) {
      parent = getOrCreateNode(name.substr(0, lastDot));
      nodeName = name.substr(lastDot + 1);
    } else {
      parent = getOrCreateNode("");
    }
  }

  auto node = std::make_shared<LoggerNode>(nodeName, parent);
  if (name.empty()) {
    // Only the root prints; everything else reaches it by propagation
    node->addHandler(std::make_shared<ConsoleHandler>());
  }
  registry[name] = node;
  return node;
}

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace hr
