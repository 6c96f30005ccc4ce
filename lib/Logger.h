#ifndef HR_LOGGER_H
#define HR_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace hr {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * Parse a level name ("debug", "INFO", ...). Unknown names map to INFO.
 */
Level parseLevel(const std::string &name);
std::string levelToString(Level level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
  std::mutex mutex_;
};

class Logger;
class LogStream;
class LoggerNode;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

// Node of the logger tree. Messages are handled locally and then passed on
// to the parent with the originating full name attached.
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  LoggerNode(const std::string &name, std::shared_ptr<LoggerNode> parent);

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);
  void clearHandlers();

  void setPropagate(bool propagate);
  bool getPropagate() const;

  std::shared_ptr<LoggerNode> getParent() const { return spParent_; }
  const std::string &getName() const { return name_; }
  std::string getFullName() const;

  void log(Level level, const std::string &message);

private:
  void dispatch(Level level, const std::string &message,
                const std::string &origin);
  std::string formatMessage(Level level, const std::string &message,
                            const std::string &origin) const;

  std::string name_;
  std::shared_ptr<LoggerNode> spParent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Lightweight handle on a LoggerNode; copies share the node.
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) {
    spNode_->addHandler(spHandler);
  }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG) {
    spNode_->addFileHandler(filename, level);
  }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  // Rebind this handle to another logger in the tree
  void switchTo(const std::string &targetLoggerName);

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;

  void log(Level level, const std::string &message) {
    spNode_->log(level, message);
  }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Hierarchical names separated by '.', created on demand with their parents
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace hr

#endif // HR_LOGGER_H
