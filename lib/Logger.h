#ifndef CB_LEDGER_LOGGER_H
#define CB_LEDGER_LOGGER_H

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace cb {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &loggerName,
                    const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  explicit ConsoleHandler(std::ostream &os = std::cout) : os_(os) {}

  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ostream &os_;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
};

class Logger;
class LogStream;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  friend class Logger;
  Logger *logger_;
  Level level_;
};

// Collects one message and hands it to the logger on destruction
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) noexcept;

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

// Tree node; the registry owns nodes by their full dotted name
class LoggerNode {
public:
  LoggerNode(const std::string &name, std::shared_ptr<LoggerNode> spParent);

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);
  void clearHandlers();

  void setPropagate(bool propagate);
  bool getPropagate() const;

  std::shared_ptr<LoggerNode> getParent() const { return spParent_; }

  // Full dotted name, empty for the root
  const std::string &getFullName() const { return name_; }

  void log(Level level, const std::string &message,
           const std::string &originName);

private:
  std::string formatMessage(Level level, const std::string &message,
                            const std::string &originName) const;

  std::string name_;
  std::shared_ptr<LoggerNode> spParent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Lightweight handle on a LoggerNode
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> spNode);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);
  ~Logger() = default;

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
  void addFileHandler(const std::string &filename,
                      Level level = Level::DEBUG) {
    spNode_->addFileHandler(filename, level);
  }
  void clearHandlers() { spNode_->clearHandlers(); }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  const std::string &getFullName() const { return spNode_->getFullName(); }

  // Last segment of the dotted name
  std::string getName() const {
    const auto &full = spNode_->getFullName();
    auto pos = full.rfind('.');
    return pos == std::string::npos ? full : full.substr(pos + 1);
  }

  bool operator==(const Logger &other) const {
    return spNode_ == other.spNode_;
  }
  bool operator!=(const Logger &other) const {
    return spNode_ != other.spNode_;
  }

private:
  friend class LogStream;

  void bindProxies();
  void log(Level level, const std::string &message) {
    spNode_->log(level, message, spNode_->getFullName());
  }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Returns the logger for a dotted name, creating it and its ancestors.
// The root logger ("") carries the only default console handler.
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace cb

#endif // CB_LEDGER_LOGGER_H
