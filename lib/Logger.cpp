#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>
#include <unordered_map>

namespace cb {
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

  std::tm tmBuf{};
  localtime_r(&time, &tmBuf);
  std::stringstream ss;
  ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
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

// ========== Handlers ==========

void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  os_ << message << std::endl;
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

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// ========== LogProxy / LogStream ==========

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

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name,
                       std::shared_ptr<LoggerNode> spParent)
    : name_(name), spParent_(spParent) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
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

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::log(Level level, const std::string &message,
                     const std::string &originName) {
  bool propagate = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
      return;
    }
    if (!spHandlers_.empty()) {
      std::string formatted = formatMessage(level, message, originName);
      for (auto &spHandler : spHandlers_) {
        spHandler->emit(level, originName, formatted);
      }
    }
    propagate = propagate_;
  }

  if (propagate && spParent_) {
    spParent_->log(level, message, originName);
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &originName) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(spNode) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

Logger::Logger(const Logger &other)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  bindProxies();
  return *this;
}

void Logger::bindProxies() {
  debug.logger_ = this;
  info.logger_ = this;
  warning.logger_ = this;
  error.logger_ = this;
  critical.logger_ = this;
}

// ========== Registry ==========

static std::shared_ptr<LoggerNode>
getOrCreateNodeLocked(const std::string &name) {
  auto &registry = getLoggerRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> spParent;
  if (name.empty()) {
    auto spRoot = std::make_shared<LoggerNode>("", nullptr);
    spRoot->addHandler(std::make_shared<ConsoleHandler>());
    registry[name] = spRoot;
    return spRoot;
  }

  auto lastDot = name.rfind('.');
  std::string parentName =
      lastDot == std::string::npos ? "" : name.substr(0, lastDot);
  spParent = getOrCreateNodeLocked(parentName);

  auto spNode = std::make_shared<LoggerNode>(name, spParent);
  registry[name] = spNode;
  return spNode;
}

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNodeLocked(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace cb
