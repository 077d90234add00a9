#ifndef CB_LEDGER_MODULE_H
#define CB_LEDGER_MODULE_H

#include "Logger.h"

#include <memory>
#include <string>

namespace cb {

/**
 * Base class for components that log.
 * A module starts on the root logger; owners call redirectLogger() to give
 * it a place in the hierarchy, e.g. "cb.Books.Ledger".
 */
class Module {
public:
  Module();
  explicit Module(const std::string &loggerName);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Switch this module to the named logger
   * @param loggerName Hierarchical dotted name
   */
  void redirectLogger(const std::string &loggerName);

  logging::Logger &log() const;

private:
  std::shared_ptr<logging::Logger> spLogger_;
};

} // namespace cb

#endif // CB_LEDGER_MODULE_H
