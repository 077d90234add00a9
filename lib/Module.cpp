#include "Module.h"

namespace cb {

Module::Module()
    : spLogger_(std::make_shared<logging::Logger>(logging::getRootLogger())) {}

Module::Module(const std::string &loggerName)
    : spLogger_(
          std::make_shared<logging::Logger>(logging::getLogger(loggerName))) {}

void Module::redirectLogger(const std::string &loggerName) {
  spLogger_ = std::make_shared<logging::Logger>(logging::getLogger(loggerName));
}

logging::Logger &Module::log() const { return *spLogger_; }

} // namespace cb
