#include "LogAlertDispatcher.h"

namespace cb {

LogAlertDispatcher::LogAlertDispatcher() : Module("Alerts") {}

LogAlertDispatcher::Roe<void>
LogAlertDispatcher::sendBatchAlert(const std::vector<Alert> &alerts) {
  for (const auto &alert : alerts) {
    if (alert.severity == Severity::CRITICAL) {
      log().critical << "[" << severityName(alert.severity) << "] "
                     << alert.message << " (variance " << alert.variance
                     << ")";
    } else {
      log().warning << "[" << severityName(alert.severity) << "] "
                    << alert.message << " (variance " << alert.variance
                    << ")";
    }
  }
  delivered_ += alerts.size();
  return {};
}

} // namespace cb
