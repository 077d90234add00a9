#ifndef CB_LEDGER_LOG_ALERT_DISPATCHER_H
#define CB_LEDGER_LOG_ALERT_DISPATCHER_H

#include "../interface/AlertDispatcher.hpp"
#include "../lib/Module.h"

#include <atomic>

namespace cb {

// Delivers alerts to the log: warnings at WARNING, critical at CRITICAL
class LogAlertDispatcher : public AlertDispatcher, public Module {
public:
  LogAlertDispatcher();
  ~LogAlertDispatcher() override = default;

  Roe<void> sendBatchAlert(const std::vector<Alert> &alerts) override;

  uint64_t getDeliveredCount() const { return delivered_.load(); }

private:
  std::atomic<uint64_t> delivered_{ 0 };
};

} // namespace cb

#endif // CB_LEDGER_LOG_ALERT_DISPATCHER_H
