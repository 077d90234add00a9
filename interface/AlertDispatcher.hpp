#ifndef CB_LEDGER_ALERT_DISPATCHER_HPP
#define CB_LEDGER_ALERT_DISPATCHER_HPP

#include "../lib/Decimal.h"
#include "../lib/ResultOrError.hpp"

#include <string>
#include <vector>

namespace cb {

class AlertDispatcher {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_DELIVERY = 1;

  enum class Severity { WARNING, CRITICAL };

  struct Alert {
    std::string walletAddress;
    std::string asset;
    Decimal variance;
    Decimal variancePercent;
    std::string message;
    Severity severity{ Severity::WARNING };
  };

  static const char *severityName(Severity severity) {
    return severity == Severity::CRITICAL ? "critical" : "warning";
  }

  virtual ~AlertDispatcher() = default;

  // An empty batch is a no-op
  virtual Roe<void> sendBatchAlert(const std::vector<Alert> &alerts) = 0;
};

} // namespace cb

#endif // CB_LEDGER_ALERT_DISPATCHER_HPP
