#ifndef CB_LEDGER_BOOK_BALANCE_CALCULATOR_H
#define CB_LEDGER_BOOK_BALANCE_CALCULATOR_H

#include "../lib/Decimal.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "HashChainLedger.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace cb {

/**
 * BookBalanceCalculator - point-in-time balances replayed from the journal.
 *
 * balance = sum(debit) - sum(credit) over the account's postings in entries
 * dated on or before asOfDate. Reads go through the ledger's shared lock.
 */
class BookBalanceCalculator : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_OVERFLOW = 1;

  // Whether postings without an asset tag count toward a per-asset balance
  enum class UntaggedPolicy { EXCLUDE, INCLUDE };

  struct Balance {
    Decimal balance;
    uint64_t postingCount{ 0 };

    nlohmann::json toJson() const;
  };

  explicit BookBalanceCalculator(
      const HashChainLedger &ledger,
      UntaggedPolicy policy = UntaggedPolicy::EXCLUDE);
  ~BookBalanceCalculator() override = default;

  /**
   * Balance of an account as of a date
   * @param accountCode Account to replay
   * @param asset Asset filter; empty for every posting on the account
   * @param asOfDate Inclusive cut-off, unix seconds
   */
  Roe<Balance> balanceAsOf(const std::string &accountCode,
                           const std::string &asset, int64_t asOfDate) const;

  /**
   * Balances of an account per asset tag; untagged postings under ""
   */
  Roe<std::map<std::string, Balance>>
  calculateAllAssetBalances(const std::string &accountCode,
                            int64_t asOfDate) const;

  void setUntaggedPolicy(UntaggedPolicy policy) { policy_ = policy; }
  UntaggedPolicy getUntaggedPolicy() const { return policy_; }

private:
  const HashChainLedger &ledger_;
  UntaggedPolicy policy_;
};

} // namespace cb

#endif // CB_LEDGER_BOOK_BALANCE_CALCULATOR_H
