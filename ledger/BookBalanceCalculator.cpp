#include "BookBalanceCalculator.h"

#include <stdexcept>

namespace cb {

nlohmann::json BookBalanceCalculator::Balance::toJson() const {
  return { { "balance", balance.toString() }, { "postingCount", postingCount } };
}

BookBalanceCalculator::BookBalanceCalculator(const HashChainLedger &ledger,
                                             UntaggedPolicy policy)
    : ledger_(ledger), policy_(policy) {}

BookBalanceCalculator::Roe<BookBalanceCalculator::Balance>
BookBalanceCalculator::balanceAsOf(const std::string &accountCode,
                                   const std::string &asset,
                                   int64_t asOfDate) const {
  std::string wanted = utl::toUpper(asset);
  bool includeUntagged = policy_ == UntaggedPolicy::INCLUDE;
  Balance result;

  try {
    ledger_.forEachEntry([&](const JournalEntry &entry) {
      if (entry.date > asOfDate) {
        return;
      }
      for (const auto &posting : entry.postings) {
        if (posting.accountCode != accountCode) {
          continue;
        }
        if (!wanted.empty()) {
          if (posting.assetTag) {
            if (utl::toUpper(*posting.assetTag) != wanted) {
              continue;
            }
          } else if (!includeUntagged) {
            continue;
          }
        }
        result.balance += posting.debit;
        result.balance -= posting.credit;
        result.postingCount++;
      }
    });
  } catch (const std::overflow_error &e) {
    log().error << "Balance overflow on account " << accountCode;
    return Error(E_OVERFLOW, "Balance of account " + accountCode +
                                 " overflows: " + e.what());
  }

  log().debug << "Balance of " << accountCode
              << (wanted.empty() ? "" : " " + wanted) << " as of "
              << utl::formatIsoDay(asOfDate) << ": " << result.balance << " ("
              << result.postingCount << " postings)";
  return result;
}

BookBalanceCalculator::Roe<std::map<std::string, BookBalanceCalculator::Balance>>
BookBalanceCalculator::calculateAllAssetBalances(const std::string &accountCode,
                                                 int64_t asOfDate) const {
  std::map<std::string, Balance> balances;

  try {
    ledger_.forEachEntry([&](const JournalEntry &entry) {
      if (entry.date > asOfDate) {
        return;
      }
      for (const auto &posting : entry.postings) {
        if (posting.accountCode != accountCode) {
          continue;
        }
        std::string key =
            posting.assetTag ? utl::toUpper(*posting.assetTag) : "";
        Balance &slot = balances[key];
        slot.balance += posting.debit;
        slot.balance -= posting.credit;
        slot.postingCount++;
      }
    });
  } catch (const std::overflow_error &e) {
    log().error << "Balance overflow on account " << accountCode;
    return Error(E_OVERFLOW, "Balance of account " + accountCode +
                                 " overflows: " + e.what());
  }
  return balances;
}

} // namespace cb
