#ifndef CB_LEDGER_RECONCILIATION_ENGINE_H
#define CB_LEDGER_RECONCILIATION_ENGINE_H

#include "../interface/AlertDispatcher.hpp"
#include "../interface/BalanceSource.hpp"
#include "../ledger/BookBalanceCalculator.h"
#include "../ledger/RecordFile.h"
#include "../lib/Decimal.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cb {

// Defined at namespace scope so its default member initializers are usable
// in ReconciliationEngine's default constructor argument.
struct ReconciliationEngineConfig {
  Decimal threshold{ Decimal::fromUnits(1000000) };      // 0.01
  Decimal alertThreshold{ Decimal::fromInt(1) };
  Decimal criticalPercent{ Decimal::fromInt(10) };
};

/**
 * ReconciliationEngine - compares book balances of wallet accounts against
 * externally observed balances.
 *
 * One record is kept per (wallet, asset) pair and rewritten on every run.
 * alertSent latches once an alert for an out-of-threshold pair has been
 * delivered. It is cleared when a later run finds the pair within threshold
 * or by resetAlert(). Runs of the same wallet hold that wallet's lock from
 * the latch decision until their records are committed, so a concurrent run
 * never alerts twice for the same condition nor reads an undelivered alert
 * as sent. Runs of different wallets proceed in parallel.
 */
class ReconciliationEngine : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_BALANCE_SOURCE = 1;
  constexpr static int32_t E_BOOK_BALANCE = 2;
  constexpr static int32_t E_OVERFLOW = 3;
  constexpr static int32_t E_NOT_FOUND = 4;
  constexpr static int32_t E_STORAGE = 5;
  constexpr static int32_t E_STATE = 6;
  constexpr static int32_t E_INVALID_WALLET = 7;

  enum class Status : uint8_t {
    PENDING = 0,
    RECONCILED = 1, // within threshold
    FLAGGED = 2,    // out of threshold, no alert delivered
    ALERTED = 3     // out of threshold, alert delivered
  };

  static std::string statusName(Status status);

  using Config = ReconciliationEngineConfig;

  struct Wallet {
    std::string id;
    std::string address;
    std::string glAccount;
    std::vector<std::string> assets; // empty: every asset the source reports
  };

  struct Record {
    constexpr static const uint32_t VERSION = 1;

    std::string walletId;
    std::string address;
    std::string asset;
    Decimal onChainBalance;
    Decimal bookBalance;
    Decimal variance; // onChain - book
    Decimal variancePercent;
    Decimal threshold;
    bool isWithinThreshold{ false };
    bool alertSent{ false };
    std::optional<int64_t> alertSentAt;
    uint64_t onChainBlockNumber{ 0 };
    Status status{ Status::PENDING };
    int64_t asOf{ 0 };
    int64_t createdAt{ 0 };
    int64_t updatedAt{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      uint8_t state = static_cast<uint8_t>(status);
      ar &walletId &address &asset &onChainBalance &bookBalance &variance
          &variancePercent &threshold &isWithinThreshold &alertSent
          &alertSentAt &onChainBlockNumber &state &asOf &createdAt &updatedAt;
      status = static_cast<Status>(state);
    }

    std::string ltsToString() const;
    bool ltsFromString(const std::string &str);
    nlohmann::json toJson() const;
  };

  struct WalletResult {
    std::vector<Record> records;
    uint64_t alertsSent{ 0 };
  };

  struct RunSummary {
    uint64_t totalReconciled{ 0 };
    uint64_t withinThreshold{ 0 };
    uint64_t outOfThreshold{ 0 };
    uint64_t alertsGenerated{ 0 };
    std::vector<std::string> failedWallets;

    nlohmann::json toJson() const;
  };

  ReconciliationEngine(const BookBalanceCalculator &calculator,
                       std::shared_ptr<BalanceSource> spSource,
                       std::shared_ptr<AlertDispatcher> spDispatcher,
                       const Config &config = Config());
  ~ReconciliationEngine() override = default;

  /**
   * Attach to a reconciliation file and load the latest record per pair
   */
  Roe<void> mount(const std::string &filepath);

  /**
   * Reconcile every asset of one wallet. A balance source failure aborts
   * this wallet only; nothing is recorded for it.
   */
  Roe<WalletResult> reconcileWallet(const Wallet &wallet);

  // Runs every wallet, isolating failures
  RunSummary reconcileAll(const std::vector<Wallet> &wallets);

  /**
   * Latest out-of-threshold records with |variance| >= minVariance, largest
   * |variancePercent| first
   */
  std::vector<Record> getUnreconciledItems(const Decimal &minVariance) const;

  Roe<Record> getRecord(const std::string &walletId,
                        const std::string &asset) const;

  // Operator reset of the alert latch
  Roe<void> resetAlert(const std::string &walletId, const std::string &asset);

  /**
   * variance / book * 100; 100 when book is zero and onChain is not, else 0
   * @throws std::overflow_error if the percentage does not fit
   */
  static Decimal variancePercentOf(const Decimal &onChain, const Decimal &book);

  void setConfig(const Config &config);
  Config getConfig() const;

private:
  using PairKey = std::pair<std::string, std::string>; // wallet id, asset

  Roe<Record> measure(const Wallet &wallet,
                      const BalanceSource::Balance &observed,
                      const Config &config, int64_t now) const;
  Roe<void> persistLocked(const Record &record);
  std::shared_ptr<std::mutex> getWalletMutex(const std::string &walletId);

  const BookBalanceCalculator &calculator_;
  std::shared_ptr<BalanceSource> spSource_;
  std::shared_ptr<AlertDispatcher> spDispatcher_;

  mutable std::mutex mutex_;
  Config config_;
  std::map<PairKey, Record> mRecords_;
  RecordFile store_;
  bool persistent_{ false };

  std::mutex walletsMutex_;
  std::map<std::string, std::shared_ptr<std::mutex>> mWalletMutexes_;
};

} // namespace cb

#endif // CB_LEDGER_RECONCILIATION_ENGINE_H
