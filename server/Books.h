#ifndef CB_LEDGER_BOOKS_H
#define CB_LEDGER_BOOKS_H

#include "../interface/AccountDirectory.hpp"
#include "../interface/AlertDispatcher.hpp"
#include "../interface/BalanceSource.hpp"
#include "../ledger/BookBalanceCalculator.h"
#include "../ledger/HashChainLedger.h"
#include "../ledger/PostingValidator.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../lots/LotInventory.h"
#include "../recon/ReconciliationEngine.h"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cb {

/**
 * Books - one set of books in a work directory.
 *
 * Owns the journal, lot inventory and reconciliation engine, wires them to
 * the collaborators named in config.json and exposes the operations the
 * command line tool drives.
 *
 * Work directory layout:
 *   config.json    chart of accounts, P&L accounts, thresholds, wallets
 *   journal.dat    journal entries
 *   lots.dat       lots and disposals
 *   recon.dat      reconciliation records
 *   cb-ledger.log  log file
 */
class Books : public Module {
public:
  struct Error : RoeErrorBase {
    int32_t postingIndex{ -1 }; // offending posting of a rejected entry

    Error() = default;
    Error(int32_t c, const std::string &msg, int32_t index = -1)
        : RoeErrorBase(c, msg), postingIndex(index) {}
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_STATE = 2;
  constexpr static int32_t E_VALIDATION = 3; // malformed posting
  constexpr static int32_t E_LEDGER = 4;
  constexpr static int32_t E_INTEGRITY = 5;
  constexpr static int32_t E_LOTS = 6;
  constexpr static int32_t E_RECON = 7;
  constexpr static int32_t E_NOT_FOUND = 8;
  constexpr static int32_t E_EMPTY_ENTRY = 9;
  constexpr static int32_t E_IMBALANCED = 10;
  constexpr static int32_t E_UNKNOWN_ACCOUNT = 11;
  constexpr static int32_t E_UNKNOWN_DIMENSION = 12;
  constexpr static int32_t E_DIRECTORY = 13;
  constexpr static int32_t E_INVALID_QUANTITY = 14;
  constexpr static int32_t E_INSUFFICIENT_LOTS = 15;
  constexpr static int32_t E_INVALID_AMOUNT = 16;
  constexpr static int32_t E_LOT_NOT_FOUND = 17;
  constexpr static int32_t E_JOURNALIZE = 18;
  constexpr static int32_t E_OVERFLOW = 19;
  constexpr static int32_t E_INVALID_ASSET = 20;

  // Short upper-case name of an error code, e.g. INSUFFICIENT_LOTS
  static std::string errorName(int32_t code);

  constexpr static const char *FILE_CONFIG = "config.json";
  constexpr static const char *FILE_JOURNAL = "journal.dat";
  constexpr static const char *FILE_LOTS = "lots.dat";
  constexpr static const char *FILE_RECON = "recon.dat";
  constexpr static const char *FILE_LOG = "cb-ledger.log";

  struct PnlAccounts {
    std::string proceeds{ "1100" };
    std::string gain{ "4100" };
    std::string loss{ "6200" };
  };

  struct ReconciliationConfig {
    Decimal threshold{ Decimal::fromUnits(1000000) }; // 0.01
    Decimal alertThreshold{ Decimal::fromInt(1) };
    Decimal criticalPercent{ Decimal::fromInt(10) };
    bool includeUntaggedPostings{ false };
    std::string balanceSnapshot{ "balances.json" }; // relative to workDir
  };

  struct RunFileConfig {
    std::vector<AccountDirectory::Account> accounts;
    std::map<std::string, std::vector<std::string>> dimensions;
    PnlAccounts pnlAccounts;
    ReconciliationConfig reconciliation;
    LotInventory::Method defaultMethod{ LotInventory::Method::FIFO };
    std::vector<ReconciliationEngine::Wallet> wallets;

    RunFileConfig();

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct InitConfig {
    std::string workDir;
    bool logToFile{ true };
    // Collaborators replacing the ones built from config, mainly for tests
    std::shared_ptr<BalanceSource> spBalanceSource;
    std::shared_ptr<AlertDispatcher> spAlertDispatcher;
  };

  Books();
  ~Books() override = default;

  /**
   * Load or create config.json and mount every data file
   */
  Roe<void> init(const InitConfig &config);

  /**
   * Validate and append a journal entry
   */
  Roe<JournalEntry> postEntry(const EntryDraft &draft);

  /**
   * Verify the chain; a break also halts further appends
   */
  Roe<HashChainLedger::VerifyResult> verifyChain();

  Roe<HashChainLedger::Proof> proof(uint64_t entryId, uint64_t window = 0);
  Roe<JournalEntry> getEntry(uint64_t entryId);

  Roe<BookBalanceCalculator::Balance> balanceAsOf(const std::string &account,
                                                  const std::string &asset,
                                                  int64_t asOfDate);
  Roe<std::map<std::string, BookBalanceCalculator::Balance>>
  allAssetBalances(const std::string &account, int64_t asOfDate);

  Roe<LotInventory::Lot> createLot(const LotInventory::CreateLotRequest &req);

  /**
   * Dispose lots and, when journalize is set, post the realized gain or
   * loss to the journal in the same step
   */
  Roe<LotInventory::DisposeResult>
  disposeLot(const LotInventory::DisposeRequest &request, bool journalize);

  Roe<LotInventory::PnLReport> realizedPnL(const LotInventory::PnLQuery &query);
  Roe<std::map<std::string, LotInventory::LotBalance>> lotBalances();

  /**
   * Reconcile one configured wallet, or all of them
   */
  Roe<ReconciliationEngine::RunSummary>
  reconcile(const std::optional<std::string> &walletId = std::nullopt);

  Roe<std::vector<ReconciliationEngine::Record>>
  unreconciledItems(const Decimal &minVariance);
  Roe<void> resetAlert(const std::string &walletId, const std::string &asset);

  const RunFileConfig &getConfig() const { return config_; }
  bool isInitialized() const { return initialized_; }

private:
  static Error fromValidator(const PostingValidator::Error &error);
  static Error fromLots(const LotInventory::Error &error);

  Roe<void> loadConfig(const std::string &workDir);

  // Posts the realized P&L of a disposal; nullopt when it is zero
  Roe<std::optional<uint64_t>>
  journalizePnL(const LotInventory::DisposeResult &result,
                const std::optional<std::string> &txHash);

  RunFileConfig config_;
  std::string workDir_;
  bool initialized_{ false };

  HashChainLedger ledger_;
  LotInventory lots_;
  std::shared_ptr<AccountDirectory> spDirectory_;
  std::unique_ptr<PostingValidator> validator_;
  std::unique_ptr<BookBalanceCalculator> calculator_;
  std::unique_ptr<ReconciliationEngine> recon_;
};

} // namespace cb

#endif // CB_LEDGER_BOOKS_H
