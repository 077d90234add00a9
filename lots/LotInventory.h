#ifndef CB_LEDGER_LOT_INVENTORY_H
#define CB_LEDGER_LOT_INVENTORY_H

#include "../ledger/RecordFile.h"
#include "../lib/Decimal.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cb {

/**
 * LotInventory - per-asset acquisition lots and cost-basis disposals.
 *
 * Lots of one asset are kept ordered by acquisition date, then by creation
 * order. Every operation on an asset runs under that asset's lock, so
 * disposals of different assets proceed in parallel while disposals of the
 * same asset are serialized. A disposal is all-or-nothing: it is planned
 * first, persisted as one record, and only then applied.
 */
class LotInventory : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_QUANTITY = 1;
  constexpr static int32_t E_INSUFFICIENT_LOTS = 2;
  constexpr static int32_t E_INVALID_AMOUNT = 3;
  constexpr static int32_t E_INVALID_ASSET = 4;
  constexpr static int32_t E_LOT_NOT_FOUND = 5;
  constexpr static int32_t E_OVERFLOW = 6;
  constexpr static int32_t E_JOURNALIZE = 7;
  constexpr static int32_t E_STORAGE = 8;
  constexpr static int32_t E_STATE = 9;

  constexpr static int64_t LONG_TERM_SECONDS = 365 * 24 * 3600;

  enum class SourceType : uint8_t {
    PURCHASE = 0,
    MINING = 1,
    STAKING = 2,
    AIRDROP = 3,
    TRANSFER_IN = 4
  };

  enum class Method { FIFO, LIFO, SPECIFIC };

  static std::string sourceTypeName(SourceType type);
  static bool parseSourceType(const std::string &name, SourceType &type);
  static std::string methodName(Method method);
  static bool parseMethod(const std::string &name, Method &method);

  struct Lot {
    uint64_t id{ 0 };
    std::string asset;
    Decimal originalQuantity;
    Decimal remainingQuantity;
    Decimal costBasis; // total for originalQuantity
    int64_t acquisitionDate{ 0 };
    SourceType sourceType{ SourceType::PURCHASE };
    std::optional<std::string> txHash;
    std::optional<uint64_t> journalEntryId;
    int64_t createdAt{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      uint8_t source = static_cast<uint8_t>(sourceType);
      ar &id &asset &originalQuantity &remainingQuantity &costBasis
          &acquisitionDate &source &txHash &journalEntryId &createdAt;
      sourceType = static_cast<SourceType>(source);
    }

    Decimal unitCost() const;
    nlohmann::json toJson() const;
  };

  struct Disposal {
    uint64_t id{ 0 };
    uint64_t lotId{ 0 };
    std::string asset;
    Decimal quantityDisposed;
    Decimal proceeds;
    Decimal fee;
    Decimal costBasis;
    Decimal realizedPnL;
    int64_t disposalDate{ 0 };
    int64_t acquisitionDate{ 0 };
    std::optional<std::string> txHash;
    std::optional<uint64_t> journalEntryId;

    template <typename Archive> void serialize(Archive &ar) {
      ar &id &lotId &asset &quantityDisposed &proceeds &fee &costBasis
          &realizedPnL &disposalDate &acquisitionDate &txHash &journalEntryId;
    }

    bool isLongTerm() const {
      return disposalDate - acquisitionDate > LONG_TERM_SECONDS;
    }
    nlohmann::json toJson() const;
  };

  struct CreateLotRequest {
    std::string asset;
    Decimal quantity;
    Decimal costBasis;
    int64_t acquisitionDate{ 0 };
    SourceType sourceType{ SourceType::PURCHASE };
    std::optional<std::string> txHash;
    std::optional<uint64_t> journalEntryId;
  };

  struct DisposeRequest {
    std::string asset;
    Decimal quantity;
    Decimal proceeds;
    Decimal fee;
    int64_t disposalDate{ 0 };
    Method method{ Method::FIFO };
    std::optional<uint64_t> lotId; // required for Method::SPECIFIC
    std::optional<std::string> txHash;
  };

  struct DisposeResult {
    std::string asset;
    std::vector<Disposal> disposals;
    Decimal totalQuantity;
    Decimal totalProceeds;
    Decimal totalFee;
    Decimal totalCostBasis;
    Decimal totalRealizedPnL;
    std::optional<uint64_t> journalEntryId;

    nlohmann::json toJson() const;
  };

  struct LotBalance {
    std::string asset;
    Decimal totalQuantity;
    Decimal totalCostBasis; // of the remaining quantity
    Decimal averageCostBasis;
    uint64_t lotCount{ 0 };

    nlohmann::json toJson() const;
  };

  struct PnLQuery {
    std::optional<std::string> asset;
    std::optional<int64_t> fromDate; // inclusive
    std::optional<int64_t> toDate;   // inclusive
  };

  struct PnLSummary {
    uint64_t totalDisposals{ 0 };
    Decimal totalProceeds;
    Decimal totalCostBasis;
    Decimal totalRealizedPnL;
    Decimal shortTermGains;
    Decimal longTermGains;
    Decimal shortTermLosses; // magnitudes
    Decimal longTermLosses;
  };

  struct PnLReport {
    std::vector<Disposal> disposals;
    PnLSummary summary;

    nlohmann::json toJson() const;
  };

  /**
   * Called under the asset lock once a disposal is planned and before it is
   * committed. Returns the id of the journal entry recording the gain or
   * loss, or nullopt when nothing was journalized; an error aborts the
   * disposal.
   */
  using Journalizer =
      std::function<Roe<std::optional<uint64_t>>(const DisposeResult &)>;

  LotInventory();
  ~LotInventory() override = default;

  /**
   * Attach to a lot file and replay its lots and disposals
   * @param filepath Lot file, created when missing
   */
  Roe<void> mount(const std::string &filepath);

  Roe<Lot> createLot(const CreateLotRequest &request);

  /**
   * Consume lots of an asset
   * @param request Quantity, proceeds, fee and selection method
   * @param journalizer Optional hook recording the realized result
   * @return One disposal per lot touched, with totals
   */
  Roe<DisposeResult> disposeLot(const DisposeRequest &request,
                                const Journalizer &journalizer = nullptr);

  Roe<Lot> getLot(uint64_t lotId) const;

  // Open lots (remaining > 0) in FIFO order
  std::vector<Lot> getLots(const std::string &asset) const;

  Roe<LotBalance> getLotBalance(const std::string &asset) const;
  Roe<std::map<std::string, LotBalance>> getAllBalances() const;

  Roe<PnLReport> getRealizedPnL(const PnLQuery &query) const;
  std::vector<Disposal> getDisposals(uint64_t lotId) const;

private:
  struct AssetBook {
    std::mutex mutex;
    std::vector<Lot> lots; // acquisition date, then id
  };

  struct StoreRecord {
    constexpr static const uint32_t VERSION = 1;
    constexpr static const uint8_t T_LOT = 1;
    constexpr static const uint8_t T_DISPOSALS = 2;

    uint8_t type{ 0 };
    std::vector<Lot> lots;
    std::vector<Disposal> disposals;

    template <typename Archive> void serialize(Archive &ar) {
      ar &type &lots &disposals;
    }

    std::string ltsToString() const;
    bool ltsFromString(const std::string &str);
  };

  struct Allocation {
    size_t lotIndex{ 0 };
    Decimal consumed;
    Decimal remainingAfter;
  };

  std::shared_ptr<AssetBook> findBook(const std::string &asset) const;
  std::shared_ptr<AssetBook> getOrCreateBook(const std::string &asset);

  static void insertOrdered(std::vector<Lot> &lots, const Lot &lot);
  static LotBalance summarize(const std::string &asset,
                              const std::vector<Lot> &lots);

  Roe<std::vector<Allocation>> planAllocations(const AssetBook &book,
                                               const DisposeRequest &request,
                                               const std::string &asset) const;
  Roe<void> persist(const StoreRecord &record);
  Roe<void> replay(const StoreRecord &record);

  mutable std::mutex booksMutex_;
  std::map<std::string, std::shared_ptr<AssetBook>> mBooks_;
  std::map<uint64_t, std::string> mLotAssets_; // lot id -> asset

  mutable std::mutex disposalsMutex_;
  std::vector<Disposal> disposals_;

  // Held shared by lot operations and exclusively by mount
  std::shared_mutex mountMutex_;
  std::mutex storeMutex_;
  RecordFile store_;
  bool persistent_{ false }; // guarded by storeMutex_

  std::atomic<uint64_t> nextLotId_{ 1 };
  std::atomic<uint64_t> nextDisposalId_{ 1 };
};

std::ostream &operator<<(std::ostream &os, const LotInventory::Lot &lot);

} // namespace cb

#endif // CB_LEDGER_LOT_INVENTORY_H
