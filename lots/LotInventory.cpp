#include "LotInventory.h"
#include "../lib/Serialize.hpp"
#include "../lib/Utilities.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace cb {

namespace {

nlohmann::json optionalId(const std::optional<uint64_t> &id) {
  return id ? nlohmann::json(std::to_string(*id)) : nlohmann::json(nullptr);
}

} // namespace

// ----------------- names ---------------------------------------------

std::string LotInventory::sourceTypeName(SourceType type) {
  switch (type) {
  case SourceType::PURCHASE:
    return "purchase";
  case SourceType::MINING:
    return "mining";
  case SourceType::STAKING:
    return "staking";
  case SourceType::AIRDROP:
    return "airdrop";
  case SourceType::TRANSFER_IN:
    return "transfer_in";
  default:
    return "unknown";
  }
}

bool LotInventory::parseSourceType(const std::string &name, SourceType &type) {
  static const std::map<std::string, SourceType> names = {
      { "purchase", SourceType::PURCHASE },
      { "mining", SourceType::MINING },
      { "staking", SourceType::STAKING },
      { "airdrop", SourceType::AIRDROP },
      { "transfer_in", SourceType::TRANSFER_IN },
      { "transfer-in", SourceType::TRANSFER_IN },
  };
  auto it = names.find(name);
  if (it == names.end()) {
    return false;
  }
  type = it->second;
  return true;
}

std::string LotInventory::methodName(Method method) {
  switch (method) {
  case Method::FIFO:
    return "fifo";
  case Method::LIFO:
    return "lifo";
  case Method::SPECIFIC:
    return "specific";
  default:
    return "unknown";
  }
}

bool LotInventory::parseMethod(const std::string &name, Method &method) {
  if (name == "fifo") {
    method = Method::FIFO;
  } else if (name == "lifo") {
    method = Method::LIFO;
  } else if (name == "specific") {
    method = Method::SPECIFIC;
  } else {
    return false;
  }
  return true;
}

// ----------------- value types ---------------------------------------

Decimal LotInventory::Lot::unitCost() const {
  if (originalQuantity.isZero()) {
    return Decimal();
  }
  return Decimal::mulDiv(costBasis, Decimal::fromInt(1), originalQuantity);
}

nlohmann::json LotInventory::Lot::toJson() const {
  nlohmann::json jd;
  jd["id"] = std::to_string(id);
  jd["asset"] = asset;
  jd["quantity"] = originalQuantity.toString();
  jd["remainingQty"] = remainingQuantity.toString();
  jd["costBasis"] = costBasis.toString();
  jd["unitCost"] = unitCost().toString();
  jd["acquisitionDate"] = utl::formatIsoDate(acquisitionDate);
  jd["sourceType"] = sourceTypeName(sourceType);
  jd["txHash"] = txHash ? nlohmann::json(*txHash) : nlohmann::json(nullptr);
  jd["journalEntryId"] = optionalId(journalEntryId);
  return jd;
}

nlohmann::json LotInventory::Disposal::toJson() const {
  nlohmann::json jd;
  jd["id"] = std::to_string(id);
  jd["lotId"] = std::to_string(lotId);
  jd["asset"] = asset;
  jd["quantityDisposed"] = quantityDisposed.toString();
  jd["proceeds"] = proceeds.toString();
  jd["fee"] = fee.toString();
  jd["costBasis"] = costBasis.toString();
  jd["realizedPnL"] = realizedPnL.toString();
  jd["disposalDate"] = utl::formatIsoDate(disposalDate);
  jd["holding"] = isLongTerm() ? "long_term" : "short_term";
  jd["journalEntryId"] = optionalId(journalEntryId);
  return jd;
}

nlohmann::json LotInventory::DisposeResult::toJson() const {
  nlohmann::json jd;
  jd["asset"] = asset;
  jd["disposals"] = nlohmann::json::array();
  for (const auto &disposal : disposals) {
    jd["disposals"].push_back(disposal.toJson());
  }
  jd["totalQuantity"] = totalQuantity.toString();
  jd["totalProceeds"] = totalProceeds.toString();
  jd["totalFee"] = totalFee.toString();
  jd["totalCostBasis"] = totalCostBasis.toString();
  jd["totalRealizedPnL"] = totalRealizedPnL.toString();
  jd["journalEntryId"] = optionalId(journalEntryId);
  return jd;
}

nlohmann::json LotInventory::LotBalance::toJson() const {
  return { { "asset", asset },
           { "totalQuantity", totalQuantity.toString() },
           { "totalCostBasis", totalCostBasis.toString() },
           { "averageCostBasis", averageCostBasis.toString() },
           { "lotCount", lotCount } };
}

nlohmann::json LotInventory::PnLReport::toJson() const {
  nlohmann::json jd;
  jd["disposals"] = nlohmann::json::array();
  for (const auto &disposal : disposals) {
    jd["disposals"].push_back(disposal.toJson());
  }
  jd["summary"] = { { "totalDisposals", summary.totalDisposals },
                    { "totalProceeds", summary.totalProceeds.toString() },
                    { "totalCostBasis", summary.totalCostBasis.toString() },
                    { "totalRealizedPnL",
                      summary.totalRealizedPnL.toString() },
                    { "shortTermGains", summary.shortTermGains.toString() },
                    { "longTermGains", summary.longTermGains.toString() },
                    { "shortTermLosses", summary.shortTermLosses.toString() },
                    { "longTermLosses", summary.longTermLosses.toString() } };
  return jd;
}

std::ostream &operator<<(std::ostream &os, const LotInventory::Lot &lot) {
  os << "Lot{id: " << lot.id << ", asset: " << lot.asset
     << ", remaining: " << lot.remainingQuantity << "/"
     << lot.originalQuantity << ", cost: " << lot.costBasis
     << ", acquired: " << utl::formatIsoDay(lot.acquisitionDate) << "}";
  return os;
}

// ----------------- persistence records -------------------------------

std::string LotInventory::StoreRecord::ltsToString() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar &VERSION &*this;
  return oss.str();
}

bool LotInventory::StoreRecord::ltsFromString(const std::string &str) {
  std::istringstream iss(str, std::ios::binary);
  InputArchive ar(iss);
  uint32_t version = 0;
  ar &version;
  if (version != VERSION) {
    return false;
  }
  ar &*this;
  if (ar.failed()) {
    return false;
  }
  return true;
}

// ----------------- LotInventory --------------------------------------

LotInventory::LotInventory() {
  store_.redirectLogger(log().getFullName() + ".Store");
}

LotInventory::Roe<void> LotInventory::mount(const std::string &filepath) {
  // Lock order is mount, asset book, then store; replay takes book locks so
  // the store lock is held only around file access
  std::unique_lock<std::shared_mutex> mountLock(mountMutex_);
  if (persistent_) {
    return Error(E_STATE, "Lot inventory is already mounted");
  }
  {
    std::lock_guard<std::mutex> lock(booksMutex_);
    if (!mBooks_.empty()) {
      return Error(E_STATE, "Lot inventory already holds lots");
    }
  }

  std::vector<std::string> records;
  {
    std::lock_guard<std::mutex> storeLock(storeMutex_);
    store_.redirectLogger(log().getFullName() + ".Store");
    auto opened = store_.open(filepath);
    if (!opened) {
      return Error(E_STORAGE,
                   "Failed to open lot file: " + opened.error().message);
    }
    auto read = store_.readAll();
    if (!read) {
      return Error(E_STORAGE,
                   "Failed to read lot file: " + read.error().message);
    }
    records = read.value();
  }

  for (size_t i = 0; i < records.size(); ++i) {
    StoreRecord record;
    if (!record.ltsFromString(records[i])) {
      return Error(E_STORAGE,
                   "Lot record " + std::to_string(i) + " is corrupt");
    }
    auto applied = replay(record);
    if (!applied) {
      return Error(E_STORAGE, "Lot record " + std::to_string(i) + ": " +
                                  applied.error().message);
    }
  }

  {
    std::lock_guard<std::mutex> storeLock(storeMutex_);
    persistent_ = true;
  }

  log().info << "Mounted lot file " << filepath << " with "
             << (nextLotId_.load() - 1) << " lots and "
             << (nextDisposalId_.load() - 1) << " disposals";
  return {};
}

LotInventory::Roe<void> LotInventory::replay(const StoreRecord &record) {
  if (record.type == StoreRecord::T_LOT) {
    for (const auto &lot : record.lots) {
      if (lot.asset.empty() || !lot.originalQuantity.isPositive() ||
          lot.remainingQuantity.isNegative() ||
          lot.remainingQuantity > lot.originalQuantity ||
          lot.costBasis.isNegative()) {
        return Error(E_STORAGE, "Lot " + std::to_string(lot.id) +
                                    " has invalid quantities");
      }
      auto spBook = getOrCreateBook(lot.asset);
      {
        std::lock_guard<std::mutex> lock(spBook->mutex);
        insertOrdered(spBook->lots, lot);
      }
      {
        std::lock_guard<std::mutex> lock(booksMutex_);
        mLotAssets_[lot.id] = lot.asset;
      }
      if (lot.id >= nextLotId_) {
        nextLotId_ = lot.id + 1;
      }
    }
    return {};
  }

  if (record.type == StoreRecord::T_DISPOSALS) {
    for (const auto &disposal : record.disposals) {
      auto spBook = findBook(disposal.asset);
      if (!spBook) {
        return Error(E_LOT_NOT_FOUND,
                     "Disposal references unknown asset " + disposal.asset);
      }
      std::lock_guard<std::mutex> lock(spBook->mutex);
      auto it = std::find_if(
          spBook->lots.begin(), spBook->lots.end(),
          [&](const Lot &lot) { return lot.id == disposal.lotId; });
      if (it == spBook->lots.end()) {
        return Error(E_LOT_NOT_FOUND, "Disposal references unknown lot " +
                                          std::to_string(disposal.lotId));
      }
      if (!disposal.quantityDisposed.isPositive()) {
        return Error(E_STORAGE, "Disposal " + std::to_string(disposal.id) +
                                    " has a non-positive quantity");
      }
      if (disposal.quantityDisposed > it->remainingQuantity) {
        return Error(E_INSUFFICIENT_LOTS,
                     "Disposal " + std::to_string(disposal.id) +
                         " exceeds the remaining quantity of lot " +
                         std::to_string(disposal.lotId));
      }
      it->remainingQuantity -= disposal.quantityDisposed;
      if (disposal.id >= nextDisposalId_) {
        nextDisposalId_ = disposal.id + 1;
      }
    }
    std::lock_guard<std::mutex> lock(disposalsMutex_);
    disposals_.insert(disposals_.end(), record.disposals.begin(),
                      record.disposals.end());
    return {};
  }

  return Error(E_STORAGE,
               "Unknown record type " + std::to_string(record.type));
}

LotInventory::Roe<void> LotInventory::persist(const StoreRecord &record) {
  std::lock_guard<std::mutex> lock(storeMutex_);
  if (!persistent_) {
    return {};
  }
  auto written = store_.append(record.ltsToString());
  if (!written) {
    log().error << "Failed to persist lot record: " << written.error().message;
    return Error(E_STORAGE, "Failed to persist: " + written.error().message);
  }
  return {};
}

std::shared_ptr<LotInventory::AssetBook>
LotInventory::findBook(const std::string &asset) const {
  std::lock_guard<std::mutex> lock(booksMutex_);
  auto it = mBooks_.find(asset);
  return it == mBooks_.end() ? nullptr : it->second;
}

std::shared_ptr<LotInventory::AssetBook>
LotInventory::getOrCreateBook(const std::string &asset) {
  std::lock_guard<std::mutex> lock(booksMutex_);
  auto &spBook = mBooks_[asset];
  if (!spBook) {
    spBook = std::make_shared<AssetBook>();
  }
  return spBook;
}

void LotInventory::insertOrdered(std::vector<Lot> &lots, const Lot &lot) {
  auto pos = std::upper_bound(
      lots.begin(), lots.end(), lot, [](const Lot &a, const Lot &b) {
        if (a.acquisitionDate != b.acquisitionDate) {
          return a.acquisitionDate < b.acquisitionDate;
        }
        return a.id < b.id;
      });
  lots.insert(pos, lot);
}

LotInventory::Roe<LotInventory::Lot>
LotInventory::createLot(const CreateLotRequest &request) {
  std::string asset = utl::toUpper(utl::trim(request.asset));
  if (asset.empty()) {
    return Error(E_INVALID_ASSET, "Asset symbol is required");
  }
  if (!request.quantity.isPositive()) {
    return Error(E_INVALID_QUANTITY, "Lot quantity must be positive");
  }
  if (request.costBasis.isNegative()) {
    return Error(E_INVALID_AMOUNT, "Cost basis must not be negative");
  }

  std::shared_lock<std::shared_mutex> mountLock(mountMutex_);
  auto spBook = getOrCreateBook(asset);
  std::lock_guard<std::mutex> lock(spBook->mutex);

  Lot lot;
  lot.id = nextLotId_.fetch_add(1);
  lot.asset = asset;
  lot.originalQuantity = request.quantity;
  lot.remainingQuantity = request.quantity;
  lot.costBasis = request.costBasis;
  lot.acquisitionDate = request.acquisitionDate;
  lot.sourceType = request.sourceType;
  lot.txHash = request.txHash;
  lot.journalEntryId = request.journalEntryId;
  lot.createdAt = utl::getCurrentTime();

  StoreRecord record;
  record.type = StoreRecord::T_LOT;
  record.lots.push_back(lot);
  auto persisted = persist(record);
  if (!persisted) {
    return persisted.error();
  }

  insertOrdered(spBook->lots, lot);
  {
    std::lock_guard<std::mutex> booksLock(booksMutex_);
    mLotAssets_[lot.id] = asset;
  }

  log().info << "Created " << lot << " from "
             << sourceTypeName(lot.sourceType);
  return lot;
}

LotInventory::Roe<std::vector<LotInventory::Allocation>>
LotInventory::planAllocations(const AssetBook &book,
                              const DisposeRequest &request,
                              const std::string &asset) const {
  std::vector<size_t> order;
  if (request.method == Method::SPECIFIC) {
    for (size_t i = 0; i < book.lots.size(); ++i) {
      if (book.lots[i].id == *request.lotId) {
        order.push_back(i);
      }
    }
    if (order.empty()) {
      return Error(E_LOT_NOT_FOUND, "Lot " + std::to_string(*request.lotId) +
                                        " not found for " + asset);
    }
  } else {
    for (size_t i = 0; i < book.lots.size(); ++i) {
      if (book.lots[i].remainingQuantity.isPositive()) {
        order.push_back(i);
      }
    }
    if (request.method == Method::LIFO) {
      std::reverse(order.begin(), order.end());
    }
  }

  Decimal available;
  for (size_t index : order) {
    available += book.lots[index].remainingQuantity;
  }
  if (available < request.quantity) {
    log().warning << "Insufficient " << asset << " lots: requested "
                  << request.quantity << ", available " << available;
    return Error(E_INSUFFICIENT_LOTS,
                 "Insufficient lots for " + asset + ": requested " +
                     request.quantity.toString() + ", available " +
                     available.toString());
  }

  std::vector<Allocation> allocations;
  Decimal outstanding = request.quantity;
  for (size_t index : order) {
    if (!outstanding.isPositive()) {
      break;
    }
    const Lot &lot = book.lots[index];
    if (!lot.remainingQuantity.isPositive()) {
      continue;
    }
    Decimal consumed = std::min(outstanding, lot.remainingQuantity);
    allocations.push_back(
        Allocation{ index, consumed, lot.remainingQuantity - consumed });
    outstanding -= consumed;
  }
  return allocations;
}

LotInventory::Roe<LotInventory::DisposeResult>
LotInventory::disposeLot(const DisposeRequest &request,
                         const Journalizer &journalizer) {
  std::string asset = utl::toUpper(utl::trim(request.asset));
  if (asset.empty()) {
    return Error(E_INVALID_ASSET, "Asset symbol is required");
  }
  if (!request.quantity.isPositive()) {
    return Error(E_INVALID_QUANTITY, "Disposal quantity must be positive");
  }
  if (request.proceeds.isNegative() || request.fee.isNegative()) {
    return Error(E_INVALID_AMOUNT, "Proceeds and fee must not be negative");
  }
  if (request.method == Method::SPECIFIC && !request.lotId) {
    return Error(E_LOT_NOT_FOUND, "Specific identification requires a lot id");
  }

  std::shared_lock<std::shared_mutex> mountLock(mountMutex_);
  auto spBook = findBook(asset);
  if (!spBook) {
    if (request.method == Method::SPECIFIC) {
      return Error(E_LOT_NOT_FOUND, "Lot " + std::to_string(*request.lotId) +
                                        " not found for " + asset);
    }
    log().warning << "Insufficient " << asset << " lots: none held";
    return Error(E_INSUFFICIENT_LOTS, "Insufficient lots for " + asset +
                                          ": requested " +
                                          request.quantity.toString() +
                                          ", available 0");
  }

  std::lock_guard<std::mutex> lock(spBook->mutex);

  DisposeResult result;
  result.asset = asset;
  std::vector<Allocation> allocations;

  try {
    auto planned = planAllocations(*spBook, request, asset);
    if (!planned) {
      return planned.error();
    }
    allocations = planned.value();

    Decimal proceedsLeft = request.proceeds;
    Decimal feeLeft = request.fee;
    for (size_t i = 0; i < allocations.size(); ++i) {
      const Allocation &allocation = allocations[i];
      const Lot &lot = spBook->lots[allocation.lotIndex];
      bool last = i + 1 == allocations.size();

      Disposal disposal;
      disposal.lotId = lot.id;
      disposal.asset = asset;
      disposal.quantityDisposed = allocation.consumed;
      // Telescoping split: a lot consumed to zero allocates exactly its cost
      disposal.costBasis =
          Decimal::mulDiv(lot.costBasis, lot.remainingQuantity,
                          lot.originalQuantity) -
          Decimal::mulDiv(lot.costBasis, allocation.remainingAfter,
                          lot.originalQuantity);
      if (last) {
        disposal.proceeds = proceedsLeft;
        disposal.fee = feeLeft;
      } else {
        disposal.proceeds = Decimal::mulDiv(
            request.proceeds, allocation.consumed, request.quantity);
        disposal.fee =
            Decimal::mulDiv(request.fee, allocation.consumed, request.quantity);
      }
      proceedsLeft -= disposal.proceeds;
      feeLeft -= disposal.fee;
      disposal.realizedPnL =
          disposal.proceeds - disposal.fee - disposal.costBasis;
      disposal.disposalDate = request.disposalDate;
      disposal.acquisitionDate = lot.acquisitionDate;
      disposal.txHash = request.txHash;

      result.totalQuantity += disposal.quantityDisposed;
      result.totalProceeds += disposal.proceeds;
      result.totalFee += disposal.fee;
      result.totalCostBasis += disposal.costBasis;
      result.totalRealizedPnL += disposal.realizedPnL;
      result.disposals.push_back(disposal);
    }
  } catch (const std::overflow_error &e) {
    return Error(E_OVERFLOW, "Disposal arithmetic overflow: " +
                                 std::string(e.what()));
  }

  if (journalizer) {
    auto journaled = journalizer(result);
    if (!journaled) {
      log().error << "Journalizing " << asset
                  << " disposal failed: " << journaled.error().message;
      return Error(E_JOURNALIZE, "Failed to journalize disposal: " +
                                     journaled.error().message);
    }
    result.journalEntryId = journaled.value();
  }

  for (auto &disposal : result.disposals) {
    disposal.id = nextDisposalId_.fetch_add(1);
    disposal.journalEntryId = result.journalEntryId;
  }

  StoreRecord record;
  record.type = StoreRecord::T_DISPOSALS;
  record.disposals = result.disposals;
  auto persisted = persist(record);
  if (!persisted) {
    if (result.journalEntryId) {
      log().error << "Journal entry " << *result.journalEntryId
                  << " records a disposal that was not committed";
    }
    return persisted.error();
  }

  for (const auto &allocation : allocations) {
    spBook->lots[allocation.lotIndex].remainingQuantity =
        allocation.remainingAfter;
  }
  {
    std::lock_guard<std::mutex> disposalsLock(disposalsMutex_);
    disposals_.insert(disposals_.end(), result.disposals.begin(),
                      result.disposals.end());
  }

  log().info << "Disposed " << result.totalQuantity << " " << asset << " ("
             << methodName(request.method) << ", " << result.disposals.size()
             << " lots): cost " << result.totalCostBasis << ", realized "
             << result.totalRealizedPnL;
  return result;
}

LotInventory::Roe<LotInventory::Lot>
LotInventory::getLot(uint64_t lotId) const {
  std::string asset;
  {
    std::lock_guard<std::mutex> lock(booksMutex_);
    auto it = mLotAssets_.find(lotId);
    if (it == mLotAssets_.end()) {
      return Error(E_LOT_NOT_FOUND, "Lot not found: " + std::to_string(lotId));
    }
    asset = it->second;
  }

  auto spBook = findBook(asset);
  if (spBook) {
    std::lock_guard<std::mutex> lock(spBook->mutex);
    for (const auto &lot : spBook->lots) {
      if (lot.id == lotId) {
        return lot;
      }
    }
  }
  return Error(E_LOT_NOT_FOUND, "Lot not found: " + std::to_string(lotId));
}

std::vector<LotInventory::Lot>
LotInventory::getLots(const std::string &asset) const {
  std::vector<Lot> open;
  auto spBook = findBook(utl::toUpper(utl::trim(asset)));
  if (!spBook) {
    return open;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  for (const auto &lot : spBook->lots) {
    if (lot.remainingQuantity.isPositive()) {
      open.push_back(lot);
    }
  }
  return open;
}

LotInventory::LotBalance LotInventory::summarize(const std::string &asset,
                                                 const std::vector<Lot> &lots) {
  LotBalance balance;
  balance.asset = asset;
  for (const auto &lot : lots) {
    if (!lot.remainingQuantity.isPositive()) {
      continue;
    }
    balance.totalQuantity += lot.remainingQuantity;
    balance.totalCostBasis += Decimal::mulDiv(
        lot.costBasis, lot.remainingQuantity, lot.originalQuantity);
    balance.lotCount++;
  }
  if (balance.totalQuantity.isPositive()) {
    balance.averageCostBasis = Decimal::mulDiv(
        balance.totalCostBasis, Decimal::fromInt(1), balance.totalQuantity);
  }
  return balance;
}

LotInventory::Roe<LotInventory::LotBalance>
LotInventory::getLotBalance(const std::string &asset) const {
  std::string symbol = utl::toUpper(utl::trim(asset));
  auto spBook = findBook(symbol);
  if (!spBook) {
    LotBalance empty;
    empty.asset = symbol;
    return empty;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  try {
    return summarize(symbol, spBook->lots);
  } catch (const std::overflow_error &) {
    return Error(E_OVERFLOW, "Lot balance overflow for " + symbol);
  }
}

LotInventory::Roe<std::map<std::string, LotInventory::LotBalance>>
LotInventory::getAllBalances() const {
  std::map<std::string, std::shared_ptr<AssetBook>> books;
  {
    std::lock_guard<std::mutex> lock(booksMutex_);
    books = mBooks_;
  }

  std::map<std::string, LotBalance> balances;
  for (const auto &[asset, spBook] : books) {
    std::lock_guard<std::mutex> lock(spBook->mutex);
    try {
      LotBalance balance = summarize(asset, spBook->lots);
      if (balance.lotCount > 0) {
        balances[asset] = balance;
      }
    } catch (const std::overflow_error &) {
      return Error(E_OVERFLOW, "Lot balance overflow for " + asset);
    }
  }
  return balances;
}

LotInventory::Roe<LotInventory::PnLReport>
LotInventory::getRealizedPnL(const PnLQuery &query) const {
  std::optional<std::string> asset;
  if (query.asset && !query.asset->empty()) {
    asset = utl::toUpper(utl::trim(*query.asset));
  }

  PnLReport report;
  {
    std::lock_guard<std::mutex> lock(disposalsMutex_);
    for (const auto &disposal : disposals_) {
      if (asset && disposal.asset != *asset) {
        continue;
      }
      if (query.fromDate && disposal.disposalDate < *query.fromDate) {
        continue;
      }
      if (query.toDate && disposal.disposalDate > *query.toDate) {
        continue;
      }
      report.disposals.push_back(disposal);
    }
  }

  try {
    PnLSummary &summary = report.summary;
    for (const auto &disposal : report.disposals) {
      summary.totalDisposals++;
      summary.totalProceeds += disposal.proceeds;
      summary.totalCostBasis += disposal.costBasis;
      summary.totalRealizedPnL += disposal.realizedPnL;
      // Gains count only profitable disposals; losses are kept apart
      if (disposal.realizedPnL.isPositive()) {
        if (disposal.isLongTerm()) {
          summary.longTermGains += disposal.realizedPnL;
        } else {
          summary.shortTermGains += disposal.realizedPnL;
        }
      } else if (disposal.realizedPnL.isNegative()) {
        if (disposal.isLongTerm()) {
          summary.longTermLosses -= disposal.realizedPnL;
        } else {
          summary.shortTermLosses -= disposal.realizedPnL;
        }
      }
    }
  } catch (const std::overflow_error &e) {
    return Error(E_OVERFLOW, "Realized P&L overflow: " + std::string(e.what()));
  }
  return report;
}

std::vector<LotInventory::Disposal>
LotInventory::getDisposals(uint64_t lotId) const {
  std::vector<Disposal> result;
  std::lock_guard<std::mutex> lock(disposalsMutex_);
  for (const auto &disposal : disposals_) {
    if (disposal.lotId == lotId) {
      result.push_back(disposal);
    }
  }
  return result;
}

} // namespace cb
