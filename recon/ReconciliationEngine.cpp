#include "ReconciliationEngine.h"
#include "../lib/Serialize.hpp"
#include "../lib/Utilities.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace cb {

std::string ReconciliationEngine::statusName(Status status) {
  switch (status) {
  case Status::PENDING:
    return "pending";
  case Status::RECONCILED:
    return "reconciled";
  case Status::FLAGGED:
    return "flagged";
  case Status::ALERTED:
    return "alerted";
  default:
    return "unknown";
  }
}

std::string ReconciliationEngine::Record::ltsToString() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar &VERSION &*this;
  return oss.str();
}

bool ReconciliationEngine::Record::ltsFromString(const std::string &str) {
  std::istringstream iss(str, std::ios::binary);
  InputArchive ar(iss);
  uint32_t version = 0;
  ar &version;
  if (version != VERSION) {
    return false;
  }
  ar &*this;
  return !ar.failed();
}

nlohmann::json ReconciliationEngine::Record::toJson() const {
  nlohmann::json jd;
  jd["walletId"] = walletId;
  jd["address"] = address;
  jd["asset"] = asset;
  jd["onChainBalance"] = onChainBalance.toString();
  jd["bookBalance"] = bookBalance.toString();
  jd["variance"] = variance.toString();
  jd["variancePercent"] = variancePercent.toString();
  jd["threshold"] = threshold.toString();
  jd["isWithinThreshold"] = isWithinThreshold;
  jd["alertSent"] = alertSent;
  jd["alertSentAt"] = alertSentAt ? nlohmann::json(utl::formatIsoDate(*alertSentAt))
                                  : nlohmann::json(nullptr);
  jd["onChainBlockNumber"] = onChainBlockNumber;
  jd["status"] = statusName(status);
  jd["asOf"] = utl::formatIsoDate(asOf);
  jd["createdAt"] = utl::formatIsoDate(createdAt);
  jd["updatedAt"] = utl::formatIsoDate(updatedAt);
  return jd;
}

nlohmann::json ReconciliationEngine::RunSummary::toJson() const {
  return { { "totalReconciled", totalReconciled },
           { "withinThreshold", withinThreshold },
           { "outOfThreshold", outOfThreshold },
           { "alertsGenerated", alertsGenerated },
           { "failedWallets", failedWallets } };
}

ReconciliationEngine::ReconciliationEngine(
    const BookBalanceCalculator &calculator,
    std::shared_ptr<BalanceSource> spSource,
    std::shared_ptr<AlertDispatcher> spDispatcher, const Config &config)
    : calculator_(calculator), spSource_(spSource),
      spDispatcher_(spDispatcher), config_(config) {
  if (!spSource_ || !spDispatcher_) {
    throw std::invalid_argument(
        "ReconciliationEngine requires a balance source and a dispatcher");
  }
  store_.redirectLogger(log().getFullName() + ".Store");
}

void ReconciliationEngine::setConfig(const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
}

ReconciliationEngine::Config ReconciliationEngine::getConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

ReconciliationEngine::Roe<void>
ReconciliationEngine::mount(const std::string &filepath) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (persistent_) {
    return Error(E_STATE, "Reconciliation store is already mounted");
  }
  store_.redirectLogger(log().getFullName() + ".Store");

  auto opened = store_.open(filepath);
  if (!opened) {
    return Error(E_STORAGE, "Failed to open reconciliation file: " +
                                opened.error().message);
  }
  auto records = store_.readAll();
  if (!records) {
    return Error(E_STORAGE, "Failed to read reconciliation file: " +
                                records.error().message);
  }

  // Later records supersede earlier ones for the same pair
  for (size_t i = 0; i < records.value().size(); ++i) {
    Record record;
    if (!record.ltsFromString(records.value()[i])) {
      return Error(E_STORAGE, "Reconciliation record " + std::to_string(i) +
                                  " is corrupt");
    }
    mRecords_[PairKey(record.walletId, record.asset)] = record;
  }
  persistent_ = true;

  log().info << "Mounted reconciliation file " << filepath << " with "
             << mRecords_.size() << " wallet-asset pairs";
  return {};
}

ReconciliationEngine::Roe<void>
ReconciliationEngine::persistLocked(const Record &record) {
  if (!persistent_) {
    return {};
  }
  auto written = store_.append(record.ltsToString());
  if (!written) {
    log().error << "Failed to persist reconciliation record: "
                << written.error().message;
    return Error(E_STORAGE, "Failed to persist: " + written.error().message);
  }
  return {};
}

Decimal ReconciliationEngine::variancePercentOf(const Decimal &onChain,
                                                const Decimal &book) {
  if (book.isZero()) {
    return onChain.isZero() ? Decimal() : Decimal::fromInt(100);
  }
  return Decimal::mulDiv(onChain - book, Decimal::fromInt(100), book);
}

ReconciliationEngine::Roe<ReconciliationEngine::Record>
ReconciliationEngine::measure(const Wallet &wallet,
                              const BalanceSource::Balance &observed,
                              const Config &config, int64_t now) const {
  Record record;
  record.walletId = wallet.id;
  record.address = wallet.address;
  record.asset = utl::toUpper(utl::trim(observed.asset));
  record.onChainBalance = observed.balance;
  record.onChainBlockNumber = observed.blockNumber;
  record.threshold = config.threshold;
  record.asOf = observed.timestamp > 0 ? observed.timestamp : now;
  record.createdAt = now;
  record.updatedAt = now;

  auto book = calculator_.balanceAsOf(wallet.glAccount, record.asset,
                                      record.asOf);
  if (!book) {
    return Error(E_BOOK_BALANCE, "Book balance for " + wallet.glAccount +
                                     " " + record.asset + ": " +
                                     book.error().message);
  }
  record.bookBalance = book.value().balance;

  try {
    record.variance = record.onChainBalance - record.bookBalance;
    record.variancePercent =
        variancePercentOf(record.onChainBalance, record.bookBalance);
  } catch (const std::overflow_error &e) {
    return Error(E_OVERFLOW, "Variance overflow for " + record.asset + ": " +
                                 std::string(e.what()));
  }
  record.isWithinThreshold = record.variance.abs() <= config.threshold;
  return record;
}

ReconciliationEngine::Roe<ReconciliationEngine::WalletResult>
ReconciliationEngine::reconcileWallet(const Wallet &wallet) {
  if (wallet.id.empty() || wallet.address.empty() || wallet.glAccount.empty()) {
    return Error(E_INVALID_WALLET,
                 "Wallet needs an id, an address and a GL account");
  }

  std::vector<std::string> assets;
  for (const auto &asset : wallet.assets) {
    assets.push_back(utl::toUpper(utl::trim(asset)));
  }

  auto observed = spSource_->getBalances(wallet.address, assets);
  if (!observed) {
    log().error << "Balance source failed for wallet " << wallet.id << ": "
                << observed.error().message;
    return Error(E_BALANCE_SOURCE, "Balance source failed for wallet " +
                                       wallet.id + ": " +
                                       observed.error().message);
  }

  Config config = getConfig();
  int64_t now = utl::getCurrentTime();

  std::vector<Record> measured;
  for (const auto &balance : observed.value()) {
    if (!assets.empty() &&
        std::find(assets.begin(), assets.end(),
                  utl::toUpper(utl::trim(balance.asset))) == assets.end()) {
      log().debug << "Skipping unrequested " << balance.asset
                  << " balance of wallet " << wallet.id;
      continue;
    }
    auto record = measure(wallet, balance, config, now);
    if (!record) {
      log().error << "Reconciliation of wallet " << wallet.id
                  << " aborted: " << record.error().message;
      return record.error();
    }
    measured.push_back(record.value());
  }

  // Latch decision, dispatch and commit run as one step per wallet, so a
  // concurrent run of the same wallet sees only delivered alerts
  auto spWalletMutex = getWalletMutex(wallet.id);
  std::lock_guard<std::mutex> walletLock(*spWalletMutex);

  std::vector<AlertDispatcher::Alert> alerts;
  std::vector<size_t> claimed; // indexes into measured
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < measured.size(); ++i) {
      Record &record = measured[i];
      auto it = mRecords_.find(PairKey(record.walletId, record.asset));
      if (it != mRecords_.end()) {
        record.createdAt = it->second.createdAt;
      }

      if (record.isWithinThreshold) {
        record.status = Status::RECONCILED;
        record.alertSent = false;
        record.alertSentAt.reset();
        continue;
      }

      log().warning << "Wallet " << record.walletId << " " << record.asset
                    << " out of threshold: book " << record.bookBalance
                    << ", on-chain " << record.onChainBalance
                    << ", variance " << record.variance;
      if (it != mRecords_.end() && it->second.alertSent) {
        record.alertSent = true;
        record.alertSentAt = it->second.alertSentAt;
        record.status = Status::ALERTED;
      } else if (record.variance.abs() >= config.alertThreshold) {
        claimed.push_back(i);

        AlertDispatcher::Alert alert;
        alert.walletAddress = record.address;
        alert.asset = record.asset;
        alert.variance = record.variance;
        alert.variancePercent = record.variancePercent;
        alert.message = "Wallet " + record.address + " has a " +
                        record.variancePercent.toString() +
                        "% variance for " + record.asset;
        alert.severity = record.variancePercent.abs() > config.criticalPercent
                             ? AlertDispatcher::Severity::CRITICAL
                             : AlertDispatcher::Severity::WARNING;
        alerts.push_back(alert);
      } else {
        record.status = Status::FLAGGED;
      }
    }
  }

  uint64_t alertsSent = 0;
  if (!alerts.empty()) {
    auto sent = spDispatcher_->sendBatchAlert(alerts);
    if (sent) {
      alertsSent = alerts.size();
    } else {
      // Left unlatched so the next run retries
      log().error << "Alert dispatch failed for wallet " << wallet.id << ": "
                  << sent.error().message;
    }
  }
  for (size_t index : claimed) {
    Record &record = measured[index];
    if (alertsSent > 0) {
      record.alertSent = true;
      record.alertSentAt = now;
      record.status = Status::ALERTED;
    } else {
      record.status = Status::FLAGGED;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  WalletResult result;
  result.alertsSent = alertsSent;
  for (const auto &record : measured) {
    auto persisted = persistLocked(record);
    if (!persisted) {
      return persisted.error();
    }
    mRecords_[PairKey(record.walletId, record.asset)] = record;
    result.records.push_back(record);
  }

  log().info << "Reconciled wallet " << wallet.id << ": "
             << result.records.size() << " assets, " << alertsSent
             << " alerts";
  return result;
}

ReconciliationEngine::RunSummary
ReconciliationEngine::reconcileAll(const std::vector<Wallet> &wallets) {
  RunSummary summary;
  for (const auto &wallet : wallets) {
    auto result = reconcileWallet(wallet);
    if (!result) {
      summary.failedWallets.push_back(wallet.id);
      continue;
    }
    for (const auto &record : result.value().records) {
      summary.totalReconciled++;
      if (record.isWithinThreshold) {
        summary.withinThreshold++;
      } else {
        summary.outOfThreshold++;
      }
    }
    summary.alertsGenerated += result.value().alertsSent;
  }

  log().info << "Reconciliation run: " << summary.totalReconciled
             << " pairs, " << summary.outOfThreshold << " out of threshold, "
             << summary.failedWallets.size() << " failed wallets";
  return summary;
}

std::vector<ReconciliationEngine::Record>
ReconciliationEngine::getUnreconciledItems(const Decimal &minVariance) const {
  std::vector<Record> items;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : mRecords_) {
      const Record &record = entry.second;
      if (!record.isWithinThreshold && record.variance.abs() >= minVariance) {
        items.push_back(record);
      }
    }
  }
  std::stable_sort(items.begin(), items.end(),
                   [](const Record &a, const Record &b) {
                     return a.variancePercent.abs() > b.variancePercent.abs();
                   });
  return items;
}

ReconciliationEngine::Roe<ReconciliationEngine::Record>
ReconciliationEngine::getRecord(const std::string &walletId,
                                const std::string &asset) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mRecords_.find(PairKey(walletId, utl::toUpper(utl::trim(asset))));
  if (it == mRecords_.end()) {
    return Error(E_NOT_FOUND,
                 "No reconciliation record for " + walletId + " " + asset);
  }
  return it->second;
}

std::shared_ptr<std::mutex>
ReconciliationEngine::getWalletMutex(const std::string &walletId) {
  std::lock_guard<std::mutex> lock(walletsMutex_);
  auto &spMutex = mWalletMutexes_[walletId];
  if (!spMutex) {
    spMutex = std::make_shared<std::mutex>();
  }
  return spMutex;
}

ReconciliationEngine::Roe<void>
ReconciliationEngine::resetAlert(const std::string &walletId,
                                 const std::string &asset) {
  auto spWalletMutex = getWalletMutex(walletId);
  std::lock_guard<std::mutex> walletLock(*spWalletMutex);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mRecords_.find(PairKey(walletId, utl::toUpper(utl::trim(asset))));
  if (it == mRecords_.end()) {
    return Error(E_NOT_FOUND,
                 "No reconciliation record for " + walletId + " " + asset);
  }

  Record record = it->second;
  record.alertSent = false;
  record.alertSentAt.reset();
  if (record.status == Status::ALERTED) {
    record.status = Status::FLAGGED;
  }
  record.updatedAt = utl::getCurrentTime();

  auto persisted = persistLocked(record);
  if (!persisted) {
    return persisted.error();
  }
  it->second = record;
  log().info << "Alert latch reset for " << walletId << " " << record.asset;
  return {};
}

} // namespace cb
