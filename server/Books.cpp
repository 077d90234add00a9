#include "Books.h"
#include "LogAlertDispatcher.h"
#include "SnapshotBalanceSource.h"
#include "StaticDirectory.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <filesystem>
#include <set>

namespace cb {

namespace {

Books::Roe<Decimal> decimalField(const nlohmann::json &jd,
                                 const std::string &name) {
  auto amount = Decimal::fromJson(jd[name]);
  if (!amount) {
    return Books::Error(Books::E_CONFIG, "Field '" + name +
                                             "' must be a decimal amount: " +
                                             amount.error().message);
  }
  if (amount.value().isNegative()) {
    return Books::Error(Books::E_CONFIG,
                        "Field '" + name + "' must not be negative");
  }
  return amount.value();
}

Books::Roe<std::string> stringField(const nlohmann::json &jd,
                                    const std::string &name,
                                    const std::string &context) {
  if (!jd.contains(name) || !jd[name].is_string()) {
    return Books::Error(Books::E_CONFIG, "Field '" + name + "' in " + context +
                                             " must be a string");
  }
  std::string value = jd[name].get<std::string>();
  if (value.empty()) {
    return Books::Error(Books::E_CONFIG, "Field '" + name + "' in " + context +
                                             " cannot be empty");
  }
  return value;
}

} // namespace

// ============ RunFileConfig methods ============

Books::RunFileConfig::RunFileConfig() {
  accounts = {
    { "1000", "Cash", "asset" },
    { "1010", "Crypto Wallets", "asset" },
    { "1100", "Crypto Proceeds Clearing", "asset" },
    { "3000", "Owner Equity", "equity" },
    { "4100", "Realized Crypto Gains", "revenue" },
    { "6200", "Realized Crypto Losses", "expense" },
  };
}

nlohmann::json Books::RunFileConfig::ltsToJson() const {
  nlohmann::json j;
  j["accounts"] = nlohmann::json::array();
  for (const auto &account : accounts) {
    j["accounts"].push_back(
        { { "code", account.code }, { "name", account.name }, { "type", account.type } });
  }
  j["dimensions"] = nlohmann::json::object();
  for (const auto &[dimension, values] : dimensions) {
    j["dimensions"][dimension] = values;
  }
  j["pnlAccounts"] = { { "proceeds", pnlAccounts.proceeds },
                       { "gain", pnlAccounts.gain },
                       { "loss", pnlAccounts.loss } };
  j["reconciliation"] = {
    { "threshold", reconciliation.threshold.toString() },
    { "alertThreshold", reconciliation.alertThreshold.toString() },
    { "criticalPercent", reconciliation.criticalPercent.toString() },
    { "includeUntaggedPostings", reconciliation.includeUntaggedPostings },
    { "balanceSnapshot", reconciliation.balanceSnapshot }
  };
  j["lots"] = { { "defaultMethod", LotInventory::methodName(defaultMethod) } };
  j["wallets"] = nlohmann::json::array();
  for (const auto &wallet : wallets) {
    j["wallets"].push_back({ { "id", wallet.id },
                             { "address", wallet.address },
                             { "glAccount", wallet.glAccount },
                             { "assets", wallet.assets } });
  }
  return j;
}

Books::Roe<void> Books::RunFileConfig::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (jd.contains("accounts")) {
      if (!jd["accounts"].is_array()) {
        return Error(E_CONFIG, "Field 'accounts' must be an array");
      }
      accounts.clear();
      std::set<std::string> codes;
      for (const auto &item : jd["accounts"]) {
        if (!item.is_object()) {
          return Error(E_CONFIG, "Each account must be an object");
        }
        AccountDirectory::Account account;
        auto code = stringField(item, "code", "account");
        if (!code) {
          return code.error();
        }
        account.code = code.value();
        if (!codes.insert(account.code).second) {
          return Error(E_CONFIG, "Duplicate account code: " + account.code);
        }
        if (item.contains("name")) {
          if (!item["name"].is_string()) {
            return Error(E_CONFIG, "Field 'name' in account must be a string");
          }
          account.name = item["name"].get<std::string>();
        }
        if (item.contains("type")) {
          if (!item["type"].is_string()) {
            return Error(E_CONFIG, "Field 'type' in account must be a string");
          }
          account.type = item["type"].get<std::string>();
        }
        accounts.push_back(account);
      }
    }

    if (jd.contains("dimensions")) {
      if (!jd["dimensions"].is_object()) {
        return Error(E_CONFIG, "Field 'dimensions' must be an object");
      }
      dimensions.clear();
      for (auto it = jd["dimensions"].begin(); it != jd["dimensions"].end();
           ++it) {
        if (!it.value().is_array()) {
          return Error(E_CONFIG,
                       "Dimension '" + it.key() + "' must list value codes");
        }
        std::vector<std::string> values;
        for (const auto &value : it.value()) {
          if (!value.is_string()) {
            return Error(E_CONFIG, "Values of dimension '" + it.key() +
                                       "' must be strings");
          }
          values.push_back(value.get<std::string>());
        }
        dimensions[it.key()] = values;
      }
    }

    if (jd.contains("pnlAccounts")) {
      const auto &pnl = jd["pnlAccounts"];
      if (!pnl.is_object()) {
        return Error(E_CONFIG, "Field 'pnlAccounts' must be an object");
      }
      if (pnl.contains("proceeds")) {
        auto value = stringField(pnl, "proceeds", "pnlAccounts");
        if (!value) {
          return value.error();
        }
        pnlAccounts.proceeds = value.value();
      }
      if (pnl.contains("gain")) {
        auto value = stringField(pnl, "gain", "pnlAccounts");
        if (!value) {
          return value.error();
        }
        pnlAccounts.gain = value.value();
      }
      if (pnl.contains("loss")) {
        auto value = stringField(pnl, "loss", "pnlAccounts");
        if (!value) {
          return value.error();
        }
        pnlAccounts.loss = value.value();
      }
    }

    if (jd.contains("reconciliation")) {
      const auto &recon = jd["reconciliation"];
      if (!recon.is_object()) {
        return Error(E_CONFIG, "Field 'reconciliation' must be an object");
      }
      if (recon.contains("threshold")) {
        auto value = decimalField(recon, "threshold");
        if (!value) {
          return value.error();
        }
        reconciliation.threshold = value.value();
      }
      if (recon.contains("alertThreshold")) {
        auto value = decimalField(recon, "alertThreshold");
        if (!value) {
          return value.error();
        }
        reconciliation.alertThreshold = value.value();
      }
      if (recon.contains("criticalPercent")) {
        auto value = decimalField(recon, "criticalPercent");
        if (!value) {
          return value.error();
        }
        reconciliation.criticalPercent = value.value();
      }
      if (recon.contains("includeUntaggedPostings")) {
        if (!recon["includeUntaggedPostings"].is_boolean()) {
          return Error(E_CONFIG,
                       "Field 'includeUntaggedPostings' must be a boolean");
        }
        reconciliation.includeUntaggedPostings =
            recon["includeUntaggedPostings"].get<bool>();
      }
      if (recon.contains("balanceSnapshot")) {
        auto value = stringField(recon, "balanceSnapshot", "reconciliation");
        if (!value) {
          return value.error();
        }
        reconciliation.balanceSnapshot = value.value();
      }
    }

    if (jd.contains("lots")) {
      const auto &lots = jd["lots"];
      if (!lots.is_object()) {
        return Error(E_CONFIG, "Field 'lots' must be an object");
      }
      if (lots.contains("defaultMethod")) {
        if (!lots["defaultMethod"].is_string() ||
            !LotInventory::parseMethod(lots["defaultMethod"].get<std::string>(),
                                       defaultMethod)) {
          return Error(E_CONFIG,
                       "Field 'defaultMethod' must be fifo, lifo or specific");
        }
        if (defaultMethod == LotInventory::Method::SPECIFIC) {
          return Error(E_CONFIG,
                       "Field 'defaultMethod' cannot be specific");
        }
      }
    }

    if (jd.contains("wallets")) {
      if (!jd["wallets"].is_array()) {
        return Error(E_CONFIG, "Field 'wallets' must be an array");
      }
      wallets.clear();
      for (const auto &item : jd["wallets"]) {
        if (!item.is_object()) {
          return Error(E_CONFIG, "Each wallet must be an object");
        }
        ReconciliationEngine::Wallet wallet;
        auto id = stringField(item, "id", "wallet");
        if (!id) {
          return id.error();
        }
        wallet.id = id.value();
        auto address = stringField(item, "address", "wallet " + wallet.id);
        if (!address) {
          return address.error();
        }
        wallet.address = address.value();
        auto glAccount = stringField(item, "glAccount", "wallet " + wallet.id);
        if (!glAccount) {
          return glAccount.error();
        }
        wallet.glAccount = glAccount.value();
        if (item.contains("assets")) {
          if (!item["assets"].is_array()) {
            return Error(E_CONFIG, "Field 'assets' in wallet " + wallet.id +
                                       " must be an array");
          }
          for (const auto &asset : item["assets"]) {
            if (!asset.is_string()) {
              return Error(E_CONFIG, "Assets of wallet " + wallet.id +
                                         " must be strings");
            }
            wallet.assets.push_back(utl::toUpper(asset.get<std::string>()));
          }
        }
        wallets.push_back(wallet);
      }
    }

    // Cross references into the chart of accounts
    auto known = [this](const std::string &code) {
      return std::any_of(accounts.begin(), accounts.end(),
                         [&](const AccountDirectory::Account &account) {
                           return account.code == code;
                         });
    };
    for (const auto &code :
         { pnlAccounts.proceeds, pnlAccounts.gain, pnlAccounts.loss }) {
      if (!known(code)) {
        return Error(E_CONFIG, "P&L account " + code + " is not in 'accounts'");
      }
    }
    for (const auto &wallet : wallets) {
      if (!known(wallet.glAccount)) {
        return Error(E_CONFIG, "GL account " + wallet.glAccount +
                                   " of wallet " + wallet.id +
                                   " is not in 'accounts'");
      }
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG,
                 "Failed to parse configuration: " + std::string(e.what()));
  }
}

// ============ Books methods ============

Books::Books() {
  redirectLogger("Books");
  ledger_.redirectLogger(log().getFullName() + ".Ledger");
  lots_.redirectLogger(log().getFullName() + ".Lots");
}

Books::Roe<void> Books::loadConfig(const std::string &workDir) {
  std::filesystem::path configPath =
      std::filesystem::path(workDir) / FILE_CONFIG;
  std::string configPathStr = configPath.string();

  RunFileConfig runFileConfig;

  if (!std::filesystem::exists(configPath)) {
    log().info << "No " << FILE_CONFIG
               << " found, creating with default values";

    auto written = utl::writeToNewFile(
        configPathStr, runFileConfig.ltsToJson().dump(2) + "\n");
    if (!written) {
      return Error(E_CONFIG, "Failed to create " + std::string(FILE_CONFIG) +
                                 ": " + written.error().message);
    }

    log().info << "Created " << FILE_CONFIG << " at: " << configPathStr;
  } else {
    auto jsonResult = utl::loadJsonFile(configPathStr);
    if (!jsonResult) {
      return Error(E_CONFIG, "Failed to load config file: " +
                                 jsonResult.error().message);
    }

    auto parseResult = runFileConfig.ltsFromJson(jsonResult.value());
    if (!parseResult) {
      return Error(E_CONFIG, "Failed to parse config file: " +
                                 parseResult.error().message);
    }
  }

  config_ = runFileConfig;
  log().info << "Configuration loaded";
  log().info << "  Accounts: " << config_.accounts.size();
  log().info << "  Wallets: " << config_.wallets.size();
  log().info << "  Lot method: "
             << LotInventory::methodName(config_.defaultMethod);
  return {};
}

Books::Roe<void> Books::init(const InitConfig &config) {
  if (initialized_) {
    return Error(E_STATE, "Books are already initialized");
  }
  if (config.workDir.empty()) {
    return Error(E_CONFIG, "Work directory is required");
  }
  workDir_ = config.workDir;
  std::filesystem::path workDir(workDir_);

  std::error_code ec;
  std::filesystem::create_directories(workDir, ec);
  if (ec) {
    return Error(E_CONFIG,
                 "Failed to create work directory: " + ec.message());
  }

  if (config.logToFile) {
    try {
      log().addFileHandler((workDir / FILE_LOG).string(),
                           logging::Level::INFO);
    } catch (const std::exception &e) {
      return Error(E_CONFIG, std::string(e.what()));
    }
  }

  auto configLoaded = loadConfig(workDir_);
  if (!configLoaded) {
    return configLoaded.error();
  }

  spDirectory_ =
      std::make_shared<StaticDirectory>(config_.accounts, config_.dimensions);
  validator_ = std::make_unique<PostingValidator>(spDirectory_);
  validator_->redirectLogger(log().getFullName() + ".Validator");

  auto ledgerMounted = ledger_.mount((workDir / FILE_JOURNAL).string());
  if (!ledgerMounted) {
    return Error(E_LEDGER, "Failed to mount journal: " +
                               ledgerMounted.error().message);
  }
  if (ledger_.isHalted()) {
    log().critical << "Journal is halted: " << ledger_.getHaltReason();
  }

  auto lotsMounted = lots_.mount((workDir / FILE_LOTS).string());
  if (!lotsMounted) {
    return Error(E_LOTS,
                 "Failed to mount lots: " + lotsMounted.error().message);
  }

  calculator_ = std::make_unique<BookBalanceCalculator>(
      ledger_, config_.reconciliation.includeUntaggedPostings
                   ? BookBalanceCalculator::UntaggedPolicy::INCLUDE
                   : BookBalanceCalculator::UntaggedPolicy::EXCLUDE);
  calculator_->redirectLogger(log().getFullName() + ".Balances");

  std::shared_ptr<BalanceSource> spSource = config.spBalanceSource;
  if (!spSource) {
    auto spSnapshot = std::make_shared<SnapshotBalanceSource>(
        (workDir / config_.reconciliation.balanceSnapshot).string());
    spSnapshot->redirectLogger(log().getFullName() + ".BalanceSource");
    spSource = spSnapshot;
  }
  std::shared_ptr<AlertDispatcher> spDispatcher = config.spAlertDispatcher;
  if (!spDispatcher) {
    auto spLogDispatcher = std::make_shared<LogAlertDispatcher>();
    spLogDispatcher->redirectLogger(log().getFullName() + ".Alerts");
    spDispatcher = spLogDispatcher;
  }

  ReconciliationEngine::Config reconConfig;
  reconConfig.threshold = config_.reconciliation.threshold;
  reconConfig.alertThreshold = config_.reconciliation.alertThreshold;
  reconConfig.criticalPercent = config_.reconciliation.criticalPercent;
  recon_ = std::make_unique<ReconciliationEngine>(*calculator_, spSource,
                                                  spDispatcher, reconConfig);
  recon_->redirectLogger(log().getFullName() + ".Recon");

  auto reconMounted = recon_->mount((workDir / FILE_RECON).string());
  if (!reconMounted) {
    return Error(E_RECON, "Failed to mount reconciliation records: " +
                              reconMounted.error().message);
  }

  initialized_ = true;
  log().info << "Books initialized in " << workDir_ << " with "
             << ledger_.getEntryCount() << " journal entries";
  return {};
}

std::string Books::errorName(int32_t code) {
  static const std::map<int32_t, std::string> names = {
      { E_CONFIG, "CONFIG" },
      { E_STATE, "STATE" },
      { E_VALIDATION, "MALFORMED_POSTING" },
      { E_LEDGER, "LEDGER" },
      { E_INTEGRITY, "INTEGRITY" },
      { E_LOTS, "LOTS" },
      { E_RECON, "RECON" },
      { E_NOT_FOUND, "NOT_FOUND" },
      { E_EMPTY_ENTRY, "EMPTY_ENTRY" },
      { E_IMBALANCED, "IMBALANCED_ENTRY" },
      { E_UNKNOWN_ACCOUNT, "UNKNOWN_ACCOUNT" },
      { E_UNKNOWN_DIMENSION, "UNKNOWN_DIMENSION" },
      { E_DIRECTORY, "DIRECTORY_UNAVAILABLE" },
      { E_INVALID_QUANTITY, "INVALID_QUANTITY" },
      { E_INSUFFICIENT_LOTS, "INSUFFICIENT_LOTS" },
      { E_INVALID_AMOUNT, "INVALID_AMOUNT" },
      { E_LOT_NOT_FOUND, "LOT_NOT_FOUND" },
      { E_JOURNALIZE, "JOURNALIZE" },
      { E_OVERFLOW, "OVERFLOW" },
      { E_INVALID_ASSET, "INVALID_ASSET" },
  };
  auto it = names.find(code);
  return it == names.end() ? "UNKNOWN" : it->second;
}

Books::Error Books::fromValidator(const PostingValidator::Error &error) {
  int32_t code = E_VALIDATION;
  switch (error.code) {
  case PostingValidator::E_EMPTY_ENTRY:
    code = E_EMPTY_ENTRY;
    break;
  case PostingValidator::E_IMBALANCED:
    code = E_IMBALANCED;
    break;
  case PostingValidator::E_UNKNOWN_ACCOUNT:
    code = E_UNKNOWN_ACCOUNT;
    break;
  case PostingValidator::E_UNKNOWN_DIMENSION:
    code = E_UNKNOWN_DIMENSION;
    break;
  case PostingValidator::E_DIRECTORY:
    code = E_DIRECTORY;
    break;
  case PostingValidator::E_OVERFLOW:
    code = E_OVERFLOW;
    break;
  default:
    break;
  }
  std::string message = error.postingIndex >= 0
                            ? "Posting " + std::to_string(error.postingIndex) +
                                  ": " + error.message
                            : error.message;
  return Error(code, message, error.postingIndex);
}

Books::Error Books::fromLots(const LotInventory::Error &error) {
  int32_t code = E_LOTS;
  switch (error.code) {
  case LotInventory::E_INVALID_QUANTITY:
    code = E_INVALID_QUANTITY;
    break;
  case LotInventory::E_INSUFFICIENT_LOTS:
    code = E_INSUFFICIENT_LOTS;
    break;
  case LotInventory::E_INVALID_AMOUNT:
    code = E_INVALID_AMOUNT;
    break;
  case LotInventory::E_INVALID_ASSET:
    code = E_INVALID_ASSET;
    break;
  case LotInventory::E_LOT_NOT_FOUND:
    code = E_LOT_NOT_FOUND;
    break;
  case LotInventory::E_JOURNALIZE:
    code = E_JOURNALIZE;
    break;
  case LotInventory::E_OVERFLOW:
    code = E_OVERFLOW;
    break;
  default:
    break;
  }
  return Error(code, error.message);
}

Books::Roe<JournalEntry> Books::postEntry(const EntryDraft &draft) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }

  auto validated = validator_->validate(draft);
  if (!validated) {
    return fromValidator(validated.error());
  }

  auto appended = ledger_.append(validated.value());
  if (!appended) {
    int32_t code = appended.error().code == HashChainLedger::E_CHAIN_HALTED
                       ? E_INTEGRITY
                       : E_LEDGER;
    return Error(code, appended.error().message);
  }
  return appended.value();
}

Books::Roe<HashChainLedger::VerifyResult> Books::verifyChain() {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto result = ledger_.verifyChain();
  if (!result.isValid && !ledger_.isHalted()) {
    ledger_.halt("Chain broken at entry " +
                 std::to_string(result.brokenAtEntryId.value_or(0)));
  }
  return result;
}

Books::Roe<HashChainLedger::Proof> Books::proof(uint64_t entryId,
                                                uint64_t window) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto result = ledger_.proof(entryId, window);
  if (!result) {
    int32_t code = result.error().code == HashChainLedger::E_NOT_FOUND
                       ? E_NOT_FOUND
                       : E_LEDGER;
    return Error(code, result.error().message);
  }
  return result.value();
}

Books::Roe<JournalEntry> Books::getEntry(uint64_t entryId) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto result = ledger_.getEntry(entryId);
  if (!result) {
    return Error(E_NOT_FOUND, result.error().message);
  }
  return result.value();
}

Books::Roe<BookBalanceCalculator::Balance>
Books::balanceAsOf(const std::string &account, const std::string &asset,
                   int64_t asOfDate) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto balance = calculator_->balanceAsOf(account, asset, asOfDate);
  if (!balance) {
    return Error(E_LEDGER, balance.error().message);
  }
  return balance.value();
}

Books::Roe<std::map<std::string, BookBalanceCalculator::Balance>>
Books::allAssetBalances(const std::string &account, int64_t asOfDate) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto balances = calculator_->calculateAllAssetBalances(account, asOfDate);
  if (!balances) {
    return Error(E_LEDGER, balances.error().message);
  }
  return balances.value();
}

Books::Roe<LotInventory::Lot>
Books::createLot(const LotInventory::CreateLotRequest &req) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto lot = lots_.createLot(req);
  if (!lot) {
    return fromLots(lot.error());
  }
  return lot.value();
}

Books::Roe<std::optional<uint64_t>>
Books::journalizePnL(const LotInventory::DisposeResult &result,
                     const std::optional<std::string> &txHash) {
  if (result.totalRealizedPnL.isZero()) {
    return std::optional<uint64_t>();
  }

  bool gain = result.totalRealizedPnL.isPositive();
  Decimal amount = result.totalRealizedPnL.abs();

  EntryDraft draft;
  draft.date = result.disposals.empty() ? utl::getCurrentTime()
                                        : result.disposals.front().disposalDate;
  draft.description = std::string("Realized ") + (gain ? "gain" : "loss") +
                      " on disposal of " + result.totalQuantity.toString() +
                      " " + result.asset;
  draft.reference = txHash;
  draft.metadata = { { "type", "crypto_pnl" },
                     { "asset", result.asset },
                     { "realizedPnL", result.totalRealizedPnL.toString() } };

  Posting debit;
  debit.accountCode = gain ? config_.pnlAccounts.proceeds : config_.pnlAccounts.loss;
  debit.debit = amount;
  debit.assetTag = result.asset;

  Posting credit;
  credit.accountCode = gain ? config_.pnlAccounts.gain : config_.pnlAccounts.proceeds;
  credit.credit = amount;
  credit.assetTag = result.asset;

  draft.postings = { debit, credit };

  auto entry = postEntry(draft);
  if (!entry) {
    return entry.error();
  }
  log().info << "Journalized realized " << (gain ? "gain" : "loss") << " of "
             << amount << " " << result.asset << " as entry "
             << entry.value().id;
  return std::optional<uint64_t>(entry.value().id);
}

Books::Roe<LotInventory::DisposeResult>
Books::disposeLot(const LotInventory::DisposeRequest &request,
                  bool journalize) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }

  LotInventory::Journalizer journalizer;
  if (journalize) {
    std::optional<std::string> txHash = request.txHash;
    journalizer = [this, txHash](const LotInventory::DisposeResult &result)
        -> LotInventory::Roe<std::optional<uint64_t>> {
      auto journaled = journalizePnL(result, txHash);
      if (!journaled) {
        return LotInventory::Error(LotInventory::E_JOURNALIZE,
                                   journaled.error().message);
      }
      return journaled.value();
    };
  }

  auto result = lots_.disposeLot(request, journalizer);
  if (!result) {
    return fromLots(result.error());
  }
  return result.value();
}

Books::Roe<LotInventory::PnLReport>
Books::realizedPnL(const LotInventory::PnLQuery &query) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto report = lots_.getRealizedPnL(query);
  if (!report) {
    return fromLots(report.error());
  }
  return report.value();
}

Books::Roe<std::map<std::string, LotInventory::LotBalance>>
Books::lotBalances() {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto balances = lots_.getAllBalances();
  if (!balances) {
    return fromLots(balances.error());
  }
  return balances.value();
}

Books::Roe<ReconciliationEngine::RunSummary>
Books::reconcile(const std::optional<std::string> &walletId) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  if (!walletId) {
    return recon_->reconcileAll(config_.wallets);
  }
  for (const auto &wallet : config_.wallets) {
    if (wallet.id == *walletId) {
      return recon_->reconcileAll({ wallet });
    }
  }
  return Error(E_NOT_FOUND, "Wallet not configured: " + *walletId);
}

Books::Roe<std::vector<ReconciliationEngine::Record>>
Books::unreconciledItems(const Decimal &minVariance) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  return recon_->getUnreconciledItems(minVariance);
}

Books::Roe<void> Books::resetAlert(const std::string &walletId,
                                   const std::string &asset) {
  if (!initialized_) {
    return Error(E_STATE, "Books are not initialized");
  }
  auto reset = recon_->resetAlert(walletId, asset);
  if (!reset) {
    int32_t code = reset.error().code == ReconciliationEngine::E_NOT_FOUND
                       ? E_NOT_FOUND
                       : E_RECON;
    return Error(code, reset.error().message);
  }
  return {};
}

} // namespace cb
