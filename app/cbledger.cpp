#include "../server/Books.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

using json = nlohmann::json;

namespace {

struct CommonOptions {
  std::string workDir{ "cb-books" };
  bool debug{ false };
};

void addCommonOptions(CLI::App *cmd, CommonOptions &opts) {
  cmd->add_option("-d,--work-dir", opts.workDir,
                  "Work directory holding config.json and data files")
      ->capture_default_str();
  cmd->add_flag("--debug", opts.debug, "Enable debug logging on stderr");
}

// Console output goes to stderr so stdout carries only JSON
void setupLogging(bool debug) {
  auto root = cb::logging::getRootLogger();
  root.clearHandlers();
  auto spConsole = std::make_shared<cb::logging::ConsoleHandler>(std::cerr);
  root.addHandler(spConsole);
  root.setLevel(debug ? cb::logging::Level::DEBUG
                      : cb::logging::Level::WARNING);
}

int fail(const std::string &message) {
  std::cerr << "Error: " << message << "\n";
  return 1;
}

// Books errors carry their type so callers can tell e.g. a short lot
// inventory from a malformed request
int fail(const cb::Books::Error &error) {
  std::cerr << "Error [" << cb::Books::errorName(error.code)
            << "]: " << error.message << "\n";
  return 1;
}

void printJson(const json &jd) { std::cout << jd.dump(2) << std::endl; }

bool parseDateOption(const std::string &value, int64_t &out) {
  return cb::utl::parseIsoDate(value, out);
}

cb::Roe<cb::Decimal> parseAmountOption(const std::string &name,
                                       const std::string &value) {
  auto amount = cb::Decimal::parse(value);
  if (!amount) {
    return cb::Error(1, name + ": " + amount.error().message);
  }
  return amount.value();
}

cb::Roe<json> readEntryJson(const std::string &path) {
  if (path != "-") {
    return cb::utl::loadJsonFile(path);
  }
  try {
    return json::parse(std::cin);
  } catch (const json::parse_error &e) {
    return cb::Error(3, "Failed to parse JSON from stdin: " +
                            std::string(e.what()));
  }
}

int runPost(cb::Books &books, const std::string &file) {
  auto jd = readEntryJson(file);
  if (!jd) {
    return fail(jd.error().message);
  }
  cb::EntryDraft draft;
  auto parsed = draft.fromJson(jd.value());
  if (!parsed) {
    return fail(parsed.error().message);
  }
  auto entry = books.postEntry(draft);
  if (!entry) {
    return fail(entry.error());
  }
  printJson(entry.value().toJson());
  return 0;
}

int runVerify(cb::Books &books) {
  auto result = books.verifyChain();
  if (!result) {
    return fail(result.error());
  }
  printJson(result.value().toJson());
  if (!result.value().isValid) {
    return fail("Chain integrity broken at entry " +
                std::to_string(result.value().brokenAtEntryId.value_or(0)));
  }
  return 0;
}

int runProof(cb::Books &books, uint64_t entryId, uint64_t window) {
  auto result = books.proof(entryId, window);
  if (!result) {
    return fail(result.error());
  }
  json jd = result.value().toJson();
  jd["linksVerified"] = cb::HashChainLedger::verifyProof(result.value());
  printJson(jd);
  return 0;
}

int runEntry(cb::Books &books, uint64_t entryId) {
  auto result = books.getEntry(entryId);
  if (!result) {
    return fail(result.error());
  }
  printJson(result.value().toJson());
  return 0;
}

int runBalance(cb::Books &books, const std::string &account,
               const std::string &asset, const std::string &asOf,
               bool allAssets) {
  int64_t asOfDate = cb::utl::getCurrentTime();
  if (!asOf.empty() && !parseDateOption(asOf, asOfDate)) {
    return fail("--as-of must be YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ");
  }

  json jd;
  jd["account"] = account;
  jd["asOf"] = cb::utl::formatIsoDate(asOfDate);
  if (allAssets) {
    auto balances = books.allAssetBalances(account, asOfDate);
    if (!balances) {
      return fail(balances.error());
    }
    jd["balances"] = json::object();
    for (const auto &[key, balance] : balances.value()) {
      jd["balances"][key.empty() ? "untagged" : key] = balance.toJson();
    }
  } else {
    auto balance = books.balanceAsOf(account, asset, asOfDate);
    if (!balance) {
      return fail(balance.error());
    }
    if (!asset.empty()) {
      jd["asset"] = cb::utl::toUpper(asset);
    }
    jd.update(balance.value().toJson());
  }
  printJson(jd);
  return 0;
}

struct LotCreateOptions {
  std::string asset;
  std::string quantity;
  std::string cost;
  std::string date;
  std::string source{ "purchase" };
  std::string txHash;
  uint64_t entryId{ 0 };
};

int runLotCreate(cb::Books &books, const LotCreateOptions &opts) {
  cb::LotInventory::CreateLotRequest req;
  req.asset = opts.asset;

  auto quantity = parseAmountOption("quantity", opts.quantity);
  if (!quantity) {
    return fail(quantity.error().message);
  }
  req.quantity = quantity.value();

  auto cost = parseAmountOption("cost", opts.cost);
  if (!cost) {
    return fail(cost.error().message);
  }
  req.costBasis = cost.value();

  if (!parseDateOption(opts.date, req.acquisitionDate)) {
    return fail("--date must be YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ");
  }
  if (!cb::LotInventory::parseSourceType(opts.source, req.sourceType)) {
    return fail("Unknown source type: " + opts.source);
  }
  if (!opts.txHash.empty()) {
    req.txHash = opts.txHash;
  }
  if (opts.entryId != 0) {
    req.journalEntryId = opts.entryId;
  }

  auto lot = books.createLot(req);
  if (!lot) {
    return fail(lot.error());
  }
  printJson(lot.value().toJson());
  return 0;
}

struct LotDisposeOptions {
  std::string asset;
  std::string quantity;
  std::string proceeds;
  std::string fee{ "0" };
  std::string date;
  std::string method;
  uint64_t lotId{ 0 };
  std::string txHash;
  bool noJournal{ false };
};

int runLotDispose(cb::Books &books, const LotDisposeOptions &opts) {
  cb::LotInventory::DisposeRequest req;
  req.asset = opts.asset;

  auto quantity = parseAmountOption("quantity", opts.quantity);
  if (!quantity) {
    return fail(quantity.error().message);
  }
  req.quantity = quantity.value();

  auto proceeds = parseAmountOption("proceeds", opts.proceeds);
  if (!proceeds) {
    return fail(proceeds.error().message);
  }
  req.proceeds = proceeds.value();

  auto fee = parseAmountOption("fee", opts.fee);
  if (!fee) {
    return fail(fee.error().message);
  }
  req.fee = fee.value();

  req.disposalDate = cb::utl::getCurrentTime();
  if (!opts.date.empty() && !parseDateOption(opts.date, req.disposalDate)) {
    return fail("--date must be YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ");
  }

  req.method = books.getConfig().defaultMethod;
  if (!opts.method.empty() &&
      !cb::LotInventory::parseMethod(opts.method, req.method)) {
    return fail("Unknown method: " + opts.method);
  }
  if (opts.lotId != 0) {
    req.lotId = opts.lotId;
  }
  if (!opts.txHash.empty()) {
    req.txHash = opts.txHash;
  }

  auto result = books.disposeLot(req, !opts.noJournal);
  if (!result) {
    return fail(result.error());
  }
  printJson(result.value().toJson());
  return 0;
}

int runPnl(cb::Books &books, const std::string &asset, const std::string &from,
           const std::string &to) {
  cb::LotInventory::PnLQuery query;
  if (!asset.empty()) {
    query.asset = asset;
  }
  int64_t date = 0;
  if (!from.empty()) {
    if (!parseDateOption(from, date)) {
      return fail("--from must be YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ");
    }
    query.fromDate = date;
  }
  if (!to.empty()) {
    if (!parseDateOption(to, date)) {
      return fail("--to must be YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ");
    }
    query.toDate = date;
  }

  auto report = books.realizedPnL(query);
  if (!report) {
    return fail(report.error());
  }
  printJson(report.value().toJson());
  return 0;
}

int runLotBalance(cb::Books &books) {
  auto balances = books.lotBalances();
  if (!balances) {
    return fail(balances.error());
  }
  json jd = json::object();
  for (const auto &[asset, balance] : balances.value()) {
    jd[asset] = balance.toJson();
  }
  printJson(jd);
  return 0;
}

int runReconcile(cb::Books &books, const std::string &walletId) {
  std::optional<std::string> target;
  if (!walletId.empty()) {
    target = walletId;
  }
  auto summary = books.reconcile(target);
  if (!summary) {
    return fail(summary.error());
  }
  printJson(summary.value().toJson());
  return 0;
}

int runUnreconciled(cb::Books &books, const std::string &minVariance) {
  auto min = parseAmountOption("min-variance", minVariance);
  if (!min) {
    return fail(min.error().message);
  }
  auto items = books.unreconciledItems(min.value());
  if (!items) {
    return fail(items.error());
  }
  json jd = json::array();
  for (const auto &record : items.value()) {
    jd.push_back(record.toJson());
  }
  printJson(jd);
  return 0;
}

int runResetAlert(cb::Books &books, const std::string &walletId,
                  const std::string &asset) {
  auto result = books.resetAlert(walletId, asset);
  if (!result) {
    return fail(result.error());
  }
  printJson({ { "walletId", walletId },
              { "asset", cb::utl::toUpper(asset) },
              { "alertSent", false } });
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "cb-ledger - hash-chained journal, cost-basis lots and "
                "wallet reconciliation" };
  app.require_subcommand(1);

  CommonOptions common;

  auto *post_cmd = app.add_subcommand("post", "Validate and append a journal entry");
  addCommonOptions(post_cmd, common);
  std::string post_file = "-";
  post_cmd->add_option("-f,--file", post_file, "Entry JSON file ('-' for stdin)")
      ->capture_default_str();

  auto *verify_cmd = app.add_subcommand("verify", "Verify the journal hash chain");
  addCommonOptions(verify_cmd, common);

  auto *proof_cmd = app.add_subcommand("proof", "Print the chain proof of an entry");
  addCommonOptions(proof_cmd, common);
  uint64_t proof_entryId = 0;
  uint64_t proof_window = 0;
  proof_cmd->add_option("entryId", proof_entryId, "Entry ID")->required();
  proof_cmd->add_option("-w,--window", proof_window,
                        "Number of links ending at the entry (0: from genesis)")
      ->default_val(0);

  auto *entry_cmd = app.add_subcommand("entry", "Print a journal entry");
  addCommonOptions(entry_cmd, common);
  uint64_t entry_id = 0;
  entry_cmd->add_option("entryId", entry_id, "Entry ID")->required();

  auto *balance_cmd = app.add_subcommand("balance", "Book balance of an account");
  addCommonOptions(balance_cmd, common);
  std::string balance_account;
  std::string balance_asset;
  std::string balance_asOf;
  bool balance_all = false;
  balance_cmd->add_option("account", balance_account, "Account code")->required();
  balance_cmd->add_option("-a,--asset", balance_asset, "Asset filter");
  balance_cmd->add_option("--as-of", balance_asOf, "Inclusive cut-off date (default: now)");
  balance_cmd->add_flag("--all-assets", balance_all, "Balance per asset tag");

  auto *lot_create_cmd = app.add_subcommand("lot-create", "Record an acquisition lot");
  addCommonOptions(lot_create_cmd, common);
  LotCreateOptions lc;
  lot_create_cmd->add_option("asset", lc.asset, "Asset symbol")->required();
  lot_create_cmd->add_option("quantity", lc.quantity, "Quantity acquired")->required();
  lot_create_cmd->add_option("cost", lc.cost, "Total cost basis")->required();
  lot_create_cmd->add_option("--date", lc.date, "Acquisition date")->required();
  lot_create_cmd->add_option("-s,--source", lc.source,
                             "purchase, mining, staking, airdrop or transfer_in")
      ->capture_default_str();
  lot_create_cmd->add_option("--tx-hash", lc.txHash, "Acquisition transaction hash");
  lot_create_cmd->add_option("--entry-id", lc.entryId, "Linked journal entry ID");

  auto *lot_dispose_cmd = app.add_subcommand("lot-dispose", "Dispose of lots and realize P&L");
  addCommonOptions(lot_dispose_cmd, common);
  LotDisposeOptions ld;
  lot_dispose_cmd->add_option("asset", ld.asset, "Asset symbol")->required();
  lot_dispose_cmd->add_option("quantity", ld.quantity, "Quantity disposed")->required();
  lot_dispose_cmd->add_option("proceeds", ld.proceeds, "Total proceeds")->required();
  lot_dispose_cmd->add_option("--fee", ld.fee, "Disposal fee")->capture_default_str();
  lot_dispose_cmd->add_option("--date", ld.date, "Disposal date (default: now)");
  lot_dispose_cmd->add_option("-m,--method", ld.method,
                              "fifo, lifo or specific (default from config)");
  lot_dispose_cmd->add_option("--lot-id", ld.lotId, "Lot for the specific method");
  lot_dispose_cmd->add_option("--tx-hash", ld.txHash, "Disposal transaction hash");
  lot_dispose_cmd->add_flag("--no-journal", ld.noJournal,
                            "Do not post the realized gain or loss");

  auto *pnl_cmd = app.add_subcommand("pnl", "Realized P&L report");
  addCommonOptions(pnl_cmd, common);
  std::string pnl_asset;
  std::string pnl_from;
  std::string pnl_to;
  pnl_cmd->add_option("-a,--asset", pnl_asset, "Asset filter");
  pnl_cmd->add_option("--from", pnl_from, "Inclusive start date");
  pnl_cmd->add_option("--to", pnl_to, "Inclusive end date");

  auto *lot_balance_cmd = app.add_subcommand("lot-balance", "Open lot totals per asset");
  addCommonOptions(lot_balance_cmd, common);

  auto *reconcile_cmd = app.add_subcommand("reconcile", "Reconcile configured wallets");
  addCommonOptions(reconcile_cmd, common);
  std::string reconcile_wallet;
  reconcile_cmd->add_option("-w,--wallet", reconcile_wallet,
                            "Wallet ID (default: every configured wallet)");

  auto *unreconciled_cmd =
      app.add_subcommand("unreconciled", "Out-of-threshold reconciliation items");
  addCommonOptions(unreconciled_cmd, common);
  std::string unreconciled_min = "0";
  unreconciled_cmd->add_option("--min-variance", unreconciled_min,
                               "Minimum absolute variance")
      ->capture_default_str();

  auto *reset_alert_cmd =
      app.add_subcommand("reset-alert", "Re-arm the alert of a wallet and asset");
  addCommonOptions(reset_alert_cmd, common);
  std::string reset_wallet;
  std::string reset_asset;
  reset_alert_cmd->add_option("walletId", reset_wallet, "Wallet ID")->required();
  reset_alert_cmd->add_option("asset", reset_asset, "Asset symbol")->required();

  CLI11_PARSE(app, argc, argv);

  setupLogging(common.debug);

  cb::Books books;
  cb::Books::InitConfig config;
  config.workDir = common.workDir;
  auto initialized = books.init(config);
  if (!initialized) {
    return fail(initialized.error());
  }

  if (post_cmd->parsed()) {
    return runPost(books, post_file);
  }
  if (verify_cmd->parsed()) {
    return runVerify(books);
  }
  if (proof_cmd->parsed()) {
    return runProof(books, proof_entryId, proof_window);
  }
  if (entry_cmd->parsed()) {
    return runEntry(books, entry_id);
  }
  if (balance_cmd->parsed()) {
    return runBalance(books, balance_account, balance_asset, balance_asOf,
                      balance_all);
  }
  if (lot_create_cmd->parsed()) {
    return runLotCreate(books, lc);
  }
  if (lot_dispose_cmd->parsed()) {
    return runLotDispose(books, ld);
  }
  if (pnl_cmd->parsed()) {
    return runPnl(books, pnl_asset, pnl_from, pnl_to);
  }
  if (lot_balance_cmd->parsed()) {
    return runLotBalance(books);
  }
  if (reconcile_cmd->parsed()) {
    return runReconcile(books, reconcile_wallet);
  }
  if (unreconciled_cmd->parsed()) {
    return runUnreconciled(books, unreconciled_min);
  }
  if (reset_alert_cmd->parsed()) {
    return runResetAlert(books, reset_wallet, reset_asset);
  }
  return fail("No command given");
}
