#include "SnapshotBalanceSource.h"
#include "../lib/Utilities.h"

#include <algorithm>

namespace cb {

SnapshotBalanceSource::SnapshotBalanceSource(const std::string &filepath)
    : Module("BalanceSource"), filepath_(filepath) {}

SnapshotBalanceSource::Roe<std::vector<SnapshotBalanceSource::Balance>>
SnapshotBalanceSource::getBalances(const std::string &address,
                                   const std::vector<std::string> &assets) {
  auto loaded = utl::loadJsonFile(filepath_);
  if (!loaded) {
    log().error << "Balance snapshot unavailable: " << loaded.error().message;
    return Error(E_UNAVAILABLE,
                 "Balance snapshot unavailable: " + loaded.error().message);
  }

  const nlohmann::json &snapshot = loaded.value();
  if (!snapshot.is_object()) {
    return Error(E_UNAVAILABLE, "Balance snapshot must be a JSON object");
  }
  auto it = snapshot.find(address);
  if (it == snapshot.end()) {
    return Error(E_UNKNOWN_ADDRESS, "No balances for address " + address);
  }
  return parseWallet(address, *it, assets);
}

SnapshotBalanceSource::Roe<std::vector<SnapshotBalanceSource::Balance>>
SnapshotBalanceSource::parseWallet(const std::string &address,
                                   const nlohmann::json &jd,
                                   const std::vector<std::string> &assets) {
  if (!jd.is_object() || !jd.contains("balances") ||
      !jd["balances"].is_object()) {
    return Error(E_UNAVAILABLE,
                 "Snapshot entry for " + address + " needs a balances object");
  }

  uint64_t blockNumber = 0;
  if (jd.contains("blockNumber")) {
    if (!jd["blockNumber"].is_number_unsigned()) {
      return Error(E_UNAVAILABLE, "Field 'blockNumber' must be a positive number");
    }
    blockNumber = jd["blockNumber"].get<uint64_t>();
  }

  int64_t timestamp = 0;
  if (jd.contains("timestamp") && !utl::parseJsonDate(jd["timestamp"], timestamp)) {
    return Error(E_UNAVAILABLE, "Field 'timestamp' must be a date");
  }

  std::vector<Balance> balances;
  for (auto item = jd["balances"].begin(); item != jd["balances"].end();
       ++item) {
    std::string asset = utl::toUpper(item.key());
    if (!assets.empty() &&
        std::find(assets.begin(), assets.end(), asset) == assets.end()) {
      continue;
    }
    auto amount = Decimal::fromJson(item.value());
    if (!amount) {
      return Error(E_UNAVAILABLE, "Balance of " + asset + " for " + address +
                                      ": " + amount.error().message);
    }
    balances.push_back(Balance{ asset, amount.value(), blockNumber, timestamp });
  }

  // A requested asset the wallet does not hold reads as zero
  for (const auto &asset : assets) {
    bool found = std::any_of(balances.begin(), balances.end(),
                             [&](const Balance &b) { return b.asset == asset; });
    if (!found) {
      balances.push_back(Balance{ asset, Decimal(), blockNumber, timestamp });
    }
  }
  return balances;
}

} // namespace cb
