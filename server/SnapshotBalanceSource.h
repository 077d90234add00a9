#ifndef CB_LEDGER_SNAPSHOT_BALANCE_SOURCE_H
#define CB_LEDGER_SNAPSHOT_BALANCE_SOURCE_H

#include "../interface/BalanceSource.hpp"
#include "../lib/Module.h"

#include <nlohmann/json.hpp>

#include <string>

namespace cb {

/**
 * BalanceSource reading an indexer export. The file is re-read on every
 * query:
 *
 *   {
 *     "0xabc": {
 *       "blockNumber": 19000000,
 *       "timestamp": "2024-02-01T00:00:00Z",
 *       "balances": { "ETH": "105", "USDC": "2500.5" }
 *     }
 *   }
 */
class SnapshotBalanceSource : public BalanceSource, public Module {
public:
  explicit SnapshotBalanceSource(const std::string &filepath);
  ~SnapshotBalanceSource() override = default;

  Roe<std::vector<Balance>>
  getBalances(const std::string &address,
              const std::vector<std::string> &assets) override;

  const std::string &getFilePath() const { return filepath_; }

private:
  Roe<std::vector<Balance>> parseWallet(const std::string &address,
                                        const nlohmann::json &jd,
                                        const std::vector<std::string> &assets);

  std::string filepath_;
};

} // namespace cb

#endif // CB_LEDGER_SNAPSHOT_BALANCE_SOURCE_H
