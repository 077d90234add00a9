#ifndef CB_LEDGER_BALANCE_SOURCE_HPP
#define CB_LEDGER_BALANCE_SOURCE_HPP

#include "../lib/Decimal.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cb {

/**
 * Externally observed wallet balances (chain indexer, balance checker).
 */
class BalanceSource {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_UNAVAILABLE = 1;
  constexpr static int32_t E_UNKNOWN_ADDRESS = 2;

  struct Balance {
    std::string asset;
    Decimal balance;
    uint64_t blockNumber{ 0 };
    int64_t timestamp{ 0 }; // unix seconds the balance was observed at
  };

  virtual ~BalanceSource() = default;

  /**
   * Balances held by an address
   * @param address Wallet address
   * @param assets Asset symbols to report; empty means every asset held
   */
  virtual Roe<std::vector<Balance>>
  getBalances(const std::string &address,
              const std::vector<std::string> &assets) = 0;
};

} // namespace cb

#endif // CB_LEDGER_BALANCE_SOURCE_HPP
