#ifndef CB_LEDGER_ACCOUNT_DIRECTORY_HPP
#define CB_LEDGER_ACCOUNT_DIRECTORY_HPP

#include "../lib/ResultOrError.hpp"

#include <string>

namespace cb {

/**
 * Chart of accounts and analytical dimensions, owned outside the ledger.
 * Consumed by PostingValidator; implementations must be safe for
 * concurrent lookups.
 */
class AccountDirectory {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1;
  constexpr static int32_t E_UNAVAILABLE = 2;

  struct Account {
    std::string code;
    std::string name;
    std::string type; // asset, liability, equity, revenue, expense
  };

  struct DimensionValue {
    std::string dimension;
    std::string code;
  };

  virtual ~AccountDirectory() = default;

  virtual Roe<Account> resolveAccount(const std::string &code) const = 0;
  virtual Roe<DimensionValue>
  resolveDimensionValue(const std::string &dimension,
                        const std::string &valueCode) const = 0;
};

} // namespace cb

#endif // CB_LEDGER_ACCOUNT_DIRECTORY_HPP
