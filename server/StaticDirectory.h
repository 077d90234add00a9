#ifndef CB_LEDGER_STATIC_DIRECTORY_H
#define CB_LEDGER_STATIC_DIRECTORY_H

#include "../interface/AccountDirectory.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace cb {

/**
 * AccountDirectory over a chart of accounts loaded from config.json.
 * Immutable after construction, so lookups need no locking.
 */
class StaticDirectory : public AccountDirectory {
public:
  StaticDirectory(const std::vector<Account> &accounts,
                  const std::map<std::string, std::vector<std::string>>
                      &dimensions);
  ~StaticDirectory() override = default;

  Roe<Account> resolveAccount(const std::string &code) const override;
  Roe<DimensionValue>
  resolveDimensionValue(const std::string &dimension,
                        const std::string &valueCode) const override;

  size_t getAccountCount() const { return mAccounts_.size(); }

private:
  std::map<std::string, Account> mAccounts_;
  std::map<std::string, std::set<std::string>> mDimensions_;
};

} // namespace cb

#endif // CB_LEDGER_STATIC_DIRECTORY_H
