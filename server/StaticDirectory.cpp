#include "StaticDirectory.h"

namespace cb {

StaticDirectory::StaticDirectory(
    const std::vector<Account> &accounts,
    const std::map<std::string, std::vector<std::string>> &dimensions) {
  for (const auto &account : accounts) {
    mAccounts_[account.code] = account;
  }
  for (const auto &[dimension, values] : dimensions) {
    mDimensions_[dimension].insert(values.begin(), values.end());
  }
}

StaticDirectory::Roe<StaticDirectory::Account>
StaticDirectory::resolveAccount(const std::string &code) const {
  auto it = mAccounts_.find(code);
  if (it == mAccounts_.end()) {
    return Error(E_NOT_FOUND, "Unknown account: " + code);
  }
  return it->second;
}

StaticDirectory::Roe<StaticDirectory::DimensionValue>
StaticDirectory::resolveDimensionValue(const std::string &dimension,
                                       const std::string &valueCode) const {
  auto it = mDimensions_.find(dimension);
  if (it == mDimensions_.end()) {
    return Error(E_NOT_FOUND, "Unknown dimension: " + dimension);
  }
  if (it->second.count(valueCode) == 0) {
    return Error(E_NOT_FOUND,
                 "Unknown value '" + valueCode + "' for dimension " + dimension);
  }
  return DimensionValue{ dimension, valueCode };
}

} // namespace cb
