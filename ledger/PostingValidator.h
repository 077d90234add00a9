#ifndef CB_LEDGER_POSTING_VALIDATOR_H
#define CB_LEDGER_POSTING_VALIDATOR_H

#include "../interface/AccountDirectory.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "JournalEntry.h"

#include <memory>

namespace cb {

/**
 * PostingValidator - admission checks for entry drafts.
 *
 * Checks, in order: at least one posting; every posting names a known
 * account and known dimension values; debit and credit are nonnegative with
 * at most one side nonzero; total debit equals total credit exactly.
 */
class PostingValidator : public Module {
public:
  struct Error : RoeErrorBase {
    int32_t postingIndex{ -1 }; // -1 when the error concerns the whole entry

    Error() = default;
    Error(int32_t c, const std::string &msg, int32_t index = -1)
        : RoeErrorBase(c, msg), postingIndex(index) {}
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_EMPTY_ENTRY = 1;
  constexpr static int32_t E_IMBALANCED = 2;
  constexpr static int32_t E_UNKNOWN_ACCOUNT = 3;
  constexpr static int32_t E_UNKNOWN_DIMENSION = 4;
  constexpr static int32_t E_MALFORMED_POSTING = 5;
  constexpr static int32_t E_OVERFLOW = 6;
  constexpr static int32_t E_DIRECTORY = 7; // directory lookup failed

  explicit PostingValidator(std::shared_ptr<AccountDirectory> spDirectory);
  ~PostingValidator() override = default;

  /**
   * Validate a draft against the directory
   * @return The admitted draft (asset tags upper-cased) or the first error
   */
  Roe<EntryDraft> validate(const EntryDraft &draft) const;

  /**
   * Structural and balance checks that need no directory.
   * The ledger repeats this on every append.
   */
  static Roe<void> checkBalance(const EntryDraft &draft);

private:
  static Roe<void> checkAmounts(const Posting &posting, int32_t index);

  std::shared_ptr<AccountDirectory> spDirectory_;
};

} // namespace cb

#endif // CB_LEDGER_POSTING_VALIDATOR_H
