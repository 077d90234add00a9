#include "PostingValidator.h"
#include "../lib/Utilities.h"

#include <stdexcept>

namespace cb {

PostingValidator::PostingValidator(
    std::shared_ptr<AccountDirectory> spDirectory)
    : spDirectory_(spDirectory) {}

PostingValidator::Roe<void>
PostingValidator::checkAmounts(const Posting &posting, int32_t index) {
  if (posting.accountCode.empty()) {
    return Error(E_MALFORMED_POSTING, "Posting has no account code", index);
  }
  if (posting.debit.isNegative() || posting.credit.isNegative()) {
    return Error(E_MALFORMED_POSTING,
                 "Debit and credit must be nonnegative on account " +
                     posting.accountCode,
                 index);
  }
  if (!posting.debit.isZero() && !posting.credit.isZero()) {
    return Error(E_MALFORMED_POSTING,
                 "Posting on account " + posting.accountCode +
                     " has both a debit and a credit",
                 index);
  }
  if (posting.assetTag && posting.assetTag->empty()) {
    return Error(E_MALFORMED_POSTING, "Asset tag must not be empty", index);
  }
  return {};
}

PostingValidator::Roe<void>
PostingValidator::checkBalance(const EntryDraft &draft) {
  if (draft.postings.empty()) {
    return Error(E_EMPTY_ENTRY, "Entry must have at least one posting");
  }

  try {
    Decimal totalDebit;
    Decimal totalCredit;
    for (size_t i = 0; i < draft.postings.size(); ++i) {
      const auto &posting = draft.postings[i];
      auto amounts = checkAmounts(posting, static_cast<int32_t>(i));
      if (!amounts) {
        return amounts.error();
      }
      totalDebit += posting.debit;
      totalCredit += posting.credit;
    }

    if (totalDebit != totalCredit) {
      return Error(E_IMBALANCED, "Entry is not balanced: debits " +
                                     totalDebit.toString() + " != credits " +
                                     totalCredit.toString());
    }
  } catch (const std::overflow_error &e) {
    return Error(E_OVERFLOW, "Entry totals overflow: " + std::string(e.what()));
  }
  return {};
}

PostingValidator::Roe<EntryDraft>
PostingValidator::validate(const EntryDraft &draft) const {
  if (draft.postings.empty()) {
    return Error(E_EMPTY_ENTRY, "Entry must have at least one posting");
  }

  EntryDraft admitted = draft;

  for (size_t i = 0; i < admitted.postings.size(); ++i) {
    auto &posting = admitted.postings[i];
    int32_t index = static_cast<int32_t>(i);

    if (posting.accountCode.empty()) {
      return Error(E_MALFORMED_POSTING, "Posting has no account code", index);
    }

    auto account = spDirectory_->resolveAccount(posting.accountCode);
    if (!account) {
      if (account.error().code == AccountDirectory::E_NOT_FOUND) {
        return Error(E_UNKNOWN_ACCOUNT,
                     "Unknown account: " + posting.accountCode, index);
      }
      log().error << "Account directory lookup failed: "
                  << account.error().message;
      return Error(E_DIRECTORY,
                   "Account lookup failed: " + account.error().message, index);
    }

    for (const auto &[dimension, value] : posting.dimensions) {
      auto dimValue = spDirectory_->resolveDimensionValue(dimension, value);
      if (!dimValue) {
        if (dimValue.error().code == AccountDirectory::E_NOT_FOUND) {
          return Error(E_UNKNOWN_DIMENSION,
                       "Unknown dimension value: " + dimension + "=" + value,
                       index);
        }
        log().error << "Dimension lookup failed: " << dimValue.error().message;
        return Error(E_DIRECTORY,
                     "Dimension lookup failed: " + dimValue.error().message,
                     index);
      }
    }

    if (posting.assetTag) {
      std::string tag = utl::toUpper(utl::trim(*posting.assetTag));
      if (tag.empty()) {
        posting.assetTag.reset();
      } else {
        posting.assetTag = tag;
      }
    }
  }

  auto balanced = checkBalance(admitted);
  if (!balanced) {
    log().debug << "Rejected entry '" << draft.description
                << "': " << balanced.error().message;
    return balanced.error();
  }
  return admitted;
}

} // namespace cb
