#ifndef CB_LEDGER_JOURNAL_ENTRY_H
#define CB_LEDGER_JOURNAL_ENTRY_H

#include "../lib/Decimal.h"
#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cb {

constexpr const char *GENESIS_HASH =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct Posting {
  constexpr static int32_t E_FORMAT = 1;

  std::string accountCode;
  Decimal debit;
  Decimal credit;
  std::string description;
  std::map<std::string, std::string> dimensions; // dimension -> value code
  std::optional<std::string> assetTag;

  template <typename Archive> void serialize(Archive &ar) {
    ar &accountCode &debit &credit &description &dimensions &assetTag;
  }

  nlohmann::json toJson() const;
  Roe<void> fromJson(const nlohmann::json &jd);
};

/**
 * Entry payload as submitted by callers, before validation and chaining.
 */
struct EntryDraft {
  constexpr static int32_t E_FORMAT = 1;

  int64_t date{ 0 };
  std::string description;
  std::optional<std::string> reference;
  std::vector<Posting> postings;
  std::map<std::string, std::string> metadata;

  nlohmann::json toJson() const;

  /**
   * Read {date, description, reference?, postings: [...], metadata?}.
   * Metadata values that are not strings are kept as their JSON text.
   */
  Roe<void> fromJson(const nlohmann::json &jd);
};

/**
 * JournalEntry - an admitted, hash-chained entry. Immutable once appended.
 *
 * The digest covers the content fields and prevHash; id and createdAt are
 * assigned by the ledger and stay outside it.
 */
struct JournalEntry {
  constexpr static const uint32_t VERSION = 1;

  uint64_t id{ 0 };
  int64_t date{ 0 };
  std::string description;
  std::optional<std::string> reference;
  std::vector<Posting> postings;
  std::map<std::string, std::string> metadata;
  std::string hash;
  std::string prevHash;
  int64_t createdAt{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar &id &date &description &reference &postings &metadata &hash &prevHash
        &createdAt;
  }

  static JournalEntry fromDraft(const EntryDraft &draft);
  EntryDraft toDraft() const;

  // Bytes fed to the digest
  std::string canonicalContent() const;
  std::string computeHash() const;

  Decimal totalDebit() const;
  Decimal totalCredit() const;

  nlohmann::json toJson() const;

  std::string ltsToString() const;
  bool ltsFromString(const std::string &str);
};

std::ostream &operator<<(std::ostream &os, const JournalEntry &entry);

} // namespace cb

#endif // CB_LEDGER_JOURNAL_ENTRY_H
