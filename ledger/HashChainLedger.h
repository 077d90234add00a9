#ifndef CB_LEDGER_HASH_CHAIN_LEDGER_H
#define CB_LEDGER_HASH_CHAIN_LEDGER_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "JournalEntry.h"
#include "RecordFile.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace cb {

/**
 * HashChainLedger - append-only journal with a SHA-256 hash chain.
 *
 * Each entry's hash covers its content and the hash of the entry before
 * it; the first entry links to GENESIS_HASH. Appends take the writer lock
 * for the whole read-last-hash / persist / publish sequence. Readers and
 * verification take the shared lock, so they never see a half-appended
 * entry.
 *
 * Once an integrity break is found on mount (or latched by the owner via
 * halt()), appends fail with E_CHAIN_HALTED until clearHalt().
 */
class HashChainLedger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_ENTRY = 1;   // structurally unbalanced
  constexpr static int32_t E_CHAIN_INTEGRITY = 2; // broken link or digest
  constexpr static int32_t E_CHAIN_HALTED = 3;    // appends latched off
  constexpr static int32_t E_NOT_FOUND = 4;
  constexpr static int32_t E_STORAGE = 5;
  constexpr static int32_t E_STATE = 6;

  constexpr static uint64_t DEFAULT_PAGE_SIZE = 50;

  struct VerifyResult {
    bool isValid{ true };
    uint64_t totalEntries{ 0 };
    std::optional<uint64_t> brokenAtEntryId; // first failing entry
    std::vector<std::string> errors;         // every mismatch found

    nlohmann::json toJson() const;
  };

  struct ProofLink {
    uint64_t id{ 0 };
    std::string hash;
    std::string prevHash;
  };

  struct Proof {
    uint64_t entryId{ 0 };
    std::string hash;
    std::string prevHash;
    std::string genesisHash;
    std::vector<ProofLink> links; // oldest first, ends at entryId

    nlohmann::json toJson() const;
  };

  struct ListQuery {
    std::optional<int64_t> fromDate; // inclusive
    std::optional<int64_t> toDate;   // inclusive
    uint64_t skip{ 0 };
    uint64_t take{ DEFAULT_PAGE_SIZE };
  };

  struct ListResult {
    std::vector<JournalEntry> entries; // date descending
    uint64_t total{ 0 };
    bool hasMore{ false };
  };

  HashChainLedger();
  ~HashChainLedger() override = default;

  /**
   * Attach to a journal file, replaying and re-verifying its entries.
   * A chain break does not fail the mount; it halts appends instead.
   * @param filepath Journal file, created when missing
   * @return Roe<void> on success, or error if the file cannot be read
   */
  Roe<void> mount(const std::string &filepath);

  /**
   * Chain and persist a balanced entry
   * @return The stored entry with id, hash, prevHash and createdAt set
   */
  Roe<JournalEntry> append(const EntryDraft &draft);

  /**
   * Recompute every digest and link. Never mutates the ledger.
   */
  VerifyResult verifyChain() const;

  /**
   * Hash links from genesis (window == 0) or from the last `window` entries
   * up to entryId
   */
  Roe<Proof> proof(uint64_t entryId, uint64_t window = 0) const;

  // Checks link continuity of a proof without ledger access
  static bool verifyProof(const Proof &proof);

  Roe<JournalEntry> getEntry(uint64_t id) const;
  ListResult listEntries(const ListQuery &query) const;

  /**
   * Visit every entry in append order under the shared lock
   */
  void forEachEntry(const std::function<void(const JournalEntry &)> &fn) const;

  std::string getLastHash() const;
  uint64_t getEntryCount() const;

  void halt(const std::string &reason);
  void clearHalt();
  bool isHalted() const;
  std::string getHaltReason() const;

private:
  VerifyResult verifyLocked() const;

  mutable std::shared_mutex mutex_;
  std::vector<JournalEntry> entries_; // entries_[i].id == i + 1
  bool halted_{ false };
  std::string haltReason_;
  RecordFile store_;
  bool persistent_{ false };
};

} // namespace cb

#endif // CB_LEDGER_HASH_CHAIN_LEDGER_H
