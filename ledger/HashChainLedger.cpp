#include "HashChainLedger.h"
#include "PostingValidator.h"

#include <algorithm>
#include <mutex>

namespace cb {

nlohmann::json HashChainLedger::VerifyResult::toJson() const {
  nlohmann::json jd;
  jd["isValid"] = isValid;
  jd["totalEntries"] = totalEntries;
  if (brokenAtEntryId) {
    jd["brokenAtEntryId"] = std::to_string(*brokenAtEntryId);
  }
  if (!errors.empty()) {
    jd["errors"] = errors;
  }
  return jd;
}

nlohmann::json HashChainLedger::Proof::toJson() const {
  nlohmann::json jd;
  jd["entryId"] = std::to_string(entryId);
  jd["hash"] = hash;
  jd["prevHash"] = prevHash;
  jd["genesisHash"] = genesisHash;
  jd["links"] = nlohmann::json::array();
  for (const auto &link : links) {
    jd["links"].push_back({ { "id", std::to_string(link.id) },
                            { "hash", link.hash },
                            { "prevHash", link.prevHash } });
  }
  return jd;
}

HashChainLedger::HashChainLedger() {
  store_.redirectLogger(log().getFullName() + ".Store");
}

HashChainLedger::Roe<void> HashChainLedger::mount(const std::string &filepath) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (persistent_ || !entries_.empty()) {
    return Error(E_STATE, "Ledger is already in use");
  }
  store_.redirectLogger(log().getFullName() + ".Store");

  auto opened = store_.open(filepath);
  if (!opened) {
    return Error(E_STORAGE, "Failed to open journal: " + opened.error().message);
  }

  auto records = store_.readAll();
  if (!records) {
    return Error(E_STORAGE,
                 "Failed to read journal: " + records.error().message);
  }

  std::vector<JournalEntry> loaded;
  loaded.reserve(records.value().size());
  for (size_t i = 0; i < records.value().size(); ++i) {
    JournalEntry entry;
    if (!entry.ltsFromString(records.value()[i])) {
      log().critical << "Journal record " << i << " cannot be decoded";
      return Error(E_CHAIN_INTEGRITY,
                   "Journal record " + std::to_string(i) + " is corrupt");
    }
    loaded.push_back(std::move(entry));
  }

  entries_ = std::move(loaded);
  persistent_ = true;

  auto verdict = verifyLocked();
  if (!verdict.isValid) {
    halted_ = true;
    haltReason_ = "Chain broken at entry " +
                  std::to_string(verdict.brokenAtEntryId.value_or(0)) +
                  " on mount";
    log().critical << "Ledger halted: " << haltReason_;
  }

  log().info << "Mounted journal " << filepath << " with " << entries_.size()
             << " entries";
  return {};
}

HashChainLedger::Roe<JournalEntry>
HashChainLedger::append(const EntryDraft &draft) {
  auto balanced = PostingValidator::checkBalance(draft);
  if (!balanced) {
    return Error(E_INVALID_ENTRY, balanced.error().message);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (halted_) {
    return Error(E_CHAIN_HALTED, "Ledger is halted: " + haltReason_);
  }

  JournalEntry entry = JournalEntry::fromDraft(draft);
  entry.id = entries_.size() + 1;
  entry.prevHash = entries_.empty() ? GENESIS_HASH : entries_.back().hash;
  entry.createdAt = utl::getCurrentTime();
  entry.hash = entry.computeHash();

  if (persistent_) {
    auto written = store_.append(entry.ltsToString());
    if (!written) {
      log().error << "Failed to persist entry " << entry.id << ": "
                  << written.error().message;
      return Error(E_STORAGE,
                   "Failed to persist entry: " + written.error().message);
    }
  }

  entries_.push_back(entry);
  log().debug << "Appended " << entry;
  return entry;
}

HashChainLedger::VerifyResult HashChainLedger::verifyChain() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return verifyLocked();
}

HashChainLedger::VerifyResult HashChainLedger::verifyLocked() const {
  VerifyResult result;
  result.totalEntries = entries_.size();

  std::string expectedPrev = GENESIS_HASH;
  for (size_t i = 0; i < entries_.size(); ++i) {
    const JournalEntry &entry = entries_[i];
    std::vector<std::string> problems;

    if (entry.id != i + 1) {
      problems.push_back("Entry at position " + std::to_string(i + 1) +
                         " has out-of-sequence id " + std::to_string(entry.id));
    }
    if (entry.prevHash != expectedPrev) {
      problems.push_back("Entry " + std::to_string(entry.id) +
                         ": prevHash does not match the previous entry");
    }
    if (entry.computeHash() != entry.hash) {
      problems.push_back("Entry " + std::to_string(entry.id) +
                         ": content does not match its hash");
    }

    if (!problems.empty()) {
      if (result.isValid) {
        result.isValid = false;
        result.brokenAtEntryId = entry.id;
      }
      result.errors.insert(result.errors.end(), problems.begin(),
                           problems.end());
    }
    // Continue from the stored hash so only the altered entry is blamed
    expectedPrev = entry.hash;
  }

  if (result.isValid) {
    log().info << "Chain verified: " << result.totalEntries << " entries";
  } else {
    log().critical << "Chain integrity broken at entry "
                   << *result.brokenAtEntryId << " ("
                   << result.errors.size() << " mismatches)";
  }
  return result;
}

HashChainLedger::Roe<HashChainLedger::Proof>
HashChainLedger::proof(uint64_t entryId, uint64_t window) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  if (entryId == 0 || entryId > entries_.size()) {
    return Error(E_NOT_FOUND, "Entry not found: " + std::to_string(entryId));
  }

  uint64_t first = 1;
  if (window > 0 && entryId > window) {
    first = entryId - window + 1;
  }

  Proof result;
  result.entryId = entryId;
  result.genesisHash = GENESIS_HASH;
  for (uint64_t id = first; id <= entryId; ++id) {
    const JournalEntry &entry = entries_[id - 1];
    result.links.push_back(ProofLink{ entry.id, entry.hash, entry.prevHash });
  }
  result.hash = result.links.back().hash;
  result.prevHash = result.links.back().prevHash;
  return result;
}

bool HashChainLedger::verifyProof(const Proof &proof) {
  if (proof.links.empty()) {
    return false;
  }
  const ProofLink &last = proof.links.back();
  if (last.id != proof.entryId || last.hash != proof.hash ||
      last.prevHash != proof.prevHash) {
    return false;
  }
  if (proof.links.front().id == 1 &&
      proof.links.front().prevHash != proof.genesisHash) {
    return false;
  }
  for (size_t i = 1; i < proof.links.size(); ++i) {
    if (proof.links[i].id != proof.links[i - 1].id + 1 ||
        proof.links[i].prevHash != proof.links[i - 1].hash) {
      return false;
    }
  }
  return true;
}

HashChainLedger::Roe<JournalEntry> HashChainLedger::getEntry(uint64_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (id == 0 || id > entries_.size()) {
    return Error(E_NOT_FOUND, "Entry not found: " + std::to_string(id));
  }
  return entries_[id - 1];
}

HashChainLedger::ListResult
HashChainLedger::listEntries(const ListQuery &query) const {
  std::vector<const JournalEntry *> matches;
  ListResult result;

  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &entry : entries_) {
    if (query.fromDate && entry.date < *query.fromDate) {
      continue;
    }
    if (query.toDate && entry.date > *query.toDate) {
      continue;
    }
    matches.push_back(&entry);
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const JournalEntry *a, const JournalEntry *b) {
                     if (a->date != b->date) {
                       return a->date > b->date;
                     }
                     return a->id > b->id;
                   });

  uint64_t take = query.take == 0 ? DEFAULT_PAGE_SIZE : query.take;
  result.total = matches.size();
  for (uint64_t i = query.skip; i < matches.size() && i < query.skip + take;
       ++i) {
    result.entries.push_back(*matches[i]);
  }
  result.hasMore = query.skip + result.entries.size() < result.total;
  return result;
}

void HashChainLedger::forEachEntry(
    const std::function<void(const JournalEntry &)> &fn) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &entry : entries_) {
    fn(entry);
  }
}

std::string HashChainLedger::getLastHash() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.empty() ? std::string(GENESIS_HASH) : entries_.back().hash;
}

uint64_t HashChainLedger::getEntryCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

void HashChainLedger::halt(const std::string &reason) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!halted_) {
    halted_ = true;
    haltReason_ = reason;
    log().critical << "Ledger halted: " << reason;
  }
}

void HashChainLedger::clearHalt() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (halted_) {
    log().warning << "Halt cleared by operator (was: " << haltReason_ << ")";
  }
  halted_ = false;
  haltReason_.clear();
}

bool HashChainLedger::isHalted() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return halted_;
}

std::string HashChainLedger::getHaltReason() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return haltReason_;
}

} // namespace cb
