#include "JournalEntry.h"
#include "../lib/Serialize.hpp"

#include <sstream>

namespace cb {

namespace {

Roe<Decimal> amountField(const nlohmann::json &jd, const char *name) {
  if (!jd.contains(name) || jd[name].is_null()) {
    return Decimal();
  }
  auto amount = Decimal::fromJson(jd[name]);
  if (!amount) {
    return Error(Posting::E_FORMAT, "Field '" + std::string(name) +
                                        "': " + amount.error().message);
  }
  return amount.value();
}

Roe<std::map<std::string, std::string>>
stringMapField(const nlohmann::json &jd, const char *name, bool stringsOnly) {
  std::map<std::string, std::string> result;
  if (!jd.contains(name) || jd[name].is_null()) {
    return result;
  }
  if (!jd[name].is_object()) {
    return Error(EntryDraft::E_FORMAT,
                 "Field '" + std::string(name) + "' must be an object");
  }
  for (const auto &[key, value] : jd[name].items()) {
    if (value.is_string()) {
      result[key] = value.get<std::string>();
    } else if (stringsOnly) {
      return Error(EntryDraft::E_FORMAT, "Field '" + std::string(name) + "." +
                                             key + "' must be a string");
    } else {
      result[key] = value.dump();
    }
  }
  return result;
}

} // namespace

// ----------------- Posting -------------------------------------------

nlohmann::json Posting::toJson() const {
  nlohmann::json jd;
  jd["accountCode"] = accountCode;
  jd["debit"] = debit.toString();
  jd["credit"] = credit.toString();
  if (!description.empty()) {
    jd["description"] = description;
  }
  if (!dimensions.empty()) {
    jd["dimensions"] = dimensions;
  }
  if (assetTag) {
    jd["asset"] = *assetTag;
  }
  return jd;
}

Roe<void> Posting::fromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_FORMAT, "Posting must be a JSON object");
  }

  if (!jd.contains("accountCode") || !jd["accountCode"].is_string()) {
    return Error(E_FORMAT, "Field 'accountCode' must be a string");
  }
  accountCode = jd["accountCode"].get<std::string>();

  auto debitResult = amountField(jd, "debit");
  if (!debitResult) {
    return debitResult.error();
  }
  debit = debitResult.value();

  auto creditResult = amountField(jd, "credit");
  if (!creditResult) {
    return creditResult.error();
  }
  credit = creditResult.value();

  description.clear();
  if (jd.contains("description") && !jd["description"].is_null()) {
    if (!jd["description"].is_string()) {
      return Error(E_FORMAT, "Field 'description' must be a string");
    }
    description = jd["description"].get<std::string>();
  }

  auto dims = stringMapField(jd, "dimensions", true);
  if (!dims) {
    return dims.error();
  }
  dimensions = dims.value();

  assetTag.reset();
  if (jd.contains("asset") && !jd["asset"].is_null()) {
    if (!jd["asset"].is_string()) {
      return Error(E_FORMAT, "Field 'asset' must be a string");
    }
    assetTag = jd["asset"].get<std::string>();
  }
  return {};
}

// ----------------- EntryDraft ----------------------------------------

nlohmann::json EntryDraft::toJson() const {
  nlohmann::json jd;
  jd["date"] = utl::formatIsoDate(date);
  jd["description"] = description;
  if (reference) {
    jd["reference"] = *reference;
  }
  jd["postings"] = nlohmann::json::array();
  for (const auto &posting : postings) {
    jd["postings"].push_back(posting.toJson());
  }
  if (!metadata.empty()) {
    jd["metadata"] = metadata;
  }
  return jd;
}

Roe<void> EntryDraft::fromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_FORMAT, "Entry must be a JSON object");
    }

    if (!jd.contains("date") || !utl::parseJsonDate(jd["date"], date)) {
      return Error(E_FORMAT,
                   "Field 'date' must be YYYY-MM-DD, an ISO UTC timestamp "
                   "or unix seconds");
    }

    if (!jd.contains("description") || !jd["description"].is_string()) {
      return Error(E_FORMAT, "Field 'description' must be a string");
    }
    description = jd["description"].get<std::string>();

    reference.reset();
    if (jd.contains("reference") && !jd["reference"].is_null()) {
      if (!jd["reference"].is_string()) {
        return Error(E_FORMAT, "Field 'reference' must be a string");
      }
      reference = jd["reference"].get<std::string>();
    }

    if (!jd.contains("postings") || !jd["postings"].is_array()) {
      return Error(E_FORMAT, "Field 'postings' must be an array");
    }
    postings.clear();
    for (size_t i = 0; i < jd["postings"].size(); ++i) {
      Posting posting;
      auto result = posting.fromJson(jd["postings"][i]);
      if (!result) {
        return Error(E_FORMAT, "Posting " + std::to_string(i) + ": " +
                                   result.error().message);
      }
      postings.push_back(posting);
    }

    auto meta = stringMapField(jd, "metadata", false);
    if (!meta) {
      return meta.error();
    }
    metadata = meta.value();
    return {};
  } catch (const std::exception &e) {
    return Error(E_FORMAT, "Failed to parse entry: " + std::string(e.what()));
  }
}

// ----------------- JournalEntry --------------------------------------

JournalEntry JournalEntry::fromDraft(const EntryDraft &draft) {
  JournalEntry entry;
  entry.date = draft.date;
  entry.description = draft.description;
  entry.reference = draft.reference;
  entry.postings = draft.postings;
  entry.metadata = draft.metadata;
  return entry;
}

EntryDraft JournalEntry::toDraft() const {
  EntryDraft draft;
  draft.date = date;
  draft.description = description;
  draft.reference = reference;
  draft.postings = postings;
  draft.metadata = metadata;
  return draft;
}

std::string JournalEntry::canonicalContent() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar &VERSION &date &description &reference &postings &metadata &prevHash;
  return oss.str();
}

std::string JournalEntry::computeHash() const {
  return utl::sha256(canonicalContent());
}

Decimal JournalEntry::totalDebit() const {
  Decimal total;
  for (const auto &posting : postings) {
    total += posting.debit;
  }
  return total;
}

Decimal JournalEntry::totalCredit() const {
  Decimal total;
  for (const auto &posting : postings) {
    total += posting.credit;
  }
  return total;
}

nlohmann::json JournalEntry::toJson() const {
  nlohmann::json jd = toDraft().toJson();
  jd["id"] = std::to_string(id);
  jd["hash"] = hash;
  if (prevHash != GENESIS_HASH) {
    jd["prevHash"] = prevHash;
  }
  jd["createdAt"] = utl::formatIsoDate(createdAt);
  return jd;
}

std::string JournalEntry::ltsToString() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar &VERSION &*this;
  return oss.str();
}

bool JournalEntry::ltsFromString(const std::string &str) {
  std::istringstream iss(str, std::ios::binary);
  InputArchive ar(iss);
  uint32_t version = 0;
  ar &version;
  if (version != VERSION) {
    return false;
  }
  ar &*this;
  if (ar.failed()) {
    return false;
  }
  return true;
}

std::ostream &operator<<(std::ostream &os, const JournalEntry &entry) {
  os << "JournalEntry{id: " << entry.id
     << ", date: " << utl::formatIsoDay(entry.date)
     << ", postings: " << entry.postings.size()
     << ", hash: " << entry.hash.substr(0, 12) << "}";
  return os;
}

} // namespace cb
