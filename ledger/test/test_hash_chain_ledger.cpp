#include "../HashChainLedger.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using namespace cb;

namespace {

Decimal dec(const std::string &str) { return Decimal::parse(str).value(); }

int64_t day(const std::string &str) {
  int64_t seconds = 0;
  if (!utl::parseIsoDate(str, seconds)) {
    throw std::invalid_argument("bad test date " + str);
  }
  return seconds;
}

EntryDraft makeDraft(const std::string &description, const std::string &amount,
                     int64_t date) {
  EntryDraft draft;
  draft.date = date;
  draft.description = description;
  Posting debit;
  debit.accountCode = "1000";
  debit.debit = dec(amount);
  Posting credit;
  credit.accountCode = "4000";
  credit.credit = dec(amount);
  draft.postings = { debit, credit };
  return draft;
}

} // namespace

class HashChainLedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "cb_hash_chain_test";
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
    std::filesystem::create_directories(testDir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  std::string journalPath() const { return (testDir_ / "journal.dat").string(); }

  std::filesystem::path testDir_;
};

TEST_F(HashChainLedgerTest, Append_FirstEntryLinksToGenesis) {
  HashChainLedger ledger;
  auto result = ledger.append(makeDraft("Opening", "100", day("2024-01-01")));
  ASSERT_TRUE(result.isOk()) << result.error().message;

  const auto &entry = result.value();
  EXPECT_EQ(entry.id, 1u);
  EXPECT_EQ(entry.prevHash, GENESIS_HASH);
  EXPECT_EQ(entry.hash.size(), 64u);
  EXPECT_EQ(entry.hash, entry.computeHash());
  EXPECT_GT(entry.createdAt, 0);
  EXPECT_EQ(ledger.getLastHash(), entry.hash);
}

TEST_F(HashChainLedgerTest, Append_LinksEachEntryToPrevious) {
  HashChainLedger ledger;
  auto first = ledger.append(makeDraft("One", "1", day("2024-01-01")));
  auto second = ledger.append(makeDraft("Two", "2", day("2024-01-02")));
  ASSERT_TRUE(first.isOk());
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(second.value().id, 2u);
  EXPECT_EQ(second.value().prevHash, first.value().hash);
  EXPECT_NE(second.value().hash, first.value().hash);
}

TEST_F(HashChainLedgerTest, Append_RejectsImbalancedEntry) {
  HashChainLedger ledger;
  EntryDraft draft = makeDraft("Broken", "100", day("2024-01-01"));
  draft.postings[1].credit = dec("99.99999999");

  auto result = ledger.append(draft);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, HashChainLedger::E_INVALID_ENTRY);
  EXPECT_EQ(ledger.getEntryCount(), 0u);
}

TEST_F(HashChainLedgerTest, Hash_IsDeterministicAndCoversContent) {
  JournalEntry a = JournalEntry::fromDraft(makeDraft("Same", "5", 1000));
  a.prevHash = GENESIS_HASH;
  JournalEntry b = JournalEntry::fromDraft(makeDraft("Same", "5", 1000));
  b.prevHash = GENESIS_HASH;
  b.id = 42;
  b.createdAt = 99;
  EXPECT_EQ(a.computeHash(), b.computeHash());

  b.metadata["source"] = "import";
  EXPECT_NE(a.computeHash(), b.computeHash());

  JournalEntry c = a;
  c.postings[0].debit = dec("5.00000001");
  EXPECT_NE(a.computeHash(), c.computeHash());
}

TEST_F(HashChainLedgerTest, VerifyChain_IntactAfterAppends) {
  HashChainLedger ledger;
  for (int i = 0; i < 25; ++i) {
    ASSERT_TRUE(ledger.append(makeDraft("Entry " + std::to_string(i), "1",
                                        day("2024-01-01") + i * 86400))
                    .isOk());
  }
  auto result = ledger.verifyChain();
  EXPECT_TRUE(result.isValid);
  EXPECT_EQ(result.totalEntries, 25u);
  EXPECT_FALSE(result.brokenAtEntryId.has_value());
  EXPECT_TRUE(result.errors.empty());
}

TEST_F(HashChainLedgerTest, VerifyChain_EmptyLedgerIsValid) {
  HashChainLedger ledger;
  auto result = ledger.verifyChain();
  EXPECT_TRUE(result.isValid);
  EXPECT_EQ(result.totalEntries, 0u);
}

TEST_F(HashChainLedgerTest, Mount_ReplaysEntries) {
  std::string lastHash;
  {
    HashChainLedger ledger;
    ASSERT_TRUE(ledger.mount(journalPath()).isOk());
    for (int i = 0; i < 3; ++i) {
      auto result = ledger.append(makeDraft("Entry", "10", day("2024-02-01")));
      ASSERT_TRUE(result.isOk()) << result.error().message;
      lastHash = result.value().hash;
    }
  }

  HashChainLedger ledger;
  auto mounted = ledger.mount(journalPath());
  ASSERT_TRUE(mounted.isOk()) << mounted.error().message;
  EXPECT_EQ(ledger.getEntryCount(), 3u);
  EXPECT_EQ(ledger.getLastHash(), lastHash);
  EXPECT_FALSE(ledger.isHalted());

  auto next = ledger.append(makeDraft("After", "1", day("2024-02-02")));
  ASSERT_TRUE(next.isOk());
  EXPECT_EQ(next.value().id, 4u);
  EXPECT_EQ(next.value().prevHash, lastHash);
}

TEST_F(HashChainLedgerTest, Mount_Twice_Fails) {
  HashChainLedger ledger;
  ASSERT_TRUE(ledger.mount(journalPath()).isOk());
  auto again = ledger.mount(journalPath());
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, HashChainLedger::E_STATE);
}

TEST_F(HashChainLedgerTest, Mount_TamperedEntryHaltsAppends) {
  {
    HashChainLedger ledger;
    ASSERT_TRUE(ledger.mount(journalPath()).isOk());
    ASSERT_TRUE(ledger.append(makeDraft("Deposit 001", "10", day("2024-03-01"))).isOk());
    ASSERT_TRUE(ledger.append(makeDraft("Deposit 002", "20", day("2024-03-02"))).isOk());
    ASSERT_TRUE(ledger.append(makeDraft("Deposit 003", "30", day("2024-03-03"))).isOk());
  }

  std::string bytes;
  {
    std::ifstream in(journalPath(), std::ios::binary);
    bytes.assign(std::istreambuf_iterator<char>(in),
                 std::istreambuf_iterator<char>());
  }
  auto pos = bytes.find("Deposit 002");
  ASSERT_NE(pos, std::string::npos);
  bytes[pos + 10] = '9';
  {
    std::ofstream out(journalPath(), std::ios::binary | std::ios::trunc);
    out << bytes;
  }

  HashChainLedger ledger;
  ASSERT_TRUE(ledger.mount(journalPath()).isOk());
  EXPECT_TRUE(ledger.isHalted());

  auto result = ledger.verifyChain();
  EXPECT_FALSE(result.isValid);
  EXPECT_EQ(result.totalEntries, 3u);
  ASSERT_TRUE(result.brokenAtEntryId.has_value());
  EXPECT_EQ(*result.brokenAtEntryId, 2u);

  auto blocked = ledger.append(makeDraft("Later", "1", day("2024-03-04")));
  ASSERT_TRUE(blocked.isError());
  EXPECT_EQ(blocked.error().code, HashChainLedger::E_CHAIN_HALTED);

  ledger.clearHalt();
  EXPECT_FALSE(ledger.isHalted());
  EXPECT_TRUE(ledger.append(makeDraft("Later", "1", day("2024-03-04"))).isOk());
}

TEST_F(HashChainLedgerTest, Halt_BlocksAppendsUntilCleared) {
  HashChainLedger ledger;
  ledger.halt("operator check");
  EXPECT_TRUE(ledger.isHalted());
  EXPECT_EQ(ledger.getHaltReason(), "operator check");

  auto blocked = ledger.append(makeDraft("X", "1", day("2024-01-01")));
  ASSERT_TRUE(blocked.isError());
  EXPECT_EQ(blocked.error().code, HashChainLedger::E_CHAIN_HALTED);

  ledger.clearHalt();
  EXPECT_TRUE(ledger.append(makeDraft("X", "1", day("2024-01-01"))).isOk());
}

TEST_F(HashChainLedgerTest, Proof_FromGenesisAndWindow) {
  HashChainLedger ledger;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(ledger.append(makeDraft("P", "1", day("2024-01-01"))).isOk());
  }

  auto full = ledger.proof(4);
  ASSERT_TRUE(full.isOk());
  ASSERT_EQ(full.value().links.size(), 4u);
  EXPECT_EQ(full.value().links.front().prevHash, GENESIS_HASH);
  EXPECT_EQ(full.value().hash, ledger.getEntry(4).value().hash);
  EXPECT_TRUE(HashChainLedger::verifyProof(full.value()));

  auto windowed = ledger.proof(5, 2);
  ASSERT_TRUE(windowed.isOk());
  ASSERT_EQ(windowed.value().links.size(), 2u);
  EXPECT_EQ(windowed.value().links.front().id, 4u);
  EXPECT_TRUE(HashChainLedger::verifyProof(windowed.value()));

  auto forged = full.value();
  forged.links[1].hash = std::string(64, 'f');
  EXPECT_FALSE(HashChainLedger::verifyProof(forged));

  auto missing = ledger.proof(6);
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, HashChainLedger::E_NOT_FOUND);
}

TEST_F(HashChainLedgerTest, ListEntries_DateDescendingWithPaging) {
  HashChainLedger ledger;
  ASSERT_TRUE(ledger.append(makeDraft("Jan", "1", day("2024-01-10"))).isOk());
  ASSERT_TRUE(ledger.append(makeDraft("Mar", "1", day("2024-03-10"))).isOk());
  ASSERT_TRUE(ledger.append(makeDraft("Feb", "1", day("2024-02-10"))).isOk());

  HashChainLedger::ListQuery query;
  query.take = 2;
  auto page = ledger.listEntries(query);
  EXPECT_EQ(page.total, 3u);
  EXPECT_TRUE(page.hasMore);
  ASSERT_EQ(page.entries.size(), 2u);
  EXPECT_EQ(page.entries[0].description, "Mar");
  EXPECT_EQ(page.entries[1].description, "Feb");

  query.skip = 2;
  auto rest = ledger.listEntries(query);
  ASSERT_EQ(rest.entries.size(), 1u);
  EXPECT_EQ(rest.entries[0].description, "Jan");
  EXPECT_FALSE(rest.hasMore);

  HashChainLedger::ListQuery ranged;
  ranged.fromDate = day("2024-02-01");
  ranged.toDate = day("2024-02-28");
  auto feb = ledger.listEntries(ranged);
  ASSERT_EQ(feb.entries.size(), 1u);
  EXPECT_EQ(feb.entries[0].id, 3u);
}

TEST_F(HashChainLedgerTest, ConcurrentAppends_KeepChainLinear) {
  HashChainLedger ledger;
  ASSERT_TRUE(ledger.mount(journalPath()).isOk());

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&ledger, t]() {
      for (int i = 0; i < 20; ++i) {
        auto result = ledger.append(makeDraft(
            "Worker " + std::to_string(t), "1", 1700000000 + i));
        EXPECT_TRUE(result.isOk());
      }
    });
  }
  // Readers run alongside the writers
  std::thread verifier([&ledger]() {
    for (int i = 0; i < 10; ++i) {
      EXPECT_TRUE(ledger.verifyChain().isValid);
    }
  });
  for (auto &thread : threads) {
    thread.join();
  }
  verifier.join();

  auto result = ledger.verifyChain();
  EXPECT_TRUE(result.isValid);
  EXPECT_EQ(result.totalEntries, 160u);

  // A second instance reads what the first persisted
  HashChainLedger reopened;
  ASSERT_TRUE(reopened.mount(journalPath()).isOk());
  EXPECT_EQ(reopened.getEntryCount(), 160u);
  EXPECT_TRUE(reopened.verifyChain().isValid);
}

TEST_F(HashChainLedgerTest, EntryJson_UsesStringAmounts) {
  HashChainLedger ledger;
  auto result = ledger.append(makeDraft("Json", "12.5", day("2024-01-01")));
  ASSERT_TRUE(result.isOk());

  auto jd = result.value().toJson();
  EXPECT_EQ(jd["id"], "1");
  EXPECT_FALSE(jd.contains("prevHash"));
  EXPECT_EQ(jd["postings"][0]["debit"], "12.5");
  EXPECT_EQ(jd["date"], "2024-01-01T00:00:00Z");
}
