#include "../ReconciliationEngine.h"
#include "../../ledger/BookBalanceCalculator.h"
#include "../../ledger/HashChainLedger.h"
#include "../../lib/Utilities.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using namespace cb;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

Decimal dec(const std::string &str) { return Decimal::parse(str).value(); }

int64_t day(const std::string &str) {
  int64_t seconds = 0;
  if (!utl::parseIsoDate(str, seconds)) {
    throw std::invalid_argument("bad test date " + str);
  }
  return seconds;
}

class MockBalanceSource : public BalanceSource {
public:
  MOCK_METHOD(Roe<std::vector<Balance>>, getBalances,
              (const std::string &address,
               const std::vector<std::string> &assets),
              (override));
};

class MockAlertDispatcher : public AlertDispatcher {
public:
  MOCK_METHOD(Roe<void>, sendBatchAlert, (const std::vector<Alert> &alerts),
              (override));
};

BalanceSource::Roe<std::vector<BalanceSource::Balance>>
observed(const std::string &asset, const std::string &amount) {
  BalanceSource::Balance balance;
  balance.asset = asset;
  balance.balance = dec(amount);
  balance.blockNumber = 19000000;
  balance.timestamp = day("2024-02-01");
  return std::vector<BalanceSource::Balance>{ balance };
}

} // namespace

class ReconciliationEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "cb_recon_test";
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
    std::filesystem::create_directories(testDir_);

    spSource_ = std::make_shared<MockBalanceSource>();
    spDispatcher_ = std::make_shared<MockAlertDispatcher>();
    spCalculator_ = std::make_unique<BookBalanceCalculator>(ledger_);

    wallet_.id = "hot-1";
    wallet_.address = "0xabc";
    wallet_.glAccount = "1010";
    wallet_.assets = { "ETH" };
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  // Dr wallet / Cr equity, tagged with the asset
  void postBook(const std::string &asset, const std::string &amount) {
    EntryDraft draft;
    draft.date = day("2024-01-01");
    draft.description = "Fund wallet";
    Posting debit;
    debit.accountCode = "1010";
    debit.debit = dec(amount);
    debit.assetTag = asset;
    Posting credit;
    credit.accountCode = "3000";
    credit.credit = dec(amount);
    credit.assetTag = asset;
    draft.postings = { debit, credit };
    auto appended = ledger_.append(draft);
    ASSERT_TRUE(appended.isOk()) << appended.error().message;
  }

  std::unique_ptr<ReconciliationEngine> makeEngine() {
    ReconciliationEngine::Config config;
    config.threshold = dec("1");
    config.alertThreshold = dec("1");
    return std::make_unique<ReconciliationEngine>(*spCalculator_, spSource_,
                                                  spDispatcher_, config);
  }

  std::filesystem::path testDir_;
  HashChainLedger ledger_;
  std::unique_ptr<BookBalanceCalculator> spCalculator_;
  std::shared_ptr<MockBalanceSource> spSource_;
  std::shared_ptr<MockAlertDispatcher> spDispatcher_;
  ReconciliationEngine::Wallet wallet_;
};

TEST_F(ReconciliationEngineTest, VariancePercent_ZeroBook) {
  EXPECT_EQ(ReconciliationEngine::variancePercentOf(dec("3"), Decimal()),
            dec("100"));
  EXPECT_TRUE(
      ReconciliationEngine::variancePercentOf(Decimal(), Decimal()).isZero());
  EXPECT_EQ(ReconciliationEngine::variancePercentOf(dec("90"), dec("100")),
            dec("-10"));
}

TEST_F(ReconciliationEngineTest, OutOfThreshold_SmallPercentIsWarning) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  std::vector<AlertDispatcher::Alert> sent;
  EXPECT_CALL(*spSource_, getBalances("0xabc", _))
      .WillOnce(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .WillOnce(Invoke([&](const std::vector<AlertDispatcher::Alert> &alerts) {
        sent = alerts;
        return AlertDispatcher::Roe<void>();
      }));

  auto result = engine->reconcileWallet(wallet_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  ASSERT_EQ(result.value().records.size(), 1u);

  const auto &record = result.value().records[0];
  EXPECT_EQ(record.bookBalance, dec("100"));
  EXPECT_EQ(record.variance, dec("5"));
  EXPECT_EQ(record.variancePercent, dec("5"));
  EXPECT_FALSE(record.isWithinThreshold);
  EXPECT_TRUE(record.alertSent);
  EXPECT_EQ(record.status, ReconciliationEngine::Status::ALERTED);
  EXPECT_EQ(record.onChainBlockNumber, 19000000u);

  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].severity, AlertDispatcher::Severity::WARNING);
  EXPECT_EQ(sent[0].message, "Wallet 0xabc has a 5% variance for ETH");
}

TEST_F(ReconciliationEngineTest, OutOfThreshold_LargePercentIsCritical) {
  postBook("ETH", "50");
  auto engine = makeEngine();

  std::vector<AlertDispatcher::Alert> sent;
  EXPECT_CALL(*spSource_, getBalances(_, _))
      .WillOnce(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .WillOnce(Invoke([&](const std::vector<AlertDispatcher::Alert> &alerts) {
        sent = alerts;
        return AlertDispatcher::Roe<void>();
      }));

  auto result = engine->reconcileWallet(wallet_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().records[0].variancePercent, dec("110"));
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].severity, AlertDispatcher::Severity::CRITICAL);
}

TEST_F(ReconciliationEngineTest, RepeatedRuns_AlertOnlyOnce) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  EXPECT_CALL(*spSource_, getBalances(_, _))
      .Times(3)
      .WillRepeatedly(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .Times(1)
      .WillOnce(Return(AlertDispatcher::Roe<void>()));

  for (int i = 0; i < 3; ++i) {
    auto result = engine->reconcileWallet(wallet_);
    ASSERT_TRUE(result.isOk()) << result.error().message;
  }
  auto record = engine->getRecord("hot-1", "eth");
  ASSERT_TRUE(record.isOk());
  EXPECT_TRUE(record.value().alertSent);
  EXPECT_TRUE(record.value().alertSentAt.has_value());
}

TEST_F(ReconciliationEngineTest, WithinThreshold_IsReconciledWithoutAlert) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  EXPECT_CALL(*spSource_, getBalances(_, _))
      .WillOnce(Return(observed("ETH", "100.5")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_)).Times(0);

  auto result = engine->reconcileWallet(wallet_);
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(result.value().records[0].isWithinThreshold);
  EXPECT_EQ(result.value().records[0].status,
            ReconciliationEngine::Status::RECONCILED);
}

TEST_F(ReconciliationEngineTest, BelowAlertThreshold_IsFlaggedOnly) {
  postBook("ETH", "100");
  ReconciliationEngine::Config config;
  config.threshold = dec("0.01");
  config.alertThreshold = dec("1");
  ReconciliationEngine engine(*spCalculator_, spSource_, spDispatcher_,
                              config);

  EXPECT_CALL(*spSource_, getBalances(_, _))
      .WillOnce(Return(observed("ETH", "100.5")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_)).Times(0);

  auto result = engine.reconcileWallet(wallet_);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.value().records[0].isWithinThreshold);
  EXPECT_FALSE(result.value().records[0].alertSent);
  EXPECT_EQ(result.value().records[0].status,
            ReconciliationEngine::Status::FLAGGED);
}

TEST_F(ReconciliationEngineTest, ClearedVariance_RearmsLatch) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  EXPECT_CALL(*spSource_, getBalances(_, _))
      .WillOnce(Return(observed("ETH", "105")))
      .WillOnce(Return(observed("ETH", "100")))
      .WillOnce(Return(observed("ETH", "106")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .Times(2)
      .WillRepeatedly(Return(AlertDispatcher::Roe<void>()));

  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(engine->reconcileWallet(wallet_).isOk());
  }
}

TEST_F(ReconciliationEngineTest, ResetAlert_RearmsLatch) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  EXPECT_CALL(*spSource_, getBalances(_, _))
      .Times(2)
      .WillRepeatedly(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .Times(2)
      .WillRepeatedly(Return(AlertDispatcher::Roe<void>()));

  ASSERT_TRUE(engine->reconcileWallet(wallet_).isOk());
  ASSERT_TRUE(engine->resetAlert("hot-1", "ETH").isOk());
  EXPECT_FALSE(engine->getRecord("hot-1", "ETH").value().alertSent);
  ASSERT_TRUE(engine->reconcileWallet(wallet_).isOk());

  auto missing = engine->resetAlert("cold-9", "ETH");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, ReconciliationEngine::E_NOT_FOUND);
}

TEST_F(ReconciliationEngineTest, FailedDispatch_ReleasesClaim) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  EXPECT_CALL(*spSource_, getBalances(_, _))
      .Times(2)
      .WillRepeatedly(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .WillOnce(Return(AlertDispatcher::Roe<void>(
          AlertDispatcher::Error(AlertDispatcher::E_DELIVERY, "smtp down"))))
      .WillOnce(Return(AlertDispatcher::Roe<void>()));

  auto first = engine->reconcileWallet(wallet_);
  ASSERT_TRUE(first.isOk());
  EXPECT_EQ(first.value().alertsSent, 0u);
  EXPECT_FALSE(first.value().records[0].alertSent);
  EXPECT_EQ(first.value().records[0].status,
            ReconciliationEngine::Status::FLAGGED);

  auto second = engine->reconcileWallet(wallet_);
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(second.value().alertsSent, 1u);
  EXPECT_TRUE(second.value().records[0].alertSent);
}

TEST_F(ReconciliationEngineTest, ReconcileAll_IsolatesSourceFailures) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  ReconciliationEngine::Wallet broken = wallet_;
  broken.id = "cold-2";
  broken.address = "0xdead";

  EXPECT_CALL(*spSource_, getBalances("0xdead", _))
      .WillOnce(Return(BalanceSource::Roe<std::vector<BalanceSource::Balance>>(
          BalanceSource::Error(BalanceSource::E_UNAVAILABLE, "timeout"))));
  EXPECT_CALL(*spSource_, getBalances("0xabc", _))
      .WillOnce(Return(observed("ETH", "100")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_)).Times(0);

  auto summary = engine->reconcileAll({ broken, wallet_ });
  EXPECT_EQ(summary.totalReconciled, 1u);
  EXPECT_EQ(summary.withinThreshold, 1u);
  EXPECT_EQ(summary.outOfThreshold, 0u);
  ASSERT_EQ(summary.failedWallets.size(), 1u);
  EXPECT_EQ(summary.failedWallets[0], "cold-2");
  EXPECT_TRUE(engine->getRecord("cold-2", "ETH").isError());
}

TEST_F(ReconciliationEngineTest, UnreconciledItems_OrderedByPercent) {
  postBook("ETH", "100");
  postBook("BTC", "10");
  auto engine = makeEngine();
  wallet_.assets = {};

  BalanceSource::Balance eth;
  eth.asset = "ETH";
  eth.balance = dec("103");
  BalanceSource::Balance btc;
  btc.asset = "btc";
  btc.balance = dec("15");
  EXPECT_CALL(*spSource_, getBalances("0xabc", std::vector<std::string>{}))
      .WillOnce(Return(BalanceSource::Roe<std::vector<BalanceSource::Balance>>(
          std::vector<BalanceSource::Balance>{ eth, btc })));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .WillOnce(Return(AlertDispatcher::Roe<void>()));

  ASSERT_TRUE(engine->reconcileWallet(wallet_).isOk());

  auto items = engine->getUnreconciledItems(dec("1"));
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].asset, "BTC");
  EXPECT_EQ(items[0].variancePercent, dec("50"));
  EXPECT_EQ(items[1].asset, "ETH");

  EXPECT_EQ(engine->getUnreconciledItems(dec("4")).size(), 1u);
}

TEST_F(ReconciliationEngineTest, Mount_RestoresLatch) {
  postBook("ETH", "100");
  std::string path = (testDir_ / "recon.dat").string();

  EXPECT_CALL(*spSource_, getBalances(_, _))
      .Times(2)
      .WillRepeatedly(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .Times(1)
      .WillOnce(Return(AlertDispatcher::Roe<void>()));

  {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->mount(path).isOk());
    ASSERT_TRUE(engine->reconcileWallet(wallet_).isOk());
  }

  auto reopened = makeEngine();
  auto mounted = reopened->mount(path);
  ASSERT_TRUE(mounted.isOk()) << mounted.error().message;
  EXPECT_TRUE(reopened->getRecord("hot-1", "ETH").value().alertSent);

  auto rerun = reopened->reconcileWallet(wallet_);
  ASSERT_TRUE(rerun.isOk());
  EXPECT_EQ(rerun.value().alertsSent, 0u);
}

TEST_F(ReconciliationEngineTest, UnrequestedAssets_AreSkipped) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  BalanceSource::Balance eth;
  eth.asset = "ETH";
  eth.balance = dec("100");
  BalanceSource::Balance usdc;
  usdc.asset = "USDC";
  usdc.balance = dec("5000");
  EXPECT_CALL(*spSource_, getBalances("0xabc", _))
      .WillOnce(Return(BalanceSource::Roe<std::vector<BalanceSource::Balance>>(
          std::vector<BalanceSource::Balance>{ eth, usdc })));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_)).Times(0);

  auto result = engine->reconcileWallet(wallet_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  ASSERT_EQ(result.value().records.size(), 1u);
  EXPECT_EQ(result.value().records[0].asset, "ETH");
  EXPECT_TRUE(engine->getRecord("hot-1", "USDC").isError());
}

TEST_F(ReconciliationEngineTest, ConcurrentRuns_AlertExactlyOnce) {
  postBook("ETH", "100");
  auto engine = makeEngine();

  std::atomic<int> dispatched{ 0 };
  EXPECT_CALL(*spSource_, getBalances(_, _))
      .WillRepeatedly(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .WillRepeatedly(Invoke([&](const std::vector<AlertDispatcher::Alert> &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        dispatched++;
        return AlertDispatcher::Roe<void>();
      }));

  std::vector<std::thread> runs;
  std::atomic<uint64_t> reported{ 0 };
  for (int i = 0; i < 8; ++i) {
    runs.emplace_back([&] {
      auto result = engine->reconcileWallet(wallet_);
      ASSERT_TRUE(result.isOk());
      EXPECT_TRUE(result.value().records[0].alertSent);
      reported += result.value().alertsSent;
    });
  }
  for (auto &run : runs) {
    run.join();
  }

  EXPECT_EQ(dispatched.load(), 1);
  EXPECT_EQ(reported.load(), 1u);
  EXPECT_EQ(engine->getRecord("hot-1", "ETH").value().status,
            ReconciliationEngine::Status::ALERTED);
}

TEST_F(ReconciliationEngineTest, ConcurrentRuns_FailedDispatchNeverLatches) {
  postBook("ETH", "100");
  std::string path = (testDir_ / "recon.dat").string();

  std::atomic<int> attempts{ 0 };
  EXPECT_CALL(*spSource_, getBalances(_, _))
      .WillRepeatedly(Return(observed("ETH", "105")));
  EXPECT_CALL(*spDispatcher_, sendBatchAlert(_))
      .WillRepeatedly(Invoke([&](const std::vector<AlertDispatcher::Alert> &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        attempts++;
        return AlertDispatcher::Roe<void>(
            AlertDispatcher::Error(AlertDispatcher::E_DELIVERY, "smtp down"));
      }));

  {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->mount(path).isOk());

    std::vector<std::thread> runs;
    for (int i = 0; i < 8; ++i) {
      runs.emplace_back([&] {
        auto result = engine->reconcileWallet(wallet_);
        ASSERT_TRUE(result.isOk());
        EXPECT_EQ(result.value().alertsSent, 0u);
        EXPECT_FALSE(result.value().records[0].alertSent);
        EXPECT_EQ(result.value().records[0].status,
                  ReconciliationEngine::Status::FLAGGED);
      });
    }
    for (auto &run : runs) {
      run.join();
    }

    // Every run retried since none saw a delivered alert
    EXPECT_EQ(attempts.load(), 8);
    EXPECT_FALSE(engine->getRecord("hot-1", "ETH").value().alertSent);
  }

  auto reopened = makeEngine();
  ASSERT_TRUE(reopened->mount(path).isOk());
  auto record = reopened->getRecord("hot-1", "ETH");
  ASSERT_TRUE(record.isOk());
  EXPECT_FALSE(record.value().alertSent);
  EXPECT_EQ(record.value().status, ReconciliationEngine::Status::FLAGGED);
}
