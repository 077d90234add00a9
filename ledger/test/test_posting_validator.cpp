#include "../PostingValidator.h"

#include <gtest/gtest.h>

#include <set>

using namespace cb;

namespace {

Decimal dec(const std::string &str) { return Decimal::parse(str).value(); }

class FakeDirectory : public AccountDirectory {
public:
  bool available{ true };

  Roe<Account> resolveAccount(const std::string &code) const override {
    if (!available) {
      return Error(E_UNAVAILABLE, "directory offline");
    }
    if (code == "1010") {
      return Account{ "1010", "Crypto Wallets", "asset" };
    }
    if (code == "3000") {
      return Account{ "3000", "Owner Equity", "equity" };
    }
    return Error(E_NOT_FOUND, "no account " + code);
  }

  Roe<DimensionValue>
  resolveDimensionValue(const std::string &dimension,
                        const std::string &valueCode) const override {
    if (dimension == "costCenter" && valueCode == "OPS") {
      return DimensionValue{ dimension, valueCode };
    }
    return Error(E_NOT_FOUND, "no value " + dimension + "=" + valueCode);
  }
};

Posting debit(const std::string &account, const std::string &amount) {
  Posting posting;
  posting.accountCode = account;
  posting.debit = dec(amount);
  return posting;
}

Posting credit(const std::string &account, const std::string &amount) {
  Posting posting;
  posting.accountCode = account;
  posting.credit = dec(amount);
  return posting;
}

EntryDraft draftOf(std::vector<Posting> postings) {
  EntryDraft draft;
  draft.date = 1704067200;
  draft.description = "Test entry";
  draft.postings = std::move(postings);
  return draft;
}

} // namespace

class PostingValidatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    spDirectory_ = std::make_shared<FakeDirectory>();
    validator_ = std::make_unique<PostingValidator>(spDirectory_);
  }

  std::shared_ptr<FakeDirectory> spDirectory_;
  std::unique_ptr<PostingValidator> validator_;
};

TEST_F(PostingValidatorTest, Validate_AcceptsBalancedEntry) {
  Posting in = debit("1010", "2.5");
  in.assetTag = "eth";
  in.dimensions["costCenter"] = "OPS";
  Posting out = credit("3000", "2.5");
  out.assetTag = "Eth";

  auto result = validator_->validate(draftOf({ in, out }));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(*result.value().postings[0].assetTag, "ETH");
  EXPECT_EQ(*result.value().postings[1].assetTag, "ETH");
  EXPECT_EQ(result.value().description, "Test entry");
}

TEST_F(PostingValidatorTest, Validate_TrimsAssetTags) {
  Posting in = debit("1010", "1");
  in.assetTag = " eth ";
  Posting out = credit("3000", "1");
  out.assetTag = "  ";

  auto result = validator_->validate(draftOf({ in, out }));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(*result.value().postings[0].assetTag, "ETH");
  EXPECT_FALSE(result.value().postings[1].assetTag.has_value());
}

TEST_F(PostingValidatorTest, Validate_RejectsEmptyEntry) {
  auto result = validator_->validate(draftOf({}));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_EMPTY_ENTRY);
  EXPECT_EQ(result.error().postingIndex, -1);
}

TEST_F(PostingValidatorTest, Validate_RejectsImbalance) {
  auto result = validator_->validate(
      draftOf({ debit("1010", "100"), credit("3000", "99.99999999") }));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_IMBALANCED);
  EXPECT_EQ(result.error().postingIndex, -1);
  EXPECT_NE(result.error().message.find("99.99999999"), std::string::npos);
}

TEST_F(PostingValidatorTest, Validate_UnknownAccountCarriesIndex) {
  auto result = validator_->validate(
      draftOf({ debit("1010", "1"), credit("9999", "1") }));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_UNKNOWN_ACCOUNT);
  EXPECT_EQ(result.error().postingIndex, 1);
}

TEST_F(PostingValidatorTest, Validate_UnknownDimensionCarriesIndex) {
  Posting in = debit("1010", "1");
  in.dimensions["costCenter"] = "SALES";
  auto result = validator_->validate(draftOf({ in, credit("3000", "1") }));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_UNKNOWN_DIMENSION);
  EXPECT_EQ(result.error().postingIndex, 0);
}

TEST_F(PostingValidatorTest, Validate_RejectsPostingWithBothSides) {
  Posting both = debit("1010", "1");
  both.credit = dec("1");
  auto result = validator_->validate(draftOf({ both }));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_MALFORMED_POSTING);
  EXPECT_EQ(result.error().postingIndex, 0);
}

TEST_F(PostingValidatorTest, Validate_RejectsNegativeAmount) {
  auto result = validator_->validate(
      draftOf({ debit("1010", "-5"), credit("3000", "-5") }));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_MALFORMED_POSTING);
  EXPECT_EQ(result.error().postingIndex, 0);
}

TEST_F(PostingValidatorTest, Validate_ZeroAmountsBalance) {
  auto result = validator_->validate(
      draftOf({ debit("1010", "0"), credit("3000", "0") }));
  EXPECT_TRUE(result.isOk());
}

TEST_F(PostingValidatorTest, Validate_DirectoryOutageIsNotUnknownAccount) {
  spDirectory_->available = false;
  auto result = validator_->validate(
      draftOf({ debit("1010", "1"), credit("3000", "1") }));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_DIRECTORY);
}

TEST_F(PostingValidatorTest, Validate_TotalsOverflow) {
  auto result = validator_->validate(draftOf({ debit("1010", "90000000000"),
                                               debit("1010", "90000000000"),
                                               credit("3000", "1") }));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PostingValidator::E_OVERFLOW);
}

TEST_F(PostingValidatorTest, CheckBalance_NeedsNoDirectory) {
  EXPECT_TRUE(PostingValidator::checkBalance(
                  draftOf({ debit("anything", "3"), credit("else", "3") }))
                  .isOk());
  auto imbalanced = PostingValidator::checkBalance(
      draftOf({ debit("anything", "3"), credit("else", "2") }));
  ASSERT_TRUE(imbalanced.isError());
  EXPECT_EQ(imbalanced.error().code, PostingValidator::E_IMBALANCED);
}
