#include "../Utilities.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace cb {
namespace utl {

TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, OutputIsLowercaseHex) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexTest, EncodesEveryByte) {
  EXPECT_EQ(hexEncode(std::string("\x00\x0f\xff", 3)), "000fff");
  EXPECT_EQ(hexEncode(""), "");
}

TEST(DateTest, ParsesDayAndTimestamp) {
  int64_t seconds = 0;
  ASSERT_TRUE(parseIsoDate("1970-01-02", seconds));
  EXPECT_EQ(seconds, 86400);
  ASSERT_TRUE(parseIsoDate("2024-02-29T12:30:15Z", seconds));
  EXPECT_EQ(seconds, 1709209815);
  EXPECT_EQ(formatIsoDate(seconds), "2024-02-29T12:30:15Z");
  EXPECT_EQ(formatIsoDay(seconds), "2024-02-29");
}

TEST(DateTest, RejectsMalformedDates) {
  int64_t seconds = 0;
  EXPECT_FALSE(parseIsoDate("", seconds));
  EXPECT_FALSE(parseIsoDate("2024-1-01", seconds));
  EXPECT_FALSE(parseIsoDate("2024-13-01", seconds));
  EXPECT_FALSE(parseIsoDate("2024-01-01 10:00:00", seconds));
  EXPECT_FALSE(parseIsoDate("2024-01-01T25:00:00Z", seconds));
}

TEST(DateTest, JsonDateAcceptsStringOrSeconds) {
  int64_t seconds = 0;
  ASSERT_TRUE(parseJsonDate(nlohmann::json("2024-01-01"), seconds));
  EXPECT_EQ(seconds, 1704067200);
  ASSERT_TRUE(parseJsonDate(nlohmann::json(1700000000), seconds));
  EXPECT_EQ(seconds, 1700000000);
  EXPECT_FALSE(parseJsonDate(nlohmann::json(1.5), seconds));
  EXPECT_FALSE(parseJsonDate(nlohmann::json::object(), seconds));
}

TEST(StringTest, HelpersNormalize) {
  EXPECT_EQ(toUpper("eth-usdc"), "ETH-USDC");
  EXPECT_EQ(trim("  1010\t\n"), "1010");
  EXPECT_EQ(trim("   "), "");
}

TEST(FileTest, LoadJsonFileReportsEachFailure) {
  auto dir = std::filesystem::temp_directory_path() / "cb_utilities_test";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  auto missing = loadJsonFile((dir / "none.json").string());
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, 1);

  auto written = writeToNewFile((dir / "bad.json").string(), "{ not json");
  ASSERT_TRUE(written.isOk()) << written.error().message;
  auto bad = loadJsonFile((dir / "bad.json").string());
  ASSERT_TRUE(bad.isError());
  EXPECT_EQ(bad.error().code, 3);

  ASSERT_TRUE(writeToNewFile((dir / "good.json").string(), R"({"a": 1})").isOk());
  auto good = loadJsonFile((dir / "good.json").string());
  ASSERT_TRUE(good.isOk());
  EXPECT_EQ(good.value()["a"], 1);

  auto again = writeToNewFile((dir / "good.json").string(), "{}");
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, 1);

  std::filesystem::remove_all(dir, ec);
}

} // namespace utl
} // namespace cb
