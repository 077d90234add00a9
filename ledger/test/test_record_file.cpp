#include "../RecordFile.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace cb;

class RecordFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "cb_record_file_test";
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
    std::filesystem::create_directories(testDir_);
    path_ = (testDir_ / "records.dat").string();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  std::filesystem::path testDir_;
  std::string path_;
};

TEST_F(RecordFileTest, Open_CreatesEmptyFile) {
  RecordFile file;
  auto result = file.open(path_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_TRUE(file.isOpen());
  EXPECT_EQ(file.getRecordCount(), 0u);
  EXPECT_TRUE(std::filesystem::exists(path_));

  auto records = file.readAll();
  ASSERT_TRUE(records.isOk());
  EXPECT_TRUE(records.value().empty());
}

TEST_F(RecordFileTest, Append_ReturnsIndexAndReadsBackInOrder) {
  RecordFile file;
  ASSERT_TRUE(file.open(path_).isOk());

  auto first = file.append("alpha");
  auto second = file.append(std::string("be\0ta", 5));
  auto third = file.append("");
  ASSERT_TRUE(first.isOk());
  ASSERT_TRUE(second.isOk());
  ASSERT_TRUE(third.isOk());
  EXPECT_EQ(first.value(), 0u);
  EXPECT_EQ(second.value(), 1u);
  EXPECT_EQ(third.value(), 2u);

  auto records = file.readAll();
  ASSERT_TRUE(records.isOk());
  ASSERT_EQ(records.value().size(), 3u);
  EXPECT_EQ(records.value()[0], "alpha");
  EXPECT_EQ(records.value()[1], std::string("be\0ta", 5));
  EXPECT_EQ(records.value()[2], "");
}

TEST_F(RecordFileTest, Reopen_KeepsRecords) {
  {
    RecordFile file;
    ASSERT_TRUE(file.open(path_).isOk());
    ASSERT_TRUE(file.append("one").isOk());
    ASSERT_TRUE(file.append("two").isOk());
  }

  RecordFile file;
  ASSERT_TRUE(file.open(path_).isOk());
  EXPECT_EQ(file.getRecordCount(), 2u);
  ASSERT_TRUE(file.append("three").isOk());

  auto records = file.readAll();
  ASSERT_TRUE(records.isOk());
  ASSERT_EQ(records.value().size(), 3u);
  EXPECT_EQ(records.value()[2], "three");
}

TEST_F(RecordFileTest, Open_TruncatesTornAppend) {
  {
    RecordFile file;
    ASSERT_TRUE(file.open(path_).isOk());
    ASSERT_TRUE(file.append("complete").isOk());
  }
  auto intactSize = std::filesystem::file_size(path_);
  {
    // Bytes written without bumping the header count
    std::ofstream out(path_, std::ios::binary | std::ios::app);
    out << "partial record";
  }
  ASSERT_GT(std::filesystem::file_size(path_), intactSize);

  RecordFile file;
  ASSERT_TRUE(file.open(path_).isOk());
  EXPECT_EQ(file.getRecordCount(), 1u);
  EXPECT_EQ(std::filesystem::file_size(path_), intactSize);

  ASSERT_TRUE(file.append("next").isOk());
  auto records = file.readAll();
  ASSERT_TRUE(records.isOk());
  ASSERT_EQ(records.value().size(), 2u);
  EXPECT_EQ(records.value()[1], "next");
}

TEST_F(RecordFileTest, Open_RejectsForeignFile) {
  {
    std::ofstream out(path_, std::ios::binary);
    out << "this is not a record file at all";
  }
  RecordFile file;
  auto result = file.open(path_);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, RecordFile::E_FORMAT);
}

TEST_F(RecordFileTest, Append_WhenClosedFails) {
  RecordFile file;
  auto result = file.append("data");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, RecordFile::E_STATE);
}
