#include "../ResultOrError.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace cb;

namespace {

struct TestError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, TestError>;

Roe<int> half(int value) {
  if (value % 2 != 0) {
    return TestError(7, "odd value " + std::to_string(value));
  }
  return value / 2;
}

Roe<void> checkPositive(int value) {
  if (value <= 0) {
    return TestError(3, "not positive");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = half(10);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.isError());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 5);
  EXPECT_EQ(*result, 5);
  EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = half(3);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 7);
  EXPECT_EQ(result.error().message, "odd value 3");
  EXPECT_EQ(result.valueOr(-1), -1);
  EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, CopyAndMoveKeepState) {
  Roe<std::vector<std::string>> original(std::vector<std::string>{ "a", "b" });
  auto copy = original;
  ASSERT_TRUE(copy.isOk());
  EXPECT_EQ(copy->size(), 2u);

  auto moved = std::move(copy);
  EXPECT_EQ(moved.value()[1], "b");

  Roe<std::vector<std::string>> failed = TestError(1, "nope");
  moved = failed;
  ASSERT_TRUE(moved.isError());
  EXPECT_EQ(moved.error().message, "nope");
}

TEST(ResultOrErrorTest, MoveOnlyValue) {
  Roe<std::unique_ptr<int>> result(std::make_unique<int>(42));
  ASSERT_TRUE(result.isOk());
  std::unique_ptr<int> owned = std::move(result.value());
  EXPECT_EQ(*owned, 42);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
  EXPECT_TRUE(checkPositive(1).isOk());
  auto result = checkPositive(0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 3);

  Roe<void> defaulted;
  EXPECT_TRUE(defaulted.isOk());
}
