#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "this is some text";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"this", "is", "some", "text"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "  wow  much lol  ";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"wow", "much", "lol"}));
}

// NOLINTNEXTLINE
TEST(Misc, Join) {
  EXPECT_EQ(util::join({"a", "b", "c"}, ", "), "a, b, c");
  EXPECT_EQ(util::join({}, ", "), "");
}

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  util::setBool(&x)();
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  util::setString(&x)("wow");
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, AppendString) {
  std::vector<std::string> x;
  util::appendString(&x)("numpy");
  util::appendString(&x)("pandas==2.1.0");
  EXPECT_THAT(x, ElementsAre("numpy", "pandas==2.1.0"));
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int32_t x = 0;
  util::setInt(&x)("42");
  EXPECT_EQ(x, 42);
}

// NOLINTNEXTLINE
TEST(Misc, SetUInt) {
  uint32_t x = 0;
  util::setUint(&x)("42");
  EXPECT_EQ(x, 42);
}

// NOLINTNEXTLINE
TEST(Misc, SetDouble) {
  double x = 0;
  util::setDouble(&x)("0.5");
  EXPECT_DOUBLE_EQ(x, 0.5);
}

// NOLINTNEXTLINE
TEST(Misc, SetIntRejectsGarbage) {
  int32_t x = 0;
  EXPECT_ANY_THROW(util::setInt(&x)("forty"));  // NOLINT
}

}  // namespace
