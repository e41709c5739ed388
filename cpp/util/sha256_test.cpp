#include "util/sha256.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(SHA256, Empty) {
  EXPECT_EQ(util::SHA256::Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// NOLINTNEXTLINE
TEST(SHA256, Abc) {
  EXPECT_EQ(util::SHA256::Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// NOLINTNEXTLINE
TEST(SHA256, MultiBlock) {
  EXPECT_EQ(
      util::SHA256::Hex(
          "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
      "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// NOLINTNEXTLINE
TEST(SHA256, IncrementalMatchesOneShot) {
  std::string data(1000, 'a');
  util::SHA256 hasher;
  hasher.Update(data.substr(0, 3));
  hasher.Update(data.substr(3, 500));
  hasher.Update(data.substr(503));
  EXPECT_EQ(hasher.FinishHex(), util::SHA256::Hex(data));
}

// NOLINTNEXTLINE
TEST(SHA256, MillionA) {
  util::SHA256 hasher;
  std::string chunk(1000, 'a');
  for (int i = 0; i < 1000; i++) hasher.Update(chunk);
  EXPECT_EQ(hasher.FinishHex(),
            "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// NOLINTNEXTLINE
TEST(SHA256, ResetStartsOver) {
  util::SHA256 hasher;
  hasher.Update("garbage");
  hasher.Reset();
  hasher.Update("abc");
  EXPECT_EQ(hasher.FinishHex(), util::SHA256::Hex("abc"));
}

}  // namespace
