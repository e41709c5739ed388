#ifndef UTIL_SHA256_HPP
#define UTIL_SHA256_HPP

#include <kj/common.h>
#include <array>
#include <cstdint>
#include <string>

namespace util {

// Incremental SHA-256, used to fingerprint submitted programs in audit events.
class SHA256 {
 public:
  static const constexpr size_t kDigestSize = 32;
  using Digest = std::array<uint8_t, kDigestSize>;

  SHA256() { Reset(); }
  KJ_DISALLOW_COPY(SHA256);

  void Reset();
  void Update(const uint8_t* data, size_t len);
  void Update(const std::string& data) {
    Update(reinterpret_cast<const uint8_t*>(data.data()),  // NOLINT
           data.size());
  }

  // Pads the message and returns the digest. The hasher must be Reset before
  // it is used again.
  Digest Finish();
  std::string FinishHex() { return ToHex(Finish()); }

  static std::string ToHex(const Digest& digest);

  // Hex digest of a single string.
  static std::string Hex(const std::string& data);

 private:
  static const constexpr size_t kBlockSize = 64;
  void Compress(const uint8_t* block);

  uint32_t state_[8];
  uint8_t buffer_[kBlockSize];
  size_t buffered_ = 0;
  uint64_t total_ = 0;
};

}  // namespace util

#endif
