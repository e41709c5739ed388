#include "util/sha256.hpp"

#include <kj/debug.h>
#include <algorithm>
#include <cstring>

namespace {

const uint32_t sha256_k[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

inline uint32_t Rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }
inline uint32_t Ch(uint32_t x, uint32_t y, uint32_t z) {
  return (x & y) ^ (~x & z);
}
inline uint32_t Maj(uint32_t x, uint32_t y, uint32_t z) {
  return (x & y) ^ (x & z) ^ (y & z);
}
inline uint32_t F1(uint32_t x) { return Rotr(x, 2) ^ Rotr(x, 13) ^ Rotr(x, 22); }
inline uint32_t F2(uint32_t x) { return Rotr(x, 6) ^ Rotr(x, 11) ^ Rotr(x, 25); }
inline uint32_t F3(uint32_t x) { return Rotr(x, 7) ^ Rotr(x, 18) ^ (x >> 3); }
inline uint32_t F4(uint32_t x) {
  return Rotr(x, 17) ^ Rotr(x, 19) ^ (x >> 10);
}

inline uint32_t Load32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline void Store32(uint32_t x, uint8_t* p) {
  p[0] = static_cast<uint8_t>(x >> 24);
  p[1] = static_cast<uint8_t>(x >> 16);
  p[2] = static_cast<uint8_t>(x >> 8);
  p[3] = static_cast<uint8_t>(x);
}

const char* kHexDigits = "0123456789abcdef";

}  // namespace

namespace util {

void SHA256::Reset() {
  static const uint32_t kInit[8] = {0x6a09e667, 0xbb67ae85, 0x3c6ef372,
                                    0xa54ff53a, 0x510e527f, 0x9b05688c,
                                    0x1f83d9ab, 0x5be0cd19};
  memcpy(state_, kInit, sizeof(state_));
  buffered_ = 0;
  total_ = 0;
}

void SHA256::Compress(const uint8_t* block) {
  uint32_t w[64];
  for (int i = 0; i < 16; i++) w[i] = Load32(block + 4 * i);
  for (int i = 16; i < 64; i++) {
    w[i] = F4(w[i - 2]) + w[i - 7] + F3(w[i - 15]) + w[i - 16];
  }
  uint32_t v[8];
  memcpy(v, state_, sizeof(v));
  for (int i = 0; i < 64; i++) {
    uint32_t t1 = v[7] + F2(v[4]) + Ch(v[4], v[5], v[6]) + sha256_k[i] + w[i];
    uint32_t t2 = F1(v[0]) + Maj(v[0], v[1], v[2]);
    memmove(v + 1, v, 7 * sizeof(uint32_t));
    v[4] += t1;
    v[0] = t1 + t2;
  }
  for (int i = 0; i < 8; i++) state_[i] += v[i];
}

void SHA256::Update(const uint8_t* data, size_t len) {
  total_ += len;
  if (buffered_ > 0) {
    size_t take = std::min(len, kBlockSize - buffered_);
    memcpy(buffer_ + buffered_, data, take);
    buffered_ += take;
    data += take;
    len -= take;
    if (buffered_ < kBlockSize) return;
    Compress(buffer_);
    buffered_ = 0;
  }
  for (; len >= kBlockSize; data += kBlockSize, len -= kBlockSize) {
    Compress(data);
  }
  memcpy(buffer_, data, len);
  buffered_ = len;
}

SHA256::Digest SHA256::Finish() {
  uint64_t bits = total_ * 8;
  uint8_t pad[kBlockSize * 2] = {0x80};
  size_t pad_len = (buffered_ < 56 ? 56 : 120) - buffered_;
  for (int i = 0; i < 8; i++) {
    pad[pad_len + i] = static_cast<uint8_t>(bits >> (56 - 8 * i));
  }
  Update(pad, pad_len + 8);
  KJ_DASSERT(buffered_ == 0);
  Digest digest;
  for (int i = 0; i < 8; i++) Store32(state_[i], digest.data() + 4 * i);
  return digest;
}

std::string SHA256::ToHex(const Digest& digest) {
  std::string res(2 * kDigestSize, '0');
  for (size_t i = 0; i < kDigestSize; i++) {
    res[2 * i] = kHexDigits[digest[i] >> 4];
    res[2 * i + 1] = kHexDigits[digest[i] & 0xf];
  }
  return res;
}

std::string SHA256::Hex(const std::string& data) {
  SHA256 hasher;
  hasher.Update(data);
  return hasher.FinishHex();
}

}  // namespace util
