#include "util/clock.hpp"

#include <chrono>

namespace util {

int64_t SystemClock::NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

RandomIdGenerator::RandomIdGenerator() : rng_(std::random_device{}()) {}

std::string RandomIdGenerator::NextId(const std::string& prefix) {
  static const char* kHex = "0123456789abcdef";
  uint64_t value;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    value = rng_();
  }
  std::string id = prefix + "-";
  for (int i = 15; i >= 0; i--) id += kHex[(value >> (4 * i)) & 0xf];
  return id;
}

}  // namespace util
