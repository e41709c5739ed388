#ifndef UTIL_CLOCK_HPP
#define UTIL_CLOCK_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace util {

// Source of wall-clock timestamps, in milliseconds since the epoch.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual int64_t NowMillis() = 0;
};

class SystemClock : public Clock {
 public:
  int64_t NowMillis() override;
};

// Source of unique identifiers for executions and sandboxes.
class IdGenerator {
 public:
  virtual ~IdGenerator() = default;
  virtual std::string NextId(const std::string& prefix) = 0;
};

// prefix-<16 random hex digits>.
class RandomIdGenerator : public IdGenerator {
 public:
  RandomIdGenerator();
  std::string NextId(const std::string& prefix) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 rng_;
};

// prefix-1, prefix-2, ... Used by tests.
class SequentialIdGenerator : public IdGenerator {
 public:
  std::string NextId(const std::string& prefix) override {
    return prefix + "-" + std::to_string(++next_);
  }

 private:
  std::atomic<uint64_t> next_{0};
};

// Manually advanced clock. Used by tests.
class FakeClock : public Clock {
 public:
  explicit FakeClock(int64_t start = 1700000000000) : now_(start) {}
  int64_t NowMillis() override { return now_; }
  void Advance(int64_t millis) { now_ += millis; }

 private:
  std::atomic<int64_t> now_;
};

}  // namespace util

#endif
