#pragma once

// keystone/clock.hpp — Wall-clock source for timestamps and TTL decisions.
//
// Every component that stamps records or evaluates expiry takes a Clock so
// TTL sweeps and expiry can be driven deterministically in tests.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace keystone {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t now_unix_ms() const = 0;
};

class SystemClock : public Clock {
 public:
  uint64_t now_unix_ms() const override {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  }
};

// Manually advanced clock.
class ManualClock : public Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 1'700'000'000'000ULL) : now_(start_ms) {}
  uint64_t now_unix_ms() const override { return now_.load(std::memory_order_acquire); }
  void set(uint64_t ms) { now_.store(ms, std::memory_order_release); }
  void advance(uint64_t delta_ms) { now_.fetch_add(delta_ms, std::memory_order_acq_rel); }

 private:
  std::atomic<uint64_t> now_;
};

inline std::shared_ptr<Clock> system_clock() {
  static std::shared_ptr<Clock> inst = std::make_shared<SystemClock>();
  return inst;
}

}  // namespace keystone
