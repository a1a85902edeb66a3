#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

#include "cancel_token.hpp"

// Token bucket refilled continuously at `rate` bytes/sec up to `burst`.
// A rate of 0 disables limiting. Grants never block: a caller that is refused
// asks time_until() and comes back later. A grant larger than the burst waits
// for a full bucket and leaves it in debt, so over any interval t the bytes
// granted stay within burst + rate * t plus one oversized grant.
class TokenBucket {
public:
  explicit TokenBucket(uint64_t rate_bytes_per_sec = 0, uint64_t burst_bytes = 0);

  bool try_acquire(uint64_t bytes);
  // Returns tokens taken by a grant that was not used.
  void refund(uint64_t bytes);
  // Zero when try_acquire(bytes) would succeed now.
  std::chrono::steady_clock::duration time_until(uint64_t bytes) const;

  void set_rate(uint64_t rate_bytes_per_sec, uint64_t burst_bytes = 0);
  uint64_t rate() const;
  uint64_t burst() const;
  bool unlimited() const { return rate() == 0; }

private:
  void refill_locked(std::chrono::steady_clock::time_point now);

  mutable std::mutex m_;
  uint64_t rate_ = 0;
  uint64_t burst_ = 0;
  double tokens_ = 0.0;
  std::chrono::steady_clock::time_point last_refill_;
};

// Counting admission gate served in arrival order.
class SlotGate {
public:
  explicit SlotGate(std::size_t slots);

  // Returns false when cancelled while queued.
  bool acquire(const CancelToken& cancel = nullptr);
  void release();

  void set_slots(std::size_t slots);
  std::size_t active() const;
  std::size_t waiting() const;

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::size_t slots_;
  std::size_t active_ = 0;
  uint64_t next_ticket_ = 0;
  std::deque<uint64_t> queue_;
};

// Bytes/sec over a sliding window.
class RateMeter {
public:
  explicit RateMeter(std::chrono::milliseconds window = std::chrono::milliseconds(3000));

  void record(uint64_t bytes);
  double rate() const;

private:
  void trim_locked(std::chrono::steady_clock::time_point now) const;

  std::chrono::milliseconds window_;
  mutable std::mutex m_;
  mutable std::deque<std::pair<std::chrono::steady_clock::time_point, uint64_t>> samples_;
  std::chrono::steady_clock::time_point started_;
};
