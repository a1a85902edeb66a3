#include "rate_limiter.hpp"

#include <algorithm>
#include <limits>

namespace {
// Queued slot waiters wake at least this often to observe cancellation.
constexpr std::chrono::milliseconds kPollInterval{50};
}

TokenBucket::TokenBucket(uint64_t rate_bytes_per_sec, uint64_t burst_bytes)
  : last_refill_(std::chrono::steady_clock::now()) {
  set_rate(rate_bytes_per_sec, burst_bytes);
  tokens_ = static_cast<double>(burst_);
}

void TokenBucket::set_rate(uint64_t rate_bytes_per_sec, uint64_t burst_bytes) {
  std::lock_guard lg(m_);
  refill_locked(std::chrono::steady_clock::now());
  rate_ = rate_bytes_per_sec;
  burst_ = burst_bytes ? burst_bytes : std::max<uint64_t>(rate_bytes_per_sec, 1);
  tokens_ = std::min(tokens_, static_cast<double>(burst_));
}

uint64_t TokenBucket::rate() const {
  std::lock_guard lg(m_);
  return rate_;
}

uint64_t TokenBucket::burst() const {
  std::lock_guard lg(m_);
  return burst_;
}

void TokenBucket::refill_locked(std::chrono::steady_clock::time_point now) {
  std::chrono::duration<double> elapsed = now - last_refill_;
  last_refill_ = now;
  if(rate_ == 0) return;
  tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed.count() * static_cast<double>(rate_));
}

bool TokenBucket::try_acquire(uint64_t bytes) {
  std::lock_guard lg(m_);
  if(rate_ == 0) return true;
  refill_locked(std::chrono::steady_clock::now());
  if(tokens_ < static_cast<double>(std::min(bytes, burst_))) return false;
  tokens_ -= static_cast<double>(bytes);
  return true;
}

void TokenBucket::refund(uint64_t bytes) {
  std::lock_guard lg(m_);
  if(rate_ == 0) return;
  tokens_ = std::min(static_cast<double>(burst_), tokens_ + static_cast<double>(bytes));
}

std::chrono::steady_clock::duration TokenBucket::time_until(uint64_t bytes) const {
  std::lock_guard lg(m_);
  if(rate_ == 0) return std::chrono::steady_clock::duration::zero();
  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - last_refill_;
  double tokens = std::min(static_cast<double>(burst_), tokens_ + elapsed.count() * static_cast<double>(rate_));
  double deficit = static_cast<double>(std::min(bytes, burst_)) - tokens;
  if(deficit <= 0.0) return std::chrono::steady_clock::duration::zero();
  std::chrono::duration<double> wait(deficit / static_cast<double>(rate_));
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(wait) + std::chrono::milliseconds(1);
}

SlotGate::SlotGate(std::size_t slots)
  : slots_(slots ? slots : std::numeric_limits<std::size_t>::max()) {}

bool SlotGate::acquire(const CancelToken& cancel) {
  std::unique_lock lock(m_);
  uint64_t ticket = next_ticket_++;
  queue_.push_back(ticket);
  for(;;) {
    if(is_cancelled(cancel)) {
      queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
      lock.unlock();
      cv_.notify_all();
      return false;
    }
    if(queue_.front() == ticket && active_ < slots_) {
      queue_.pop_front();
      ++active_;
      lock.unlock();
      cv_.notify_all();
      return true;
    }
    cv_.wait_for(lock, kPollInterval);
  }
}

void SlotGate::release() {
  {
    std::lock_guard lg(m_);
    if(active_ > 0) --active_;
  }
  cv_.notify_all();
}

void SlotGate::set_slots(std::size_t slots) {
  {
    std::lock_guard lg(m_);
    slots_ = slots ? slots : std::numeric_limits<std::size_t>::max();
  }
  cv_.notify_all();
}

std::size_t SlotGate::active() const {
  std::lock_guard lg(m_);
  return active_;
}

std::size_t SlotGate::waiting() const {
  std::lock_guard lg(m_);
  return queue_.size();
}

RateMeter::RateMeter(std::chrono::milliseconds window)
  : window_(window), started_(std::chrono::steady_clock::now()) {}

void RateMeter::record(uint64_t bytes) {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard lg(m_);
  samples_.emplace_back(now, bytes);
  trim_locked(now);
}

void RateMeter::trim_locked(std::chrono::steady_clock::time_point now) const {
  while(!samples_.empty() && now - samples_.front().first > window_) {
    samples_.pop_front();
  }
}

double RateMeter::rate() const {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard lg(m_);
  trim_locked(now);
  uint64_t total = 0;
  for(const auto& sample : samples_) total += sample.second;
  auto span = std::min<std::chrono::steady_clock::duration>(now - started_, window_);
  span = std::max<std::chrono::steady_clock::duration>(span, std::chrono::milliseconds(250));
  return static_cast<double>(total) / std::chrono::duration<double>(span).count();
}
