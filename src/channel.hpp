#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Unbounded multi-producer queue. After close() pushes are dropped and pop()
// drains what is left, then returns nullopt.
template<typename T>
class Channel {
public:
  bool push(T value) {
    {
      std::lock_guard lg(m_);
      if(closed_) return false;
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock lock(m_);
    cv_.wait(lock, [this]{ return closed_ || !queue_.empty(); });
    return take_locked();
  }

  template<typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(m_);
    cv_.wait_for(lock, timeout, [this]{ return closed_ || !queue_.empty(); });
    return take_locked();
  }

  void close() {
    {
      std::lock_guard lg(m_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard lg(m_);
    return closed_;
  }

private:
  std::optional<T> take_locked() {
    if(queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};
