#pragma once

#include <atomic>
#include <memory>

// Shared flag checked by blocking waits and in-flight fetches.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken make_cancel_token() {
  return std::make_shared<std::atomic<bool>>(false);
}

inline bool is_cancelled(const CancelToken& token) {
  return token && token->load();
}
