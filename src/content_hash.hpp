#pragma once

#include <openssl/sha.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// 32 byte SHA-256 digest identifying file bytes or a canonical tree node.
struct ContentHash {
  static constexpr std::size_t kSize = SHA256_DIGEST_LENGTH;
  std::array<unsigned char, kSize> bytes{};

  bool operator==(const ContentHash& rhs) const { return bytes == rhs.bytes; }
  bool operator!=(const ContentHash& rhs) const { return bytes != rhs.bytes; }
  bool operator<(const ContentHash& rhs) const { return bytes < rhs.bytes; }

  bool is_zero() const;
  std::string to_hex() const;
  // First 8 hex characters, for log lines and progress output.
  std::string short_hex() const;

  static std::optional<ContentHash> from_hex(std::string_view hex);
  static ContentHash of(const void* data, std::size_t size);
  static ContentHash of(std::string_view data) { return of(data.data(), data.size()); }
};

using FileHash = ContentHash;
using TreeHash = ContentHash;

namespace std {
template<>
struct hash<ContentHash> {
  std::size_t operator()(const ContentHash& h) const noexcept {
    std::size_t out = 0;
    for(std::size_t i = 0; i < sizeof(std::size_t); ++i) {
      out = (out << 8) | h.bytes[i];
    }
    return out;
  }
};
} // namespace std

// Incremental SHA-256 over a byte stream.
class Sha256Stream {
public:
  Sha256Stream();
  void update(const void* data, std::size_t size);
  void update(std::string_view data) { update(data.data(), data.size()); }
  ContentHash finish();

private:
  SHA256_CTX ctx_;
  bool finished_ = false;
};
