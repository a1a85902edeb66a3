#include "content_hash.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "utils.hpp"

bool ContentHash::is_zero() const {
  return std::all_of(bytes.begin(), bytes.end(), [](unsigned char b){ return b == 0; });
}

std::string ContentHash::to_hex() const {
  return hex_from_bytes(bytes.data(), bytes.size());
}

std::string ContentHash::short_hex() const {
  return to_hex().substr(0, 8);
}

std::optional<ContentHash> ContentHash::from_hex(std::string_view hex) {
  if(hex.size() != kSize * 2) return std::nullopt;
  std::vector<unsigned char> raw;
  if(!bytes_from_hex(hex, raw)) return std::nullopt;
  ContentHash out;
  std::copy(raw.begin(), raw.end(), out.bytes.begin());
  return out;
}

ContentHash ContentHash::of(const void* data, std::size_t size) {
  ContentHash out;
  SHA256(static_cast<const unsigned char*>(data), size, out.bytes.data());
  return out;
}

Sha256Stream::Sha256Stream() {
  if(SHA256_Init(&ctx_) != 1) {
    throw std::runtime_error("SHA256_Init failed");
  }
}

void Sha256Stream::update(const void* data, std::size_t size) {
  if(finished_) throw std::logic_error("Sha256Stream already finished");
  if(size == 0) return;
  if(SHA256_Update(&ctx_, data, size) != 1) {
    throw std::runtime_error("SHA256_Update failed");
  }
}

ContentHash Sha256Stream::finish() {
  if(finished_) throw std::logic_error("Sha256Stream already finished");
  finished_ = true;
  ContentHash out;
  if(SHA256_Final(out.bytes.data(), &ctx_) != 1) {
    throw std::runtime_error("SHA256_Final failed");
  }
  return out;
}
