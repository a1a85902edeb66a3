#pragma once

#include <map>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "connection.hpp"
#include "indexer.hpp"
#include "log.hpp"

// Serves chunks of the locally indexed share. Anything it cannot serve is
// answered with an "unavailable" error; the connection stays up.
class ShareService : public MessageSink {
public:
  static constexpr uint32_t kMaxServedChunk = 16 * 1024 * 1024;

  explicit ShareService(std::shared_ptr<Logger> logger = nullptr);

  // Replaces everything served with the files of `result`.
  void publish(const IndexResult& result);
  std::size_t file_count() const;

  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;

  nlohmann::json handle_request(const nlohmann::json& request) const;

private:
  nlohmann::json handle_offer(const nlohmann::json& request) const;
  nlohmann::json handle_chunk(const nlohmann::json& request) const;
  bool find(const FileHash& hash, LocalFile& out) const;

  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::map<FileHash, LocalFile> files_;
};
