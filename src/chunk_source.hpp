#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cancel_token.hpp"
#include "content_directory.hpp"

enum class FetchStatus { Ok, Unavailable, Disconnected, Cancelled };

const char* fetch_status_name(FetchStatus status);

struct ChunkRequest {
  FileHash file;
  std::size_t index = 0; // chunk number in the file's manifest
  uint64_t offset = 0;
  uint32_t length = 0;
};

struct ChunkReply {
  FetchStatus status = FetchStatus::Unavailable;
  std::vector<char> data;
  std::string error;
};

// One peer's side of the chunk protocol. A peer that cannot serve a chunk
// answers Unavailable and stays usable for other chunks.
class ChunkSource {
public:
  virtual ~ChunkSource() = default;

  virtual const std::string& peer_id() const = 0;
  // Chunk numbers of `file` this peer can serve. Throws PeerUnavailableError
  // when the peer cannot be reached at all.
  virtual std::vector<std::size_t> offer(const FileHash& file) = 0;
  // Blocks until the bytes arrive, the peer refuses, or `cancel` is set.
  virtual ChunkReply fetch(const ChunkRequest& request, const CancelToken& cancel) = 0;
};

// Shares one ChunkSource per peer across transfers. A source lives as long as
// some transfer holds it; the next acquire after that opens a fresh one.
class PeerPool {
public:
  // Throws PeerUnavailableError.
  using SourceFactory = std::function<std::shared_ptr<ChunkSource>(const PeerRecord&)>;

  explicit PeerPool(SourceFactory factory);

  std::shared_ptr<ChunkSource> acquire(const PeerRecord& peer);
  std::size_t open_count() const;
  // Entries kept, live or not yet swept.
  std::size_t tracked_count() const;

private:
  SourceFactory factory_;
  mutable std::mutex m_;
  std::map<std::string, std::weak_ptr<ChunkSource>> sources_;
};
