#pragma once

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "chunk_source.hpp"
#include "log.hpp"
#include "rpc_client.hpp"

// ChunkSource backed by a peer's ShareService.
class RemotePeer : public ChunkSource {
public:
  // Throws PeerUnavailableError when the peer has no address or refuses the connection.
  static std::shared_ptr<RemotePeer> connect(asio::io_context& io,
                                             const PeerRecord& peer,
                                             const std::string& local_id,
                                             std::chrono::milliseconds timeout,
                                             std::shared_ptr<Logger> logger);

  const std::string& peer_id() const override { return peer_id_; }
  std::vector<std::size_t> offer(const FileHash& file) override;
  ChunkReply fetch(const ChunkRequest& request, const CancelToken& cancel) override;

private:
  RemotePeer(std::string peer_id, std::shared_ptr<RpcClient> rpc, std::chrono::milliseconds timeout);

  std::string peer_id_;
  std::shared_ptr<RpcClient> rpc_;
  std::chrono::milliseconds timeout_;
};
