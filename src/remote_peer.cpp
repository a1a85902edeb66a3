#include "remote_peer.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

RemotePeer::RemotePeer(std::string peer_id, std::shared_ptr<RpcClient> rpc, std::chrono::milliseconds timeout)
  : peer_id_(std::move(peer_id)), rpc_(std::move(rpc)), timeout_(timeout) {}

std::shared_ptr<RemotePeer> RemotePeer::connect(asio::io_context& io,
                                                const PeerRecord& peer,
                                                const std::string& local_id,
                                                std::chrono::milliseconds timeout,
                                                std::shared_ptr<Logger> logger) {
  if(peer.address.empty()) {
    throw PeerUnavailableError(peer.owner, "no address registered");
  }
  auto rpc = RpcClient::connect(io, peer.address, local_id, std::move(logger));
  return std::shared_ptr<RemotePeer>(new RemotePeer(peer.owner, std::move(rpc), timeout));
}

std::vector<std::size_t> RemotePeer::offer(const FileHash& file) {
  auto reply = rpc_->call(make_offer_request(rpc_->next_request_id("offer"), file), timeout_);
  std::vector<std::size_t> chunks;
  if(!reply || is_error_response(*reply)) return chunks;
  try {
    for(const auto& index : reply->at("chunks")) {
      chunks.push_back(index.get<std::size_t>());
    }
  } catch(const nlohmann::json::exception& e) {
    throw PeerUnavailableError(peer_id_, std::string("malformed offer: ") + e.what());
  }
  return chunks;
}

ChunkReply RemotePeer::fetch(const ChunkRequest& request, const CancelToken& cancel) {
  ChunkReply out;
  std::optional<nlohmann::json> reply;
  try {
    reply = rpc_->call(make_chunk_request(rpc_->next_request_id("chunk"),
                                          request.file,
                                          request.index,
                                          request.offset,
                                          request.length),
                       timeout_,
                       cancel);
  } catch(const PeerUnavailableError& e) {
    out.status = FetchStatus::Disconnected;
    out.error = e.what();
    return out;
  }
  if(!reply) {
    out.status = FetchStatus::Cancelled;
    return out;
  }
  if(is_error_response(*reply)) {
    out.status = FetchStatus::Unavailable;
    out.error = reply->at("error").get<std::string>();
    return out;
  }

  std::vector<char> data;
  if(!base64_decode(string_field(*reply, "data"), data)) {
    out.status = FetchStatus::Unavailable;
    out.error = "undecodable chunk payload";
    return out;
  }
  if(sha256_hex(std::string(data.begin(), data.end())) != string_field(*reply, "chunk_sha")) {
    out.status = FetchStatus::Unavailable;
    out.error = "chunk checksum mismatch in transit";
    return out;
  }
  out.status = FetchStatus::Ok;
  out.data = std::move(data);
  return out;
}
