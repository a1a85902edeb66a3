#include "rpc_client.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace {
constexpr std::chrono::milliseconds kCallPoll{50};
}

RpcClient::RpcClient(std::string address, std::string local_id, std::shared_ptr<Logger> logger)
  : address_(std::move(address)),
    local_id_(std::move(local_id)),
    logger_(std::move(logger)) {}

std::shared_ptr<RpcClient> RpcClient::connect(asio::io_context& io,
                                              const std::string& address,
                                              const std::string& local_id,
                                              std::shared_ptr<Logger> logger) {
  std::string host;
  uint16_t port = 0;
  if(!split_host_port(address, host, port)) {
    throw PeerUnavailableError(address, "address must be host:port");
  }
  auto client = std::shared_ptr<RpcClient>(new RpcClient(address, local_id, logger));
  client->conn_ = Connection::connect_outgoing(io, host, port, client, std::move(logger));
  return client;
}

RpcClient::~RpcClient() {
  if(conn_) conn_->close();
}

std::string RpcClient::next_request_id(const std::string& kind) {
  return local_id_ + "-" + kind + "-" + std::to_string(++request_counter_);
}

std::optional<nlohmann::json> RpcClient::call(const nlohmann::json& request,
                                              std::chrono::milliseconds timeout,
                                              const CancelToken& cancel) {
  std::string request_id = request.value("request_id", "");
  std::string type = request.value("type", "");
  auto promise = std::make_shared<std::promise<nlohmann::json>>();
  auto future = promise->get_future();
  {
    std::lock_guard lg(m_);
    if(closed_.load()) {
      throw PeerUnavailableError(address_, "connection closed");
    }
    pending_[request_id] = promise;
  }
  conn_->async_send_json(request);

  auto deadline = std::chrono::steady_clock::now() + timeout;
  for(;;) {
    if(future.wait_for(kCallPoll) == std::future_status::ready) {
      return future.get();
    }
    if(is_cancelled(cancel)) {
      forget(request_id);
      return std::nullopt;
    }
    if(std::chrono::steady_clock::now() >= deadline) {
      forget(request_id);
      throw PeerUnavailableError(address_, type + " request timed out");
    }
  }
}

void RpcClient::forget(const std::string& request_id) {
  std::lock_guard lg(m_);
  pending_.erase(request_id);
}

void RpcClient::close() {
  if(conn_) conn_->close();
}

void RpcClient::on_message(const std::shared_ptr<Connection>&, const nlohmann::json& message) {
  std::string request_id = string_field(message, "request_id");
  Pending pending;
  {
    std::lock_guard lg(m_);
    auto it = pending_.find(request_id);
    if(it == pending_.end()) {
      log_debug(logger_.get(), "Dropping unmatched {} from {}", string_field(message, "type"), address_);
      return;
    }
    pending = std::move(it->second);
    pending_.erase(it);
  }
  pending->set_value(message);
}

void RpcClient::on_closed(const std::shared_ptr<Connection>&) {
  std::unordered_map<std::string, Pending> orphaned;
  {
    std::lock_guard lg(m_);
    closed_.store(true);
    orphaned.swap(pending_);
  }
  for(auto& [id, pending] : orphaned) {
    pending->set_exception(std::make_exception_ptr(PeerUnavailableError(address_, "connection closed")));
  }
  log_debug(logger_.get(), "Connection to {} closed", address_);
}
