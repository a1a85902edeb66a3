#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "cancel_token.hpp"
#include "connection.hpp"
#include "log.hpp"

// Request/response over one outgoing Connection. Callers block on their own
// thread while the io thread delivers the matching "<type>_response".
class RpcClient : public MessageSink, public std::enable_shared_from_this<RpcClient> {
public:
  // `address` is host:port. Throws PeerUnavailableError.
  static std::shared_ptr<RpcClient> connect(asio::io_context& io,
                                            const std::string& address,
                                            const std::string& local_id,
                                            std::shared_ptr<Logger> logger);
  ~RpcClient() override;

  std::string next_request_id(const std::string& kind);

  // nullopt when `cancel` fires first. Throws PeerUnavailableError when the
  // connection drops or the timeout passes.
  std::optional<nlohmann::json> call(const nlohmann::json& request,
                                     std::chrono::milliseconds timeout,
                                     const CancelToken& cancel = nullptr);
  bool connected() const { return !closed_.load(); }
  void close();
  const std::string& address() const { return address_; }

  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;
  void on_closed(const std::shared_ptr<Connection>& conn) override;

private:
  RpcClient(std::string address, std::string local_id, std::shared_ptr<Logger> logger);

  using Pending = std::shared_ptr<std::promise<nlohmann::json>>;
  void forget(const std::string& request_id);

  std::string address_;
  std::string local_id_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Connection> conn_;
  std::mutex m_;
  std::unordered_map<std::string, Pending> pending_;
  std::atomic<uint64_t> request_counter_{0};
  std::atomic<bool> closed_{false};
};
