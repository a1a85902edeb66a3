#pragma once

#include <asio.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "connection.hpp"
#include "log.hpp"
#include "search_engine.hpp"
#include "tree_store.hpp"

// Tracker side of the wire protocol: owners say hello, declare and withdraw
// roots; anyone may search, look up, list and plan. An owner whose last
// connection closes goes offline and is withdrawn once the expiry passes.
class TrackerService : public MessageSink, public std::enable_shared_from_this<TrackerService> {
public:
  TrackerService(asio::io_context& io,
                 std::shared_ptr<TreeStore> store,
                 SearchOptions search_options = {},
                 std::shared_ptr<Logger> logger = nullptr);

  void start(std::chrono::seconds expiry_sweep = std::chrono::seconds(30));
  void stop();

  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;
  void on_closed(const std::shared_ptr<Connection>& conn) override;

  // `owner` is whoever said hello on the requesting connection, empty if nobody did.
  nlohmann::json handle_request(const std::string& owner, const nlohmann::json& request);

  TreeStore& store() { return *store_; }

private:
  nlohmann::json handle_hello(const std::shared_ptr<Connection>& conn, const nlohmann::json& request);
  nlohmann::json handle_search(const nlohmann::json& request) const;
  nlohmann::json handle_plan(const nlohmann::json& request);
  void schedule_sweep();

  asio::io_context& io_;
  std::shared_ptr<TreeStore> store_;
  SearchEngine search_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::chrono::seconds sweep_interval_{30};
  bool running_ = false;
  std::mutex m_;
  std::map<std::string, std::size_t> live_connections_;
};
