#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "indexer.hpp"
#include "log.hpp"
#include "search_engine.hpp"
#include "transfer_coordinator.hpp"
#include "tree_store.hpp"

class SettingsManager;
class ShareService;
class TrackerClient;
class TrackerService;

enum class NodeRole { Peer, Tracker };

// One process worth of treeswarm: settings, the io thread, the listening
// socket and whichever services the role needs. A tracker owns the TreeStore;
// a peer serves its share and downloads through the tracker.
class SwarmNode {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::chrono::seconds expiry_sweep{30};
    bool configure_logging = true;
  };

  SwarmNode(std::shared_ptr<SettingsManager> settings, Options options);
  ~SwarmNode();

  void start();
  void run();
  void start_background();
  void stop();
  // Runs in the background until SIGINT or SIGTERM, then stops. Returns the signal.
  int wait_for_signal();

  // Peer role. Indexes the configured share, serves it and declares it.
  IndexResult publish_share();
  IndexResult publish(const std::filesystem::path& root);
  std::vector<SearchResult> search(const std::string& query, const std::string& kind = "auto");
  std::vector<DeclaredRoot> all_declarations();
  std::optional<IndexEntry> lookup(const ContentHash& hash);
  std::string download(const ContentHash& target, const TreeHash& context = TreeHash{});

  TransferCoordinator& transfers();
  TrackerClient& tracker();
  // Tracker role only.
  std::shared_ptr<TreeStore> tree_store() const { return tree_store_; }

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  NodeRole role() const { return role_; }
  uint16_t listen_port() const { return listen_port_; }
  const std::string& peer_id() const { return peer_id_; }
  std::string address() const;

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void ensure_workspace() const;
  std::filesystem::path workspace_path(const std::string& setting) const;
  void require_peer(const char* operation) const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  bool started_ = false;
  NodeRole role_ = NodeRole::Peer;
  std::string peer_id_;
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<TreeStore> tree_store_;
  std::shared_ptr<TrackerService> tracker_service_;
  std::shared_ptr<ShareService> share_service_;
  std::unique_ptr<TrackerClient> tracker_client_;
  std::unique_ptr<TransferCoordinator> transfers_;
};
