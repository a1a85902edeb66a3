#pragma once

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "content_directory.hpp"
#include "log.hpp"
#include "rpc_client.hpp"
#include "search_engine.hpp"
#include "tree_store.hpp"

// A peer's view of the tracker. Reconnects and says hello again on demand;
// every call throws PeerUnavailableError when the tracker cannot be reached.
class TrackerClient : public ContentDirectory {
public:
  TrackerClient(asio::io_context& io,
                std::string tracker_address,
                std::string local_id,
                std::string advertised_address,
                std::chrono::milliseconds timeout = std::chrono::seconds(30),
                std::shared_ptr<Logger> logger = nullptr);

  void connect();
  bool connected() const;

  // Throws ProtocolError when the tracker rejects the declaration.
  void declare(const Declaration& declaration);
  bool withdraw(const std::optional<TreeHash>& root = std::nullopt);
  // Throws QueryError for a query the tracker refuses.
  std::vector<SearchResult> search(const std::string& query, const std::string& kind = "auto");
  std::optional<IndexEntry> lookup(const ContentHash& hash);
  std::vector<DeclaredRoot> all_declarations();
  std::vector<PeerRecord> peers();

  std::optional<TransferPlan> plan_transfer(const ContentHash& target,
                                            const TreeHash& context) override;
  std::vector<PeerRecord> seeders(const FileHash& file) override;

private:
  std::shared_ptr<RpcClient> session();
  nlohmann::json call(const std::string& type, nlohmann::json body);
  std::vector<PeerRecord> peer_list(const nlohmann::json& response) const;

  asio::io_context& io_;
  std::string tracker_address_;
  std::string local_id_;
  std::string advertised_address_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::shared_ptr<RpcClient> rpc_;
};
