#include "tracker_client.hpp"

#include "errors.hpp"
#include "protocol.hpp"

TrackerClient::TrackerClient(asio::io_context& io,
                             std::string tracker_address,
                             std::string local_id,
                             std::string advertised_address,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<Logger> logger)
  : io_(io),
    tracker_address_(std::move(tracker_address)),
    local_id_(std::move(local_id)),
    advertised_address_(std::move(advertised_address)),
    timeout_(timeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tracker-client")) {}

void TrackerClient::connect() {
  session();
}

bool TrackerClient::connected() const {
  std::lock_guard lg(m_);
  return rpc_ && rpc_->connected();
}

std::shared_ptr<RpcClient> TrackerClient::session() {
  std::lock_guard lg(m_);
  if(rpc_ && rpc_->connected()) return rpc_;

  auto rpc = RpcClient::connect(io_, tracker_address_, local_id_, logger_);
  auto hello = make_hello(local_id_, advertised_address_, "peer");
  hello["request_id"] = rpc->next_request_id("hello");
  auto reply = rpc->call(hello, timeout_);
  if(!reply || is_error_response(*reply)) {
    throw PeerUnavailableError(tracker_address_,
                               reply ? reply->at("error").get<std::string>() : "hello interrupted");
  }
  logger_->info("Registered with tracker {} as {}", tracker_address_, local_id_);
  rpc_ = rpc;
  return rpc_;
}

nlohmann::json TrackerClient::call(const std::string& type, nlohmann::json body) {
  auto rpc = session();
  body["type"] = type;
  body["request_id"] = rpc->next_request_id(type);
  auto reply = rpc->call(body, timeout_);
  if(!reply) {
    throw PeerUnavailableError(tracker_address_, type + " interrupted");
  }
  return *reply;
}

void TrackerClient::declare(const Declaration& declaration) {
  nlohmann::json body;
  body["declaration"] = declaration_to_json(declaration);
  auto reply = call("declare", std::move(body));
  if(is_error_response(reply)) {
    throw ProtocolError("tracker rejected declaration: " + reply["error"].get<std::string>());
  }
  logger_->info("Declared {} ({})", declaration.root_name, declaration.root.short_hex());
}

bool TrackerClient::withdraw(const std::optional<TreeHash>& root) {
  nlohmann::json body = nlohmann::json::object();
  if(root) body["root"] = root->to_hex();
  auto reply = call("withdraw", std::move(body));
  if(is_error_response(reply)) {
    throw ProtocolError("tracker rejected withdraw: " + reply["error"].get<std::string>());
  }
  return reply.value("withdrawn", false);
}

std::vector<SearchResult> TrackerClient::search(const std::string& query, const std::string& kind) {
  nlohmann::json body;
  body["query"] = query;
  body["kind"] = kind;
  auto reply = call("search", std::move(body));
  if(is_error_response(reply)) {
    if(reply.value("error_kind", "") == "query") throw QueryError(reply["error"].get<std::string>());
    throw ProtocolError(reply["error"].get<std::string>());
  }
  std::vector<SearchResult> results;
  for(const auto& item : reply.value("results", nlohmann::json::array())) {
    results.push_back(search_result_from_json(item));
  }
  return results;
}

std::optional<IndexEntry> TrackerClient::lookup(const ContentHash& hash) {
  nlohmann::json body;
  body["hash"] = hash.to_hex();
  auto reply = call("lookup", std::move(body));
  if(is_error_response(reply)) return std::nullopt;
  return index_entry_from_json(reply.at("entry"));
}

std::vector<DeclaredRoot> TrackerClient::all_declarations() {
  auto reply = call("all", nlohmann::json::object());
  std::vector<DeclaredRoot> roots;
  for(const auto& item : reply.value("declarations", nlohmann::json::array())) {
    roots.push_back(declared_root_from_json(item));
  }
  return roots;
}

std::vector<PeerRecord> TrackerClient::peer_list(const nlohmann::json& response) const {
  std::vector<PeerRecord> peers;
  for(const auto& item : response.value("peers", nlohmann::json::array())) {
    peers.push_back(peer_record_from_json(item));
  }
  return peers;
}

std::vector<PeerRecord> TrackerClient::peers() {
  return peer_list(call("peers", nlohmann::json::object()));
}

std::optional<TransferPlan> TrackerClient::plan_transfer(const ContentHash& target, const TreeHash& context) {
  nlohmann::json body;
  body["target"] = target.to_hex();
  if(!context.is_zero()) body["context"] = context.to_hex();
  auto reply = call("plan", std::move(body));
  if(is_error_response(reply)) return std::nullopt;
  return transfer_plan_from_json(reply.at("plan"));
}

std::vector<PeerRecord> TrackerClient::seeders(const FileHash& file) {
  nlohmann::json body;
  body["file"] = file.to_hex();
  auto reply = call("seeders", std::move(body));
  if(is_error_response(reply)) return {};
  return peer_list(reply);
}
