#include "tracker_service.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

TrackerService::TrackerService(asio::io_context& io,
                               std::shared_ptr<TreeStore> store,
                               SearchOptions search_options,
                               std::shared_ptr<Logger> logger)
  : io_(io),
    store_(std::move(store)),
    search_(*store_, search_options, logger),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tracker")) {}

void TrackerService::start(std::chrono::seconds expiry_sweep) {
  if(running_) return;
  running_ = true;
  sweep_interval_ = expiry_sweep.count() > 0 ? expiry_sweep : std::chrono::seconds(30);
  sweep_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_sweep();
}

void TrackerService::stop() {
  running_ = false;
  if(sweep_timer_) {
    sweep_timer_->cancel();
  }
}

void TrackerService::schedule_sweep() {
  if(!sweep_timer_) return;
  sweep_timer_->expires_after(sweep_interval_);
  std::weak_ptr<TrackerService> weak = shared_from_this();
  sweep_timer_->async_wait([weak](const std::error_code& ec){
    auto self = weak.lock();
    if(ec || !self || !self->running_) return;
    self->store_->expire_stale();
    self->schedule_sweep();
  });
}

void TrackerService::on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) {
  if(string_field(message, "type") == "hello") {
    conn->async_send_json(handle_hello(conn, message));
    return;
  }
  conn->async_send_json(handle_request(conn->peer_id(), message));
}

void TrackerService::on_closed(const std::shared_ptr<Connection>& conn) {
  auto owner = conn->peer_id();
  if(owner.empty()) return;
  {
    std::lock_guard lg(m_);
    auto it = live_connections_.find(owner);
    if(it == live_connections_.end()) return;
    if(--it->second > 0) return;
    live_connections_.erase(it);
  }
  store_->mark_offline(owner);
}

nlohmann::json TrackerService::handle_hello(const std::shared_ptr<Connection>& conn, const nlohmann::json& request) {
  std::string owner = string_field(request, "peer_id");
  if(owner.empty()) {
    return make_error_response(request, "hello without peer_id");
  }
  if(!conn->peer_id().empty() && conn->peer_id() != owner) {
    return make_error_response(request, "connection already belongs to " + conn->peer_id());
  }

  // Peers bound to a wildcard address are reachable where they connected from.
  std::string address = string_field(request, "address");
  std::string host;
  uint16_t port = 0;
  if(split_host_port(address, host, port) && (host == "0.0.0.0" || host == "::")) {
    std::string remote_host;
    uint16_t remote_port = 0;
    if(split_host_port(conn->remote_address(), remote_host, remote_port)) {
      address = remote_host + ":" + std::to_string(port);
    }
  }

  if(conn->peer_id().empty()) {
    conn->set_peer_id(owner);
    std::lock_guard lg(m_);
    ++live_connections_[owner];
  }
  store_->register_peer(owner, address);
  auto response = make_response(request);
  response["peer_id"] = owner;
  return response;
}

nlohmann::json TrackerService::handle_request(const std::string& owner, const nlohmann::json& request) {
  const std::string type = string_field(request, "type");
  try {
    if(type == "declare") {
      if(owner.empty()) return make_error_response(request, "declare before hello");
      if(!request.contains("declaration")) throw ProtocolError("declare without declaration");
      auto declaration = declaration_from_json(request.at("declaration"));
      store_->declare(owner, declaration);
      auto response = make_response(request);
      response["root"] = declaration.root.to_hex();
      response["root_name"] = declaration.root_name;
      response["issues"] = declaration.issues.size();
      return response;
    }
    if(type == "withdraw") {
      if(owner.empty()) return make_error_response(request, "withdraw before hello");
      bool withdrawn = request.contains("root")
        ? store_->withdraw(owner, parse_hash_field(request, "root"))
        : store_->withdraw(owner);
      auto response = make_response(request);
      response["withdrawn"] = withdrawn;
      return response;
    }
    if(type == "search") return handle_search(request);
    if(type == "lookup") {
      auto entry = store_->lookup(parse_hash_field(request, "hash"));
      if(!entry) return make_error_response(request, "unknown hash");
      auto response = make_response(request);
      response["entry"] = index_entry_to_json(*entry);
      return response;
    }
    if(type == "all") {
      auto response = make_response(request);
      nlohmann::json roots = nlohmann::json::array();
      for(const auto& root : store_->all_declarations()) roots.push_back(declared_root_to_json(root));
      response["declarations"] = roots;
      return response;
    }
    if(type == "seeders" || type == "peers") {
      auto peers = type == "seeders"
        ? store_->seeders(parse_hash_field(request, "file"))
        : store_->peers();
      auto response = make_response(request);
      nlohmann::json list = nlohmann::json::array();
      for(const auto& peer : peers) list.push_back(peer_record_to_json(peer));
      response["peers"] = list;
      return response;
    }
    if(type == "plan") return handle_plan(request);
  } catch(const QueryError& e) {
    auto response = make_error_response(request, e.what());
    response["error_kind"] = "query";
    return response;
  } catch(const ProtocolError& e) {
    logger_->warn("Rejected {} from {}: {}", type, owner.empty() ? "anonymous" : owner, e.what());
    auto response = make_error_response(request, e.what());
    response["error_kind"] = "protocol";
    return response;
  } catch(const nlohmann::json::exception& e) {
    logger_->warn("Rejected malformed {} from {}: {}", type, owner.empty() ? "anonymous" : owner, e.what());
    auto response = make_error_response(request, std::string("malformed request: ") + e.what());
    response["error_kind"] = "protocol";
    return response;
  }
  return make_error_response(request, "unknown request type '" + type + "'");
}

nlohmann::json TrackerService::handle_search(const nlohmann::json& request) const {
  auto query = make_query(request.value("kind", "auto"), request.value("query", ""));
  auto results = search_.search(query);
  auto response = make_response(request);
  nlohmann::json list = nlohmann::json::array();
  for(const auto& result : results) list.push_back(search_result_to_json(result));
  response["results"] = list;
  return response;
}

nlohmann::json TrackerService::handle_plan(const nlohmann::json& request) {
  auto target = parse_hash_field(request, "target");
  TreeHash context;
  if(request.contains("context")) context = parse_hash_field(request, "context");
  auto plan = store_->plan_transfer(target, context);
  if(!plan) return make_error_response(request, "unknown target");
  auto response = make_response(request);
  response["plan"] = transfer_plan_to_json(*plan);
  return response;
}
