#include "swarm_node.hpp"

#include <unistd.h>

#include <algorithm>
#include <csignal>
#include <future>
#include <stdexcept>

#include "connection.hpp"
#include "errors.hpp"
#include "remote_peer.hpp"
#include "settings_manager.hpp"
#include "share_service.hpp"
#include "tracker_client.hpp"
#include "tracker_service.hpp"
#include "tree_store.hpp"

namespace {

std::string default_peer_id() {
  char hostname[256] = {0};
  if(gethostname(hostname, sizeof(hostname) - 1) != 0) {
    return "peer-" + std::to_string(getpid());
  }
  return std::string(hostname) + "-" + std::to_string(getpid());
}

std::size_t setting_count(const SettingsManager& settings, const std::string& key) {
  return static_cast<std::size_t>(std::max(0, settings.get<int>(key)));
}

} // namespace

SwarmNode::SwarmNode(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("node")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

SwarmNode::~SwarmNode() {
  stop();
}

void SwarmNode::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(ec) {
    throw FilesystemError(options_.workspace_root.string(), ec.message());
  }
}

std::filesystem::path SwarmNode::workspace_path(const std::string& setting) const {
  std::filesystem::path value = settings_->get<std::string>(setting);
  return value.is_absolute() ? value : options_.workspace_root / value;
}

void SwarmNode::start() {
  if(started_) return;

  ensure_workspace();
  if(options_.configure_logging) {
    LogOptions log_options;
    log_options.verbose = settings_->get<bool>("verbose");
    if(!settings_->get<std::string>("log_file").empty()) {
      log_options.file = workspace_path("log_file");
    }
    init(log_options);
  }

  peer_id_ = settings_->get<std::string>("peer_id");
  if(peer_id_.empty()) {
    peer_id_ = default_peer_id();
  }
  logger_->set_name(peer_id_);
  role_ = settings_->get<std::string>("role") == "tracker" ? NodeRole::Tracker : NodeRole::Peer;

  listen_ip_ = settings_->get<std::string>("listen_ip");
  int listen_port_value = settings_->get<int>("listen_port");
  if(listen_port_value < 0 || listen_port_value > 65535) {
    logger_->error("Invalid listen_port '{}'", listen_port_value);
    throw std::invalid_argument("Invalid listen_port");
  }
  listen_port_ = static_cast<uint16_t>(listen_port_value);

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(listen_ip_);
  } catch(const std::system_error& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  if(listen_port_ == 0) {
    listen_port_ = acceptor_->local_endpoint().port();
  }

  auto request_timeout = std::chrono::milliseconds(std::max(1, settings_->get<int>("request_timeout_ms")));

  if(role_ == NodeRole::Tracker) {
    TreeStoreOptions store_options;
    store_options.owner_expiry = std::chrono::seconds(std::max(0, settings_->get<int>("owner_expiry_seconds")));
    if(auto policy = parse_tie_break_policy(settings_->get<std::string>("tie_break_policy"))) {
      store_options.tie_break = *policy;
    }
    tree_store_ = std::make_shared<TreeStore>(store_options, std::make_shared<Logger>("tree-store"));

    SearchOptions search_options;
    search_options.sibling_limit = setting_count(*settings_, "sibling_summary_limit");
    tracker_service_ = std::make_shared<TrackerService>(io_, tree_store_, search_options,
                                                        std::make_shared<Logger>("tracker"));
    tracker_service_->start(options_.expiry_sweep);
    logger_->info("Tracker listening on {}", address());
  } else {
    share_service_ = std::make_shared<ShareService>(std::make_shared<Logger>("share"));
    tracker_client_ = std::make_unique<TrackerClient>(io_,
                                                      settings_->get<std::string>("tracker"),
                                                      peer_id_,
                                                      address(),
                                                      request_timeout,
                                                      logger_);

    TransferConfig config;
    config.store_dir = workspace_path("store_dir");
    config.download_dir = workspace_path("download_dir");
    config.local_peer_id = peer_id_;
    config.max_active_transfers = setting_count(*settings_, "max_active_transfers");
    config.max_concurrent_chunks = setting_count(*settings_, "max_concurrent_chunks");
    config.max_chunks_per_peer = setting_count(*settings_, "max_chunks_per_peer");
    config.max_chunk_attempts = std::max<std::size_t>(1, setting_count(*settings_, "max_chunk_attempts"));
    config.transfer_rate_limit = settings_->get<uint64_t>("transfer_rate_limit");
    config.global_rate_limit = settings_->get<uint64_t>("global_rate_limit");
    config.verify_threads = std::max<std::size_t>(1, setting_count(*settings_, "verify_threads"));
    config.fetch_threads = std::clamp<std::size_t>(
      std::max<std::size_t>(1, config.max_concurrent_chunks) * std::max<std::size_t>(1, config.max_active_transfers),
      4, 64);

    auto source_logger = std::make_shared<Logger>("peer-link");
    transfers_ = std::make_unique<TransferCoordinator>(
      *tracker_client_,
      [this, request_timeout, source_logger](const PeerRecord& peer) -> std::shared_ptr<ChunkSource> {
        return RemotePeer::connect(io_, peer, peer_id_, request_timeout, source_logger);
      },
      config,
      std::make_shared<Logger>("transfer"));
    logger_->info("Peer {} serving on {}", peer_id_, address());
  }

  start_accept();
  started_ = true;
}

std::string SwarmNode::address() const {
  return listen_ip_ + ":" + std::to_string(listen_port_);
}

void SwarmNode::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
        return;
      }
      std::weak_ptr<MessageSink> sink;
      if(tracker_service_) {
        sink = tracker_service_;
      } else {
        sink = share_service_;
      }
      Connection::create_incoming(io_, std::move(socket), sink, logger_);
      if(started_) {
        start_accept();
      }
    });
}

void SwarmNode::run() {
  if(!started_) start();
  io_.run();
}

void SwarmNode::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

int SwarmNode::wait_for_signal() {
  asio::signal_set signals(io_, SIGINT, SIGTERM);
  auto received = std::make_shared<std::promise<int>>();
  signals.async_wait([received](const std::error_code& ec, int signal_number){
    received->set_value(ec ? 0 : signal_number);
  });
  start_background();
  int signal_number = received->get_future().get();
  logger_->info("Signal {} received, shutting down", signal_number);
  stop();
  return signal_number;
}

void SwarmNode::stop() {
  if(!started_) return;
  started_ = false;

  if(transfers_) {
    transfers_->shutdown();
  }
  if(tracker_service_) {
    tracker_service_->stop();
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}

void SwarmNode::require_peer(const char* operation) const {
  if(!started_ || role_ != NodeRole::Peer) {
    throw std::logic_error(std::string(operation) + " needs a started peer node");
  }
}

TransferCoordinator& SwarmNode::transfers() {
  require_peer("transfers");
  return *transfers_;
}

TrackerClient& SwarmNode::tracker() {
  require_peer("tracker");
  return *tracker_client_;
}

IndexResult SwarmNode::publish_share() {
  auto share = settings_->get<std::string>("share");
  if(share.empty()) {
    throw std::invalid_argument("no share directory configured");
  }
  return publish(share);
}

IndexResult SwarmNode::publish(const std::filesystem::path& root) {
  require_peer("publish");
  IndexOptions index_options;
  index_options.chunk_size = static_cast<uint32_t>(
    std::clamp<uint64_t>(settings_->get<uint64_t>("chunk_size"), 1, ShareService::kMaxServedChunk));
  Indexer indexer(index_options, std::make_shared<Logger>("indexer"));
  auto result = indexer.index(root);
  share_service_->publish(result);
  tracker_client_->declare(result.declaration);
  logger_->info("Published {}: {} files, {} folders, {} issues",
                result.declaration.root_name,
                result.file_count,
                result.directory_count,
                result.declaration.issues.size());
  return result;
}

std::vector<SearchResult> SwarmNode::search(const std::string& query, const std::string& kind) {
  return tracker().search(query, kind);
}

std::vector<DeclaredRoot> SwarmNode::all_declarations() {
  return tracker().all_declarations();
}

std::optional<IndexEntry> SwarmNode::lookup(const ContentHash& hash) {
  return tracker().lookup(hash);
}

std::string SwarmNode::download(const ContentHash& target, const TreeHash& context) {
  return transfers().start_transfer(target, context);
}

LogListenerHandle SwarmNode::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void SwarmNode::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) {
    logger_->remove_listener(handle);
  }
}
