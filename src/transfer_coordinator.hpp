#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cancel_token.hpp"
#include "chunk_source.hpp"
#include "content_directory.hpp"
#include "log.hpp"
#include "rate_limiter.hpp"

class ChunkStore;

enum class TransferState { Pending, Negotiating, Downloading, Verifying, Complete, Failed, Cancelled };

enum class FailureCause {
  None,
  UnknownTarget,
  NoPeers,
  SourcesExhausted,
  IntegrityMismatch,
  StoreCorruption,
  Filesystem,
  Internal,
};

const char* transfer_state_name(TransferState state);
const char* failure_cause_name(FailureCause cause);
bool is_terminal(TransferState state);

struct TransferProgress {
  std::string id;
  ContentHash target;
  TreeHash context;
  TransferState state = TransferState::Pending;
  FailureCause cause = FailureCause::None;
  std::string message;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  double rate = 0.0; // bytes/sec over the last few seconds
  std::size_t chunks_done = 0;
  std::size_t chunks_total = 0;
  std::size_t peers = 0;
  std::filesystem::path output; // set once Complete
};

struct TransferConfig {
  std::filesystem::path store_dir = "treeswarm-store";
  std::filesystem::path download_dir = "downloads";
  std::string local_peer_id; // never used as a source
  std::size_t max_active_transfers = 2;   // 0 = unlimited
  std::size_t max_concurrent_chunks = 8;  // per transfer
  std::size_t max_chunks_per_peer = 2;
  std::size_t max_chunk_attempts = 4;
  uint64_t transfer_rate_limit = 0;       // bytes/sec, 0 = unlimited
  uint64_t global_rate_limit = 0;
  std::size_t fetch_threads = 16;
  std::size_t verify_threads = 2;
  std::chrono::milliseconds checkpoint_interval{1000};
  std::chrono::seconds retention{60};     // finished transfers stay queryable this long
};

// Drives every transfer through Pending -> Negotiating -> Downloading ->
// Verifying -> Complete. Each transfer has one scheduler thread that owns its
// chunk bookkeeping; fetches and verifications run on shared pools and report
// back over the transfer's completion channel.
class TransferCoordinator {
public:
  TransferCoordinator(ContentDirectory& directory,
                      PeerPool::SourceFactory sources,
                      TransferConfig config,
                      std::shared_ptr<Logger> logger = nullptr);
  ~TransferCoordinator();

  TransferCoordinator(const TransferCoordinator&) = delete;
  TransferCoordinator& operator=(const TransferCoordinator&) = delete;

  // Same target and context always map to the same id, which is what lets a
  // restarted node resume from the persisted chunk map. Starting an id that is
  // still running returns it unchanged.
  std::string start_transfer(const ContentHash& target, const TreeHash& context = TreeHash{});
  std::optional<TransferProgress> progress(const std::string& id) const;
  // Also drops finished transfers older than the retention.
  std::vector<TransferProgress> transfers();
  // Stops scheduling, aborts in-flight fetches and keeps the chunk map for a
  // later resume unless `cleanup` is set.
  bool cancel(const std::string& id, bool cleanup = false);
  // Blocks until the transfer is terminal or the timeout passes.
  std::optional<TransferProgress> wait(const std::string& id, std::chrono::milliseconds timeout) const;

  void set_rate_limits(uint64_t transfer_bytes_per_sec, uint64_t global_bytes_per_sec);
  // Overrides the per-transfer limit of one transfer. False for an unknown id.
  bool set_transfer_rate(const std::string& id, uint64_t bytes_per_sec);
  void shutdown();

  const TransferConfig& config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  static std::string transfer_id_for(const ContentHash& target, const TreeHash& context);

private:
  struct Transfer {
    std::string id;
    ContentHash target;
    TreeHash context;

    mutable std::mutex m;
    mutable std::condition_variable cv;
    TransferState state = TransferState::Pending;
    FailureCause cause = FailureCause::None;
    std::string message;
    uint64_t bytes_total = 0;
    std::size_t chunks_total = 0;
    std::size_t chunks_done = 0;
    std::size_t peers = 0;
    std::filesystem::path output;
    std::chrono::steady_clock::time_point finished_at{};

    std::atomic<uint64_t> bytes_done{0};
    RateMeter meter;
    TokenBucket bucket;
    CancelToken cancel = make_cancel_token();
    std::atomic<bool> cleanup{false};
    std::thread worker;
  };

  class Session;

  void run(std::shared_ptr<Transfer> transfer);
  void set_state(Transfer& transfer, TransferState state);
  void finish(Transfer& transfer, TransferState state, FailureCause cause, const std::string& message);
  TransferProgress snapshot(const Transfer& transfer) const;
  void prune_finished_locked();

  ContentDirectory& directory_;
  TransferConfig config_;
  std::shared_ptr<Logger> logger_;
  PeerPool pool_;
  SlotGate slots_;
  TokenBucket global_bucket_;
  asio::thread_pool fetch_pool_;
  asio::thread_pool verify_pool_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Transfer>> transfers_;
  bool stopped_ = false;
};
