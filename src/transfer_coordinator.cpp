#include "transfer_coordinator.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <set>
#include <variant>

#include "channel.hpp"
#include "chunk_store.hpp"
#include "errors.hpp"

namespace {

constexpr std::chrono::milliseconds kEventPoll{100};
constexpr std::chrono::seconds kDrainTimeout{10};
constexpr double kThroughputSmoothing = 0.3;
constexpr std::size_t kNoPeer = std::numeric_limits<std::size_t>::max();

struct FetchDone {
  std::size_t chunk = 0;
  std::size_t peer = kNoPeer;
  FetchStatus status = FetchStatus::Unavailable;
  std::string error;
  uint64_t bytes = 0;
  double seconds = 0.0;
  bool bad_length = false;
  bool io_failed = false;
};

struct VerifyDone {
  std::size_t chunk = 0;
  std::size_t peer = kNoPeer; // kNoPeer for chunks carried over from a checkpoint
  bool ok = false;
  bool io_failed = false;
  std::string error;
};

using Event = std::variant<FetchDone, VerifyDone>;

struct Outcome {
  TransferState state = TransferState::Verifying;
  FailureCause cause = FailureCause::None;
  std::string message;
};

} // namespace

const char* transfer_state_name(TransferState state) {
  switch(state) {
    case TransferState::Pending: return "pending";
    case TransferState::Negotiating: return "negotiating";
    case TransferState::Downloading: return "downloading";
    case TransferState::Verifying: return "verifying";
    case TransferState::Complete: return "complete";
    case TransferState::Failed: return "failed";
    case TransferState::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* failure_cause_name(FailureCause cause) {
  switch(cause) {
    case FailureCause::None: return "none";
    case FailureCause::UnknownTarget: return "unknown-target";
    case FailureCause::NoPeers: return "no-peers";
    case FailureCause::SourcesExhausted: return "sources-exhausted";
    case FailureCause::IntegrityMismatch: return "integrity-mismatch";
    case FailureCause::StoreCorruption: return "store-corruption";
    case FailureCause::Filesystem: return "filesystem";
    case FailureCause::Internal: return "internal";
  }
  return "unknown";
}

bool is_terminal(TransferState state) {
  return state == TransferState::Complete ||
         state == TransferState::Failed ||
         state == TransferState::Cancelled;
}

// Chunk scheduling for one transfer. Only the scheduler thread touches the
// bookkeeping here; pool tasks see nothing but the store, their source and
// the completion channel.
class TransferCoordinator::Session {
public:
  Session(TransferCoordinator& owner, std::shared_ptr<Transfer> transfer, std::shared_ptr<ChunkStore> store)
    : owner_(owner),
      transfer_(std::move(transfer)),
      store_(std::move(store)),
      events_(std::make_shared<Channel<Event>>()) {
    jobs_.resize(store_->chunk_count());
  }

  ~Session() {
    events_->close();
  }

  Outcome run() {
    for(auto id : store_->chunks_in(ChunkState::Fetched)) {
      submit_verify(id, kNoPeer);
    }
    for(auto id : store_->chunks_in(ChunkState::Missing)) {
      queue_.push_back(id);
    }

    auto last_checkpoint = std::chrono::steady_clock::now();
    for(;;) {
      if(is_cancelled(transfer_->cancel)) {
        drain();
        return Outcome{TransferState::Cancelled, FailureCause::None, "cancelled"};
      }
      if(failure_) {
        drain();
        return *failure_;
      }

      if(!queue_.empty() && !negotiated_) {
        negotiate();
        if(is_cancelled(transfer_->cancel)) continue;
        if(peers_.empty()) {
          drain();
          return Outcome{TransferState::Failed, FailureCause::NoPeers,
                         "no reachable peer offers " + transfer_->target.short_hex()};
        }
      }

      dispatch();

      if(queue_.empty() && in_flight_ == 0 && verifying_ == 0) {
        if(store_->complete()) return Outcome{};
        return Outcome{TransferState::Failed, FailureCause::SourcesExhausted,
                       "chunk map incomplete after every chunk was scheduled"};
      }
      if(!queue_.empty() && in_flight_ == 0 && verifying_ == 0 && !throttled_) {
        return stalled();
      }

      owner_.set_state(*transfer_, !queue_.empty() || in_flight_ > 0
                                     ? TransferState::Downloading
                                     : TransferState::Verifying);

      auto now = std::chrono::steady_clock::now();
      if(dirty_ && now - last_checkpoint >= owner_.config_.checkpoint_interval) {
        try {
          store_->checkpoint();
          dirty_ = false;
        } catch(const FilesystemError& e) {
          fail(FailureCause::Filesystem, e.what());
        }
        last_checkpoint = now;
      }

      auto wait = throttled_
        ? std::clamp<std::chrono::steady_clock::duration>(throttle_wait_, std::chrono::milliseconds(1), kEventPoll)
        : std::chrono::steady_clock::duration(kEventPoll);
      auto event = events_->pop_for(wait);
      if(event) handle(std::move(*event));
    }
  }

private:
  struct PeerLink {
    std::string id;
    std::shared_ptr<ChunkSource> source;
    std::vector<bool> offered; // by chunk id
    std::size_t in_flight = 0;
    double throughput = 0.0;
    bool alive = true;
  };

  struct ChunkJob {
    std::size_t attempts = 0;
    std::size_t integrity_failures = 0;
    std::set<std::size_t> excluded; // peers that served bad bytes for this chunk
  };

  Logger& log() { return *owner_.logger_; }

  void negotiate() {
    negotiated_ = true;
    const auto& plan = store_->plan();

    std::set<std::size_t> needed_files;
    for(auto id : queue_) needed_files.insert(store_->chunk(id).file_index);

    std::map<std::string, PeerRecord> records;
    std::map<std::string, std::set<std::size_t>> seeds;
    for(auto f : needed_files) {
      for(const auto& peer : owner_.directory_.seeders(plan.files[f].hash)) {
        if(peer.owner == owner_.config_.local_peer_id) continue;
        if(peer.status != PeerStatus::Online) continue;
        records.emplace(peer.owner, peer);
        seeds[peer.owner].insert(f);
      }
    }

    for(const auto& [owner, record] : records) {
      if(is_cancelled(transfer_->cancel)) return;
      PeerLink link;
      link.id = owner;
      link.offered.assign(store_->chunk_count(), false);
      std::size_t offered = 0;
      try {
        link.source = owner_.pool_.acquire(record);
        for(auto f : seeds[owner]) {
          for(auto index : link.source->offer(plan.files[f].hash)) {
            auto id = store_->chunk_id(f, index);
            if(!id || link.offered[*id]) continue;
            link.offered[*id] = true;
            ++offered;
          }
        }
      } catch(const PeerUnavailableError& e) {
        log().warn("Skipping {}: {}", owner, e.what());
        continue;
      }
      if(offered == 0) {
        log().debug("{} offers nothing for {}", owner, transfer_->id);
        continue;
      }
      log().debug("{} offers {} chunks for {}", owner, offered, transfer_->id);
      peers_.push_back(std::move(link));
    }
    update_peer_count();
  }

  std::optional<std::size_t> pick_peer(std::size_t chunk) const {
    const auto& job = jobs_[chunk];
    const std::size_t per_peer = owner_.config_.max_chunks_per_peer
      ? owner_.config_.max_chunks_per_peer
      : std::numeric_limits<std::size_t>::max();
    std::optional<std::size_t> best;
    for(std::size_t p = 0; p < peers_.size(); ++p) {
      const auto& peer = peers_[p];
      if(!peer.alive || !peer.offered[chunk]) continue;
      if(job.excluded.count(p)) continue;
      if(peer.in_flight >= per_peer) continue;
      if(!best) {
        best = p;
        continue;
      }
      const auto& current = peers_[*best];
      // Idle peers first, then the historically faster one.
      if(peer.in_flight < current.in_flight ||
         (peer.in_flight == current.in_flight && peer.throughput > current.throughput)) {
        best = p;
      }
    }
    return best;
  }

  void dispatch() {
    const std::size_t limit = owner_.config_.max_concurrent_chunks
      ? owner_.config_.max_concurrent_chunks
      : std::numeric_limits<std::size_t>::max();
    std::deque<std::size_t> deferred;
    throttled_ = false;
    while(in_flight_ < limit && !queue_.empty()) {
      auto chunk = queue_.front();
      auto peer = pick_peer(chunk);
      if(!peer) {
        queue_.pop_front();
        deferred.push_back(chunk);
        continue;
      }
      if(!take_tokens(store_->chunk(chunk).length)) break;
      queue_.pop_front();
      start_fetch(chunk, *peer);
    }
    queue_.insert(queue_.begin(), deferred.begin(), deferred.end());
  }

  // Rate limits are paid on the scheduler thread, never on the fetch pool.
  bool take_tokens(uint32_t length) {
    auto& own = transfer_->bucket;
    auto& global = owner_.global_bucket_;
    if(!own.try_acquire(length)) {
      throttled_ = true;
      throttle_wait_ = own.time_until(length);
      return false;
    }
    if(!global.try_acquire(length)) {
      own.refund(length);
      throttled_ = true;
      throttle_wait_ = global.time_until(length);
      return false;
    }
    return true;
  }

  void refund_tokens(std::size_t chunk) {
    auto length = store_->chunk(chunk).length;
    transfer_->bucket.refund(length);
    owner_.global_bucket_.refund(length);
  }

  void start_fetch(std::size_t chunk, std::size_t peer) {
    auto record = store_->chunk(chunk);
    ChunkRequest request;
    request.file = store_->plan().files[record.file_index].hash;
    request.index = record.chunk_index;
    request.offset = record.offset;
    request.length = record.length;

    ++peers_[peer].in_flight;
    ++in_flight_;

    asio::post(owner_.fetch_pool_,
      [events = events_, store = store_, source = peers_[peer].source,
       transfer = transfer_, request, chunk, peer]() {
        FetchDone done;
        done.chunk = chunk;
        done.peer = peer;
        auto started = std::chrono::steady_clock::now();
        ChunkReply reply;
        try {
          reply = source->fetch(request, transfer->cancel);
        } catch(const PeerUnavailableError& e) {
          reply.status = FetchStatus::Disconnected;
          reply.error = e.what();
        } catch(const std::exception& e) {
          reply.status = FetchStatus::Disconnected;
          reply.error = std::string("unexpected reply: ") + e.what();
        }
        done.status = reply.status;
        done.error = reply.error;
        if(reply.status == FetchStatus::Ok && !is_cancelled(transfer->cancel)) {
          try {
            store->write_chunk(chunk, reply.data);
            done.bytes = reply.data.size();
          } catch(const IntegrityError& e) {
            done.bad_length = true;
            done.error = e.what();
          } catch(const std::exception& e) {
            done.io_failed = true;
            done.error = e.what();
          }
        } else if(reply.status == FetchStatus::Ok) {
          done.status = FetchStatus::Cancelled;
        }
        done.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        events->push(std::move(done));
      });
  }

  void submit_verify(std::size_t chunk, std::size_t peer) {
    ++verifying_;
    asio::post(owner_.verify_pool_, [events = events_, store = store_, chunk, peer]() {
      VerifyDone done;
      done.chunk = chunk;
      done.peer = peer;
      try {
        done.ok = store->verify_chunk(chunk);
      } catch(const std::exception& e) {
        done.io_failed = true;
        done.error = e.what();
      }
      events->push(std::move(done));
    });
  }

  void handle(Event event) {
    if(auto* fetch = std::get_if<FetchDone>(&event)) {
      on_fetch(*fetch);
    } else {
      on_verify(std::get<VerifyDone>(event));
    }
  }

  void on_fetch(const FetchDone& done) {
    --in_flight_;
    PeerLink& peer = peers_[done.peer];
    --peer.in_flight;

    switch(done.status) {
      case FetchStatus::Ok:
        if(done.io_failed) {
          fail(FailureCause::Filesystem, done.error);
          return;
        }
        if(done.bad_length) {
          reject(done.chunk, done.peer, done.error);
          return;
        }
        {
          double sample = static_cast<double>(done.bytes) / std::max(done.seconds, 1e-3);
          peer.throughput = peer.throughput == 0.0
            ? sample
            : kThroughputSmoothing * sample + (1.0 - kThroughputSmoothing) * peer.throughput;
        }
        transfer_->meter.record(done.bytes);
        dirty_ = true;
        submit_verify(done.chunk, done.peer);
        return;
      case FetchStatus::Unavailable:
        refund_tokens(done.chunk);
        log().debug("{} no longer has chunk {} of {}", peer.id, done.chunk, transfer_->id);
        peer.offered[done.chunk] = false;
        queue_.push_back(done.chunk);
        return;
      case FetchStatus::Disconnected:
        refund_tokens(done.chunk);
        if(peer.alive) {
          log().warn("Lost {} during {}: {}", peer.id, transfer_->id, done.error);
          peer.alive = false;
          update_peer_count();
        }
        retry(done.chunk, FailureCause::SourcesExhausted);
        return;
      case FetchStatus::Cancelled:
        refund_tokens(done.chunk);
        queue_.push_back(done.chunk);
        return;
    }
  }

  void on_verify(const VerifyDone& done) {
    --verifying_;
    if(done.io_failed) {
      fail(FailureCause::Filesystem, done.error);
      return;
    }
    if(done.ok) {
      auto record = store_->chunk(done.chunk);
      transfer_->bytes_done.fetch_add(record.length);
      {
        std::lock_guard lg(transfer_->m);
        ++transfer_->chunks_done;
      }
      dirty_ = true;
      return;
    }
    if(done.peer == kNoPeer) {
      log().debug("Chunk {} of {} did not survive the restart, refetching", done.chunk, transfer_->id);
      queue_.push_back(done.chunk);
      return;
    }
    reject(done.chunk, done.peer, "digest mismatch");
  }

  // Bad bytes: never ask that peer for this chunk again.
  void reject(std::size_t chunk, std::size_t peer, const std::string& reason) {
    auto& job = jobs_[chunk];
    job.excluded.insert(peer);
    ++job.integrity_failures;
    log().warn("Chunk {} of {} from {} rejected ({}), refetching elsewhere",
               chunk, transfer_->id, peers_[peer].id, reason);
    retry(chunk, FailureCause::IntegrityMismatch);
  }

  void retry(std::size_t chunk, FailureCause cause_if_exhausted) {
    auto& job = jobs_[chunk];
    if(++job.attempts >= owner_.config_.max_chunk_attempts) {
      fail(cause_if_exhausted, "chunk " + std::to_string(chunk) + " failed " +
                               std::to_string(job.attempts) + " times");
      return;
    }
    queue_.push_back(chunk);
  }

  Outcome stalled() const {
    bool integrity = false;
    for(auto chunk : queue_) {
      if(jobs_[chunk].integrity_failures > 0) integrity = true;
    }
    if(integrity) {
      return Outcome{TransferState::Failed, FailureCause::IntegrityMismatch,
                     "no other peer can replace a corrupt chunk"};
    }
    return Outcome{TransferState::Failed, FailureCause::SourcesExhausted,
                   std::to_string(queue_.size()) + " chunks have no remaining source"};
  }

  void fail(FailureCause cause, const std::string& message) {
    if(!failure_) {
      failure_ = Outcome{TransferState::Failed, cause, message};
    }
  }

  // Waits for outstanding pool tasks so nothing writes into the store after
  // the scheduler gives it up.
  void drain() {
    auto deadline = std::chrono::steady_clock::now() + kDrainTimeout;
    while((in_flight_ > 0 || verifying_ > 0) && std::chrono::steady_clock::now() < deadline) {
      auto event = events_->pop_for(kEventPoll);
      if(!event) continue;
      if(auto* fetch = std::get_if<FetchDone>(&*event)) {
        --in_flight_;
        --peers_[fetch->peer].in_flight;
      } else {
        --verifying_;
      }
    }
    if(in_flight_ > 0 || verifying_ > 0) {
      log().warn("{} stopped with {} fetches and {} verifications outstanding",
                 transfer_->id, in_flight_, verifying_);
    }
    events_->close();
  }

  void update_peer_count() {
    std::size_t alive = 0;
    for(const auto& peer : peers_) {
      if(peer.alive) ++alive;
    }
    std::lock_guard lg(transfer_->m);
    transfer_->peers = alive;
  }

  TransferCoordinator& owner_;
  std::shared_ptr<Transfer> transfer_;
  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<Channel<Event>> events_;

  std::vector<PeerLink> peers_;
  std::vector<ChunkJob> jobs_;
  std::deque<std::size_t> queue_;
  std::size_t in_flight_ = 0;
  std::size_t verifying_ = 0;
  bool negotiated_ = false;
  bool dirty_ = false;
  bool throttled_ = false;
  std::chrono::steady_clock::duration throttle_wait_{};
  std::optional<Outcome> failure_;
};

TransferCoordinator::TransferCoordinator(ContentDirectory& directory,
                                         PeerPool::SourceFactory sources,
                                         TransferConfig config,
                                         std::shared_ptr<Logger> logger)
  : directory_(directory),
    config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")),
    pool_(std::move(sources)),
    slots_(config_.max_active_transfers),
    global_bucket_(config_.global_rate_limit),
    fetch_pool_(std::max<std::size_t>(1, config_.fetch_threads)),
    verify_pool_(std::max<std::size_t>(1, config_.verify_threads)) {}

TransferCoordinator::~TransferCoordinator() {
  shutdown();
}

std::string TransferCoordinator::transfer_id_for(const ContentHash& target, const TreeHash& context) {
  return ContentHash::of(target.to_hex() + ":" + context.to_hex()).to_hex().substr(0, 24);
}

std::string TransferCoordinator::start_transfer(const ContentHash& target, const TreeHash& context) {
  auto id = transfer_id_for(target, context);
  std::lock_guard lg(mutex_);
  if(stopped_) {
    throw SwarmError("transfer coordinator is shut down");
  }
  prune_finished_locked();

  auto it = transfers_.find(id);
  if(it != transfers_.end()) {
    auto& previous = it->second;
    {
      std::lock_guard tl(previous->m);
      if(!is_terminal(previous->state)) return id;
    }
    if(previous->worker.joinable()) previous->worker.join();
    transfers_.erase(it);
  }

  auto transfer = std::make_shared<Transfer>();
  transfer->id = id;
  transfer->target = target;
  transfer->context = context;
  transfer->bucket.set_rate(config_.transfer_rate_limit);
  transfers_[id] = transfer;

  logger_->info("Queued transfer {} for {}", id, target.short_hex());
  transfer->worker = std::thread([this, transfer]{ run(transfer); });
  return id;
}

void TransferCoordinator::run(std::shared_ptr<Transfer> transfer) {
  Transfer& t = *transfer;
  if(!slots_.acquire(t.cancel)) {
    if(t.cleanup.load()) ChunkStore::remove(config_.store_dir, t.id);
    finish(t, TransferState::Cancelled, FailureCause::None, "cancelled while queued");
    return;
  }
  struct SlotRelease {
    SlotGate& gate;
    ~SlotRelease() { gate.release(); }
  } release{slots_};

  std::shared_ptr<ChunkStore> store;
  try {
    set_state(t, TransferState::Negotiating);
    auto plan = directory_.plan_transfer(t.target, t.context);
    if(!plan) {
      finish(t, TransferState::Failed, FailureCause::UnknownTarget,
             t.target.short_hex() + " is not declared by any peer");
      return;
    }
    store = ChunkStore::open(config_.store_dir, t.id, *plan, logger_);
    {
      std::lock_guard lg(t.m);
      t.context = plan->context;
      t.bytes_total = plan->total_bytes();
      t.chunks_total = store->chunk_count();
      t.chunks_done = store->chunks_in(ChunkState::Verified).size();
    }
    t.bytes_done.store(store->bytes_verified());

    Outcome outcome;
    {
      Session session(*this, transfer, store);
      outcome = session.run();
    }

    if(outcome.state == TransferState::Cancelled) {
      if(t.cleanup.load()) {
        store->discard();
      } else {
        store->checkpoint();
      }
      finish(t, TransferState::Cancelled, FailureCause::None, "cancelled");
      return;
    }
    if(outcome.state == TransferState::Failed) {
      store->checkpoint();
      finish(t, TransferState::Failed, outcome.cause, outcome.message);
      return;
    }

    set_state(t, TransferState::Verifying);
    auto output = store->finalize(config_.download_dir);
    {
      std::lock_guard lg(t.m);
      t.output = output;
    }
    finish(t, TransferState::Complete, FailureCause::None, output.string());
  } catch(const StoreCorruptionError& e) {
    finish(t, TransferState::Failed, FailureCause::StoreCorruption, e.what());
  } catch(const IntegrityError& e) {
    finish(t, TransferState::Failed, FailureCause::IntegrityMismatch, e.what());
  } catch(const FilesystemError& e) {
    finish(t, TransferState::Failed, FailureCause::Filesystem, e.what());
  } catch(const PeerUnavailableError& e) {
    finish(t, TransferState::Failed, FailureCause::NoPeers, e.what());
  } catch(const ProtocolError& e) {
    finish(t, TransferState::Failed, FailureCause::UnknownTarget, e.what());
  } catch(const std::exception& e) {
    finish(t, TransferState::Failed, FailureCause::Internal, e.what());
  }
}

void TransferCoordinator::set_state(Transfer& transfer, TransferState state) {
  TransferState previous;
  {
    std::lock_guard lg(transfer.m);
    previous = transfer.state;
    if(previous == state) return;
    transfer.state = state;
  }
  transfer.cv.notify_all();
  logger_->debug("{} {} -> {}", transfer.id, transfer_state_name(previous), transfer_state_name(state));
}

void TransferCoordinator::finish(Transfer& transfer,
                                 TransferState state,
                                 FailureCause cause,
                                 const std::string& message) {
  {
    std::lock_guard lg(transfer.m);
    transfer.state = state;
    transfer.cause = cause;
    transfer.message = message;
    transfer.finished_at = std::chrono::steady_clock::now();
  }
  transfer.cv.notify_all();
  switch(state) {
    case TransferState::Complete:
      logger_->info("Transfer {} complete: {}", transfer.id, message);
      break;
    case TransferState::Failed:
      logger_->error("Transfer {} failed ({}): {}", transfer.id, failure_cause_name(cause), message);
      break;
    default:
      logger_->info("Transfer {} {}", transfer.id, transfer_state_name(state));
      break;
  }
}

TransferProgress TransferCoordinator::snapshot(const Transfer& transfer) const {
  TransferProgress p;
  p.id = transfer.id;
  p.target = transfer.target;
  p.context = transfer.context;
  p.state = transfer.state;
  p.cause = transfer.cause;
  p.message = transfer.message;
  p.bytes_done = transfer.bytes_done.load();
  p.bytes_total = transfer.bytes_total;
  p.rate = is_terminal(transfer.state) ? 0.0 : transfer.meter.rate();
  p.chunks_done = transfer.chunks_done;
  p.chunks_total = transfer.chunks_total;
  p.peers = transfer.peers;
  p.output = transfer.output;
  return p;
}

std::optional<TransferProgress> TransferCoordinator::progress(const std::string& id) const {
  std::shared_ptr<Transfer> transfer;
  {
    std::lock_guard lg(mutex_);
    auto it = transfers_.find(id);
    if(it == transfers_.end()) return std::nullopt;
    transfer = it->second;
  }
  std::lock_guard tl(transfer->m);
  return snapshot(*transfer);
}

std::vector<TransferProgress> TransferCoordinator::transfers() {
  std::vector<std::shared_ptr<Transfer>> all;
  {
    std::lock_guard lg(mutex_);
    prune_finished_locked();
    for(const auto& [id, transfer] : transfers_) all.push_back(transfer);
  }
  std::vector<TransferProgress> out;
  out.reserve(all.size());
  for(const auto& transfer : all) {
    std::lock_guard tl(transfer->m);
    out.push_back(snapshot(*transfer));
  }
  return out;
}

bool TransferCoordinator::cancel(const std::string& id, bool cleanup) {
  std::shared_ptr<Transfer> transfer;
  {
    std::lock_guard lg(mutex_);
    auto it = transfers_.find(id);
    if(it != transfers_.end()) transfer = it->second;
  }
  if(!transfer) {
    // Nothing running, but a leftover chunk map can still be dropped.
    return cleanup && ChunkStore::remove(config_.store_dir, id);
  }
  {
    std::lock_guard tl(transfer->m);
    if(is_terminal(transfer->state)) {
      if(cleanup && transfer->state != TransferState::Complete) {
        ChunkStore::remove(config_.store_dir, id);
        return true;
      }
      return false;
    }
  }
  transfer->cleanup.store(cleanup);
  transfer->cancel->store(true);
  logger_->info("Cancelling {}{}", id, cleanup ? " and discarding its chunks" : "");
  return true;
}

std::optional<TransferProgress> TransferCoordinator::wait(const std::string& id,
                                                          std::chrono::milliseconds timeout) const {
  std::shared_ptr<Transfer> transfer;
  {
    std::lock_guard lg(mutex_);
    auto it = transfers_.find(id);
    if(it == transfers_.end()) return std::nullopt;
    transfer = it->second;
  }
  std::unique_lock lock(transfer->m);
  transfer->cv.wait_for(lock, timeout, [&]{ return is_terminal(transfer->state); });
  return snapshot(*transfer);
}

void TransferCoordinator::set_rate_limits(uint64_t transfer_bytes_per_sec, uint64_t global_bytes_per_sec) {
  std::lock_guard lg(mutex_);
  config_.transfer_rate_limit = transfer_bytes_per_sec;
  config_.global_rate_limit = global_bytes_per_sec;
  global_bucket_.set_rate(global_bytes_per_sec);
  for(auto& [id, transfer] : transfers_) {
    transfer->bucket.set_rate(transfer_bytes_per_sec);
  }
}

bool TransferCoordinator::set_transfer_rate(const std::string& id, uint64_t bytes_per_sec) {
  std::lock_guard lg(mutex_);
  auto it = transfers_.find(id);
  if(it == transfers_.end()) return false;
  it->second->bucket.set_rate(bytes_per_sec);
  return true;
}

void TransferCoordinator::prune_finished_locked() {
  auto now = std::chrono::steady_clock::now();
  for(auto it = transfers_.begin(); it != transfers_.end();) {
    auto& transfer = it->second;
    bool expired = false;
    {
      std::lock_guard tl(transfer->m);
      expired = is_terminal(transfer->state) && now - transfer->finished_at > config_.retention;
    }
    if(expired) {
      if(transfer->worker.joinable()) transfer->worker.join();
      it = transfers_.erase(it);
    } else {
      ++it;
    }
  }
}

void TransferCoordinator::shutdown() {
  std::vector<std::shared_ptr<Transfer>> all;
  {
    std::lock_guard lg(mutex_);
    if(stopped_) return;
    stopped_ = true;
    for(const auto& [id, transfer] : transfers_) all.push_back(transfer);
  }
  for(auto& transfer : all) {
    transfer->cancel->store(true);
  }
  for(auto& transfer : all) {
    if(transfer->worker.joinable()) transfer->worker.join();
  }
  fetch_pool_.join();
  verify_pool_.join();
}
