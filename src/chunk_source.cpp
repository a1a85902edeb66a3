#include "chunk_source.hpp"

#include "errors.hpp"

const char* fetch_status_name(FetchStatus status) {
  switch(status) {
    case FetchStatus::Ok: return "ok";
    case FetchStatus::Unavailable: return "unavailable";
    case FetchStatus::Disconnected: return "disconnected";
    case FetchStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

PeerPool::PeerPool(SourceFactory factory)
  : factory_(std::move(factory)) {}

std::shared_ptr<ChunkSource> PeerPool::acquire(const PeerRecord& peer) {
  std::lock_guard lg(m_);
  auto it = sources_.find(peer.owner);
  if(it != sources_.end()) {
    if(auto live = it->second.lock()) return live;
  }
  // Peers nobody holds any more are forgotten here.
  for(auto stale = sources_.begin(); stale != sources_.end();) {
    if(stale->second.expired()) stale = sources_.erase(stale);
    else ++stale;
  }
  if(!factory_) {
    throw PeerUnavailableError(peer.owner, "no connection factory");
  }
  auto source = factory_(peer);
  if(!source) {
    throw PeerUnavailableError(peer.owner, "no route");
  }
  sources_[peer.owner] = source;
  return source;
}

std::size_t PeerPool::open_count() const {
  std::lock_guard lg(m_);
  std::size_t count = 0;
  for(const auto& [owner, weak] : sources_) {
    if(!weak.expired()) ++count;
  }
  return count;
}

std::size_t PeerPool::tracked_count() const {
  std::lock_guard lg(m_);
  return sources_.size();
}
