#include "tree_store.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include "errors.hpp"

std::set<std::string> IndexEntry::owners() const {
  std::set<std::string> out;
  for(const auto& ref : refs) out.insert(ref.owner);
  return out;
}

const IndexEntry* IndexState::find(const ContentHash& hash) const {
  auto it = entries_.find(hash);
  return it == entries_.end() ? nullptr : &it->second;
}

const TreeNode* IndexState::node(const TreeHash& hash) const {
  const auto* entry = find(hash);
  return entry && entry->node ? entry->node.get() : nullptr;
}

const FileManifest* IndexState::manifest(const FileHash& hash) const {
  const auto* entry = find(hash);
  return entry && entry->manifest ? entry->manifest.get() : nullptr;
}

const PeerRecord* IndexState::peer(const std::string& owner) const {
  auto it = peers_.find(owner);
  return it == peers_.end() ? nullptr : &it->second;
}

bool IndexState::is_online(const std::string& owner) const {
  const auto* record = peer(owner);
  return record && record->status == PeerStatus::Online;
}

std::size_t IndexState::replica_count(const TreeHash& tree) const {
  const auto* entry = find(tree);
  return entry ? entry->owner_count() : 0;
}

std::size_t IndexState::online_owner_count(const ContentHash& hash) const {
  const auto* entry = find(hash);
  if(!entry) return 0;
  std::size_t count = 0;
  for(const auto& owner : entry->owners()) {
    if(is_online(owner)) ++count;
  }
  return count;
}

std::optional<std::chrono::system_clock::time_point> IndexState::last_declared(const std::string& owner) const {
  auto it = owners_.find(owner);
  if(it == owners_.end()) return std::nullopt;
  return it->second.last_declared;
}

std::vector<DeclaredRoot> IndexState::roots_of(const std::string& owner) const {
  std::vector<DeclaredRoot> out;
  auto it = owners_.find(owner);
  if(it == owners_.end()) return out;
  for(const auto& [hash, contribution] : it->second.roots) out.push_back(contribution.info);
  return out;
}

std::set<IndexState::OwnedRef> IndexState::OwnerState::all_refs() const {
  std::set<OwnedRef> out;
  for(const auto& [hash, contribution] : roots) {
    out.insert(contribution.refs.begin(), contribution.refs.end());
  }
  return out;
}

TreeStore::TreeStore(TreeStoreOptions options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tree-store")) {}

std::shared_ptr<std::mutex> TreeStore::owner_lock(const std::string& owner) {
  std::lock_guard lg(owner_locks_mutex_);
  auto& slot = owner_locks_[owner];
  if(!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

void TreeStore::set_tie_break(TieBreakPolicy policy) {
  std::unique_lock lock(mutex_);
  options_.tie_break = policy;
}

void TreeStore::apply_diff(const std::string& owner,
                           const std::set<OwnedRef>& before,
                           const std::set<OwnedRef>& after,
                           const std::map<TreeHash, std::shared_ptr<const TreeNode>>& nodes,
                           const std::map<FileHash, std::shared_ptr<const FileManifest>>& manifests) {
  std::vector<OwnedRef> removed;
  std::set_difference(before.begin(), before.end(), after.begin(), after.end(),
                      std::back_inserter(removed));
  std::vector<OwnedRef> added;
  std::set_difference(after.begin(), after.end(), before.begin(), before.end(),
                      std::back_inserter(added));

  for(const auto& ref : removed) {
    auto it = state_.entries_.find(ref.hash);
    if(it == state_.entries_.end()) continue;
    it->second.refs.erase(IndexRef{owner, ref.container, ref.name});
    if(it->second.refs.empty()) {
      state_.entries_.erase(it);
    }
  }

  for(const auto& ref : added) {
    auto& entry = state_.entries_[ref.hash];
    if(entry.refs.empty()) {
      entry.hash = ref.hash;
      entry.kind = ref.kind;
      entry.size = ref.size;
    }
    if(ref.kind == EntryKind::Tree && !entry.node) {
      auto it = nodes.find(ref.hash);
      if(it != nodes.end()) entry.node = it->second;
    } else if(ref.kind == EntryKind::File && !entry.manifest) {
      auto it = manifests.find(ref.hash);
      if(it != manifests.end()) entry.manifest = it->second;
    }
    entry.refs.insert(IndexRef{owner, ref.container, ref.name});
  }
  logger_->debug("{}: +{} -{} index refs", owner, added.size(), removed.size());
}

void TreeStore::declare(const std::string& owner, const Declaration& declaration) {
  if(owner.empty()) {
    throw ProtocolError("declaration has no owner");
  }
  validate_declaration(declaration);

  auto guard_mutex = owner_lock(owner);
  std::lock_guard owner_guard(*guard_mutex);

  auto now = std::chrono::system_clock::now();
  IndexState::RootContribution contribution;
  contribution.info = {owner, declaration.root, declaration.root_name, declaration.total_size(), now};
  std::map<TreeHash, std::shared_ptr<const TreeNode>> nodes;
  std::map<FileHash, std::shared_ptr<const FileManifest>> manifests;

  contribution.refs.insert({declaration.root, EntryKind::Tree, declaration.total_size(),
                            TreeHash{}, declaration.root_name});
  std::vector<TreeHash> pending{declaration.root};
  while(!pending.empty()) {
    TreeHash current = pending.back();
    pending.pop_back();
    if(nodes.count(current)) continue;
    const TreeNode* node = declaration.node(current);
    if(!node) continue;
    nodes.emplace(current, std::make_shared<const TreeNode>(*node));
    for(const auto& entry : node->entries) {
      contribution.refs.insert({entry.hash, entry.kind, entry.size, current, entry.name});
      if(entry.kind == EntryKind::Tree) {
        pending.push_back(entry.hash);
      } else if(!manifests.count(entry.hash)) {
        if(const auto* manifest = declaration.file(entry.hash)) {
          manifests.emplace(entry.hash, std::make_shared<const FileManifest>(*manifest));
        }
      }
    }
  }
  std::size_t ref_count = contribution.refs.size();

  bool refreshed = false;
  {
    std::unique_lock lock(mutex_);
    auto& owner_state = state_.owners_[owner];
    auto before = owner_state.all_refs();
    refreshed = owner_state.roots.count(declaration.root) > 0;
    owner_state.roots[declaration.root] = std::move(contribution);
    owner_state.last_declared = now;
    apply_diff(owner, before, owner_state.all_refs(), nodes, manifests);

    auto& peer = state_.peers_[owner];
    peer.owner = owner;
    peer.status = PeerStatus::Online;
    peer.roots.insert(declaration.root);
    peer.last_seen = now;
  }

  logger_->info("{} {} '{}' root {} ({} nodes, {} files, {} refs{})",
                owner,
                refreshed ? "refreshed" : "declared",
                declaration.root_name,
                declaration.root.short_hex(),
                nodes.size(),
                manifests.size(),
                ref_count,
                declaration.issues.empty()
                  ? std::string()
                  : fmt::format(", {} skipped at source", declaration.issues.size()));
}

bool TreeStore::withdraw_roots(const std::string& owner,
                               const std::optional<TreeHash>& root,
                               const char* reason) {
  auto guard_mutex = owner_lock(owner);
  std::lock_guard owner_guard(*guard_mutex);

  std::size_t removed_roots = 0;
  {
    std::unique_lock lock(mutex_);
    removed_roots = withdraw_locked(owner, root);
  }
  if(removed_roots == 0) return false;
  logger_->info("{} {} ({} root{})", owner, reason, removed_roots, removed_roots == 1 ? "" : "s");
  return true;
}

std::size_t TreeStore::withdraw_locked(const std::string& owner, const std::optional<TreeHash>& root) {
  auto it = state_.owners_.find(owner);
  if(it == state_.owners_.end()) return 0;
  auto& owner_state = it->second;
  auto before = owner_state.all_refs();
  std::size_t removed_roots = 0;
  if(root) {
    removed_roots = owner_state.roots.erase(*root);
  } else {
    removed_roots = owner_state.roots.size();
    owner_state.roots.clear();
  }
  if(removed_roots == 0) return 0;
  apply_diff(owner, before, owner_state.all_refs(), {}, {});

  auto peer = state_.peers_.find(owner);
  if(peer != state_.peers_.end()) {
    if(root) peer->second.roots.erase(*root);
    else peer->second.roots.clear();
  }
  if(owner_state.roots.empty()) {
    state_.owners_.erase(it);
  }
  return removed_roots;
}

bool TreeStore::withdraw(const std::string& owner) {
  return withdraw_roots(owner, std::nullopt, "withdrew");
}

bool TreeStore::withdraw(const std::string& owner, const TreeHash& root) {
  return withdraw_roots(owner, root, "withdrew");
}

std::optional<IndexEntry> TreeStore::lookup(const ContentHash& hash) const {
  return read([&](const IndexState& state) -> std::optional<IndexEntry> {
    const auto* entry = state.find(hash);
    if(!entry) return std::nullopt;
    return *entry;
  });
}

std::vector<ContextCandidate> TreeStore::rank_contexts(const ContentHash& hash,
                                                       const std::string& query) const {
  return read([&](const IndexState& state){
    return ::rank_contexts(state, hash, query, options_.tie_break);
  });
}

void TreeStore::register_peer(const std::string& owner, const std::string& address) {
  {
    std::unique_lock lock(mutex_);
    auto& peer = state_.peers_[owner];
    peer.owner = owner;
    peer.address = address;
    peer.status = PeerStatus::Online;
    peer.last_seen = std::chrono::system_clock::now();
  }
  logger_->info("Peer {} online at {}", owner, address.empty() ? "<no address>" : address);
}

void TreeStore::mark_offline(const std::string& owner) {
  {
    std::unique_lock lock(mutex_);
    auto it = state_.peers_.find(owner);
    if(it == state_.peers_.end()) return;
    it->second.status = PeerStatus::Offline;
    it->second.last_seen = std::chrono::system_clock::now();
  }
  logger_->info("Peer {} offline", owner);
}

std::size_t TreeStore::expire_stale(std::chrono::system_clock::time_point now) {
  auto is_stale = [&](const PeerRecord& peer) {
    return peer.status == PeerStatus::Offline && now - peer.last_seen >= options_.owner_expiry;
  };
  std::vector<std::string> stale;
  read([&](const IndexState& state){
    for(const auto& [owner, peer] : state.peers()) {
      if(is_stale(peer)) stale.push_back(owner);
    }
    return 0;
  });

  std::size_t expired = 0;
  for(const auto& owner : stale) {
    std::size_t removed_roots = 0;
    {
      auto guard_mutex = owner_lock(owner);
      std::lock_guard owner_guard(*guard_mutex);
      std::unique_lock lock(mutex_);
      // The peer may have come back since the snapshot.
      auto it = state_.peers_.find(owner);
      if(it == state_.peers_.end() || !is_stale(it->second)) continue;
      removed_roots = withdraw_locked(owner, std::nullopt);
      state_.peers_.erase(it);
    }
    ++expired;
    logger_->info("{} expired ({} root{})", owner, removed_roots, removed_roots == 1 ? "" : "s");
  }
  prune_owner_locks();
  if(expired > 0) {
    logger_->info("Expired {} offline peer{}", expired, expired == 1 ? "" : "s");
  }
  return expired;
}

void TreeStore::prune_owner_locks() {
  std::lock_guard lg(owner_locks_mutex_);
  // Handed out only under owner_locks_mutex_, so a lock only the map holds is idle.
  for(auto it = owner_locks_.begin(); it != owner_locks_.end();) {
    if(it->second.use_count() == 1) it = owner_locks_.erase(it);
    else ++it;
  }
}

std::size_t TreeStore::owner_lock_count() const {
  std::lock_guard lg(owner_locks_mutex_);
  return owner_locks_.size();
}

std::vector<PeerRecord> TreeStore::peers() const {
  return read([](const IndexState& state){
    std::vector<PeerRecord> out;
    for(const auto& [owner, peer] : state.peers()) out.push_back(peer);
    return out;
  });
}

std::vector<DeclaredRoot> TreeStore::all_declarations() const {
  return read([](const IndexState& state){
    std::vector<DeclaredRoot> out;
    for(const auto& [owner, owner_state] : state.owners_) {
      for(const auto& [hash, contribution] : owner_state.roots) {
        out.push_back(contribution.info);
      }
    }
    return out;
  });
}

std::optional<TransferPlan> TreeStore::plan_transfer(const ContentHash& target,
                                                     const TreeHash& context) {
  return read([&](const IndexState& state) -> std::optional<TransferPlan> {
    const auto* entry = state.find(target);
    if(!entry) return std::nullopt;

    TreeHash chosen = context;
    if(chosen.is_zero()) {
      auto ranked = ::rank_contexts(state, target, std::string(), options_.tie_break);
      if(!ranked.empty()) chosen = ranked.front().tree;
    }

    const IndexRef* placement = nullptr;
    for(const auto& ref : entry->refs) {
      if(ref.container == chosen) {
        placement = &ref;
        break;
      }
    }
    if(!placement) return std::nullopt;

    TransferPlan plan;
    plan.target = target;
    plan.context = chosen;
    plan.target_kind = entry->kind;
    plan.root_name = placement->name;
    if(entry->kind == EntryKind::File) {
      if(!entry->manifest) return std::nullopt;
      plan.files.push_back({placement->name, target, *entry->manifest});
      return plan;
    }
    bool complete = expand_tree_plan(target, std::string(),
      [&](const TreeHash& h){ return state.node(h); },
      [&](const FileHash& h){ return state.manifest(h); },
      plan);
    if(!complete) return std::nullopt;
    return plan;
  });
}

std::vector<PeerRecord> TreeStore::seeders(const FileHash& file) {
  return read([&](const IndexState& state){
    std::vector<PeerRecord> out;
    const auto* entry = state.find(file);
    if(!entry) return out;
    for(const auto& owner : entry->owners()) {
      const auto* peer = state.peer(owner);
      if(peer && peer->status == PeerStatus::Online) out.push_back(*peer);
    }
    return out;
  });
}
