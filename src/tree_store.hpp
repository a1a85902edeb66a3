#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "consensus.hpp"
#include "content_directory.hpp"
#include "log.hpp"
#include "tree.hpp"

struct IndexRef {
  std::string owner;
  TreeHash container; // zero for a declared root
  std::string name;

  bool operator<(const IndexRef& rhs) const {
    return std::tie(owner, container, name) < std::tie(rhs.owner, rhs.container, rhs.name);
  }
  bool operator==(const IndexRef& rhs) const {
    return owner == rhs.owner && container == rhs.container && name == rhs.name;
  }
};

// Reverse mapping from one content hash to every place it was declared.
struct IndexEntry {
  ContentHash hash;
  EntryKind kind = EntryKind::File;
  uint64_t size = 0;
  std::shared_ptr<const TreeNode> node;         // trees
  std::shared_ptr<const FileManifest> manifest; // files
  std::set<IndexRef> refs;

  std::set<std::string> owners() const;
  std::size_t owner_count() const { return owners().size(); }
};

struct DeclaredRoot {
  std::string owner;
  TreeHash root;
  std::string root_name;
  uint64_t size = 0;
  std::chrono::system_clock::time_point declared_at{};
};

// Registry contents. Only reachable through TreeStore::read, which holds the
// shared lock for the duration of the callback.
class IndexState {
public:
  const IndexEntry* find(const ContentHash& hash) const;
  const TreeNode* node(const TreeHash& hash) const;
  const FileManifest* manifest(const FileHash& hash) const;
  const std::unordered_map<ContentHash, IndexEntry>& entries() const { return entries_; }

  const PeerRecord* peer(const std::string& owner) const;
  const std::map<std::string, PeerRecord>& peers() const { return peers_; }
  bool is_online(const std::string& owner) const;

  // Distinct owners declaring exactly this tree.
  std::size_t replica_count(const TreeHash& tree) const;
  std::size_t online_owner_count(const ContentHash& hash) const;
  std::optional<std::chrono::system_clock::time_point> last_declared(const std::string& owner) const;
  std::vector<DeclaredRoot> roots_of(const std::string& owner) const;

private:
  friend class TreeStore;

  struct OwnedRef {
    ContentHash hash;
    EntryKind kind = EntryKind::File;
    uint64_t size = 0;
    TreeHash container;
    std::string name;

    bool operator<(const OwnedRef& rhs) const {
      return std::tie(hash, container, name) < std::tie(rhs.hash, rhs.container, rhs.name);
    }
  };

  struct RootContribution {
    DeclaredRoot info;
    std::set<OwnedRef> refs;
  };

  struct OwnerState {
    std::map<TreeHash, RootContribution> roots;
    std::chrono::system_clock::time_point last_declared{};

    std::set<OwnedRef> all_refs() const;
  };

  std::unordered_map<ContentHash, IndexEntry> entries_;
  std::map<std::string, PeerRecord> peers_;
  std::map<std::string, OwnerState> owners_;
};

struct TreeStoreOptions {
  std::chrono::seconds owner_expiry{300};
  TieBreakPolicy tie_break = TieBreakPolicy::QueryName;
};

// Process-wide content registry. Writes are serialized per owner and become
// visible in one step; reads run concurrently under a shared lock.
class TreeStore : public ContentDirectory {
public:
  explicit TreeStore(TreeStoreOptions options = {}, std::shared_ptr<Logger> logger = nullptr);

  // Inserts or refreshes every mapping reachable from the declared root.
  // Throws ProtocolError for a declaration that does not validate.
  void declare(const std::string& owner, const Declaration& declaration);
  // Removes all of the owner's roots. Returns false when it had none.
  bool withdraw(const std::string& owner);
  bool withdraw(const std::string& owner, const TreeHash& root);

  std::optional<IndexEntry> lookup(const ContentHash& hash) const;
  std::vector<ContextCandidate> rank_contexts(const ContentHash& hash, const std::string& query) const;

  void register_peer(const std::string& owner, const std::string& address);
  void mark_offline(const std::string& owner);
  // Withdraws owners offline for longer than the expiry. Returns how many.
  std::size_t expire_stale(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
  std::vector<PeerRecord> peers() const;
  std::vector<DeclaredRoot> all_declarations() const;
  // Per-owner write locks currently kept; idle ones go at each expiry sweep.
  std::size_t owner_lock_count() const;

  std::optional<TransferPlan> plan_transfer(const ContentHash& target,
                                            const TreeHash& context) override;
  std::vector<PeerRecord> seeders(const FileHash& file) override;

  template<typename Fn>
  auto read(Fn&& fn) const {
    std::shared_lock lock(mutex_);
    return fn(static_cast<const IndexState&>(state_));
  }

  const TreeStoreOptions& options() const { return options_; }
  void set_tie_break(TieBreakPolicy policy);
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  using OwnedRef = IndexState::OwnedRef;

  std::shared_ptr<std::mutex> owner_lock(const std::string& owner);
  bool withdraw_roots(const std::string& owner, const std::optional<TreeHash>& root, const char* reason);
  // Caller holds the owner lock and the exclusive lock. Returns roots removed.
  std::size_t withdraw_locked(const std::string& owner, const std::optional<TreeHash>& root);
  void prune_owner_locks();
  // Caller holds the exclusive lock.
  void apply_diff(const std::string& owner,
                  const std::set<OwnedRef>& before,
                  const std::set<OwnedRef>& after,
                  const std::map<TreeHash, std::shared_ptr<const TreeNode>>& nodes,
                  const std::map<FileHash, std::shared_ptr<const FileManifest>>& manifests);

  TreeStoreOptions options_;
  std::shared_ptr<Logger> logger_;
  mutable std::shared_mutex mutex_;
  IndexState state_;
  mutable std::mutex owner_locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> owner_locks_;
};
