#include "consensus.hpp"
#include "errors.hpp"
#include "indexer.hpp"
#include "log.hpp"
#include "test_runner_utils.hpp"
#include "tree_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace treeswarm::test;
using Files = std::map<std::string, std::string>;

IndexResult make_share(const ScratchDir& dir, const std::string& root, const Files& files) {
  auto base = dir.path() / root;
  for(const auto& [relative, content] : files) {
    write_file(base / relative, content);
  }
  IndexOptions options;
  options.chunk_size = 1024;
  return Indexer(options).index(base);
}

std::shared_ptr<TreeStore> make_store(TestContext& ctx, TreeStoreOptions options = {}) {
  auto logger = std::make_shared<Logger>("tree-store");
  ctx.logs.attach(logger);
  return std::make_shared<TreeStore>(options, logger);
}

const TreeEntry* child(const IndexResult& share, const std::string& name) {
  return share.declaration.node(share.declaration.root)->find(name);
}

bool test_redeclare_is_idempotent(TestContext& ctx) {
  ScratchDir dir("store_idempotent");
  auto share = make_share(dir, "music", {{"song.mp3", "la la la"}, {"cover.jpg", "jpeg"}});
  auto store = make_store(ctx);
  store->declare("alice", share.declaration);
  auto song = child(share, "song.mp3")->hash;
  auto before = store->lookup(song);

  store->declare("alice", share.declaration);
  auto after = store->lookup(song);
  bool ok = expect(before && after, "song indexed");
  if(!ok) return false;
  ok = expect(before->refs == after->refs, "refs unchanged by a repeat declare") && ok;
  ok = expect(after->owner_count() == 1, "still one owner") && ok;
  ok = expect(store->all_declarations().size() == 1, "still one declared root") && ok;
  ok = expect(ctx.logs.contains("refreshed"), "repeat declare logged as a refresh") && ok;
  return ok;
}

bool test_withdraw_prunes_entries(TestContext& ctx) {
  ScratchDir dir("store_withdraw");
  auto shared_song = std::string("shared bytes");
  auto a = make_share(dir, "a", {{"song.mp3", shared_song}, {"only-a.txt", "a"}});
  auto b = make_share(dir, "b", {{"tune.mp3", shared_song}});
  auto store = make_store(ctx);
  store->declare("alice", a.declaration);
  store->declare("bob", b.declaration);

  auto song = child(a, "song.mp3")->hash;
  auto only_a = child(a, "only-a.txt")->hash;
  bool ok = expect(store->lookup(song)->owner_count() == 2, "both own the shared song");

  ok = expect(store->withdraw("alice"), "alice had roots") && ok;
  ok = expect(!store->withdraw("alice"), "second withdraw finds nothing") && ok;
  auto entry = store->lookup(song);
  ok = expect(entry && entry->owner_count() == 1 && *entry->owners().begin() == "bob",
              "alice removed from shared entry") && ok;
  ok = expect(!store->lookup(only_a), "entry with no owners left is pruned") && ok;
  ok = expect(!store->lookup(a.declaration.root), "alice's root pruned") && ok;
  ok = expect(store->lookup(b.declaration.root).has_value(), "bob's root untouched") && ok;
  return ok;
}

bool test_withdraw_single_root(TestContext& ctx) {
  ScratchDir dir("store_withdraw_one");
  auto first = make_share(dir, "first", {{"x.txt", "x"}});
  auto second = make_share(dir, "second", {{"y.txt", "y"}});
  auto store = make_store(ctx);
  store->declare("alice", first.declaration);
  store->declare("alice", second.declaration);

  bool ok = expect(store->withdraw("alice", first.declaration.root), "first root withdrawn");
  ok = expect(!store->lookup(child(first, "x.txt")->hash), "its file is gone") && ok;
  ok = expect(store->lookup(child(second, "y.txt")->hash).has_value(), "the other root stays") && ok;
  ok = expect(!store->withdraw("alice", first.declaration.root), "withdrawing it again is a no-op") && ok;
  return ok;
}

bool test_redeclare_changed_tree_replaces_refs(TestContext& ctx) {
  ScratchDir dir("store_changed");
  auto v1 = make_share(dir, "docs", {{"old.txt", "old"}, {"keep.txt", "keep"}});
  auto store = make_store(ctx);
  store->declare("alice", v1.declaration);

  std::filesystem::remove(dir / "docs/old.txt");
  write_file(dir / "docs/new.txt", "new");
  auto v2 = Indexer().index(dir / "docs");
  store->declare("alice", v2.declaration);
  store->withdraw("alice", v1.declaration.root);

  bool ok = expect(!store->lookup(child(v1, "old.txt")->hash), "file only in the old tree dropped");
  ok = expect(store->lookup(child(v2, "new.txt")->hash).has_value(), "file of the new tree present") && ok;
  auto keep = store->lookup(child(v2, "keep.txt")->hash);
  ok = expect(keep && keep->refs.size() == 1, "shared file now referenced from the new tree only") && ok;
  return ok;
}

bool test_declare_rejects_invalid(TestContext& ctx) {
  ScratchDir dir("store_invalid");
  auto share = make_share(dir, "x", {{"a.txt", "a"}});
  auto store = make_store(ctx);
  auto broken = share.declaration;
  broken.files.clear();
  bool rejected = false;
  try {
    store->declare("alice", broken);
  } catch(const ProtocolError&) {
    rejected = true;
  }
  bool anonymous = false;
  try {
    store->declare("", share.declaration);
  } catch(const ProtocolError&) {
    anonymous = true;
  }
  bool ok = expect(rejected, "declaration without manifests rejected");
  ok = expect(anonymous, "declaration without an owner rejected") && ok;
  ok = expect(store->all_declarations().empty(), "nothing registered") && ok;
  return ok;
}

bool test_consensus_prefers_replicas(TestContext& ctx) {
  ScratchDir dir("store_consensus");
  const std::string song = "identical song bytes";
  // Three owners share layout A, one has layout B.
  std::vector<IndexResult> shares;
  for(int i = 0; i < 3; ++i) {
    shares.push_back(make_share(dir, "a" + std::to_string(i), {{"song.mp3", song}, {"intro.mp3", "intro"}}));
  }
  auto variant_b = make_share(dir, "b", {{"Song (remaster).mp3", song}});
  auto store = make_store(ctx);
  for(int i = 0; i < 3; ++i) {
    store->declare("owner" + std::to_string(i), shares[static_cast<std::size_t>(i)].declaration);
  }
  store->declare("other", variant_b.declaration);

  auto hash = child(variant_b, "Song (remaster).mp3")->hash;
  auto ranked = store->rank_contexts(hash, "Song (remaster).mp3");
  bool ok = expect(ranked.size() == 2, "two tree variants hold the song");
  if(!ok) return false;
  ok = expect(ranked[0].tree == shares[0].declaration.root, "variant with most owners first") && ok;
  ok = expect(ranked[0].replica_count == 3 && ranked[1].replica_count == 1, "replica counts reported") && ok;
  ok = expect(!is_ambiguous(ranked), "different replica counts are not ambiguous") && ok;
  ok = expect(ranked[0].display_name == "song.mp3", "leading variant shows its own name") && ok;
  return ok;
}

bool test_tie_break_policies(TestContext& ctx) {
  ScratchDir dir("store_tie_break");
  const std::string bytes = "tied song";
  auto t1 = make_share(dir, "music", {{"song.mp3", bytes}});
  auto t2 = make_share(dir, "collection", {{"music/song.mp3", bytes}, {"music/extra.txt", "extra"}});
  auto song = child(t1, "song.mp3")->hash;

  TreeStoreOptions options;
  auto store = make_store(ctx, options);
  store->declare("a", t1.declaration);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  store->declare("b", t2.declaration);

  auto ranked = store->rank_contexts(song, "song.mp3");
  bool ok = expect(ranked.size() == 2 && is_ambiguous(ranked), "equal replicas and names are ambiguous");
  ok = expect(ranked[0].display_name == "song.mp3", "query name is the default display") && ok;

  options.tie_break = TieBreakPolicy::MostRecent;
  auto recent = make_store(ctx, options);
  recent->declare("a", t1.declaration);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  recent->declare("b", t2.declaration);
  auto by_recent = recent->rank_contexts(song, "song.mp3");
  auto inner = t2.declaration.node(t2.declaration.root)->find("music")->hash;
  ok = expect(!by_recent.empty() && by_recent[0].tree == inner, "most recent declaration first") && ok;

  ok = expect(parse_tie_break_policy("lexicographic") == TieBreakPolicy::Lexicographic, "policy parses") && ok;
  ok = expect(!parse_tie_break_policy("coin-flip"), "unknown policy rejected") && ok;
  return ok;
}

bool test_peer_registry_and_expiry(TestContext& ctx) {
  ScratchDir dir("store_expiry");
  auto share = make_share(dir, "x", {{"a.txt", "a"}});
  TreeStoreOptions options;
  options.owner_expiry = std::chrono::seconds(60);
  auto store = make_store(ctx, options);
  store->register_peer("alice", "127.0.0.1:7001");
  store->declare("alice", share.declaration);
  auto file = child(share, "a.txt")->hash;

  auto seeders = store->seeders(file);
  bool ok = expect(seeders.size() == 1 && seeders[0].address == "127.0.0.1:7001", "online seeder with address");

  store->mark_offline("alice");
  ok = expect(store->seeders(file).empty(), "offline owners are not seeders") && ok;
  ok = expect(store->lookup(file).has_value(), "offline owner's content stays indexed") && ok;

  auto now = std::chrono::system_clock::now();
  ok = expect(store->expire_stale(now) == 0, "not expired before the deadline") && ok;
  ok = expect(store->expire_stale(now + std::chrono::seconds(61)) == 1, "expired after the deadline") && ok;
  ok = expect(!store->lookup(file), "expiry withdraws the owner's content") && ok;
  ok = expect(store->peers().empty(), "expired peer forgotten") && ok;

  store->register_peer("bob", "127.0.0.1:7002");
  store->mark_offline("bob");
  store->register_peer("bob", "127.0.0.1:7003");
  ok = expect(store->expire_stale(now + std::chrono::hours(1)) == 0, "reconnected peer survives expiry") && ok;
  ok = expect(ctx.logs.contains("expired"), "expiry logged") && ok;
  return ok;
}

bool test_expiry_rechecks_and_sweeps_owner_locks(TestContext& ctx) {
  ScratchDir dir("store_expiry_locks");
  auto share = make_share(dir, "x", {{"a.txt", "a"}});
  TreeStoreOptions options;
  options.owner_expiry = std::chrono::seconds(60);
  auto store = make_store(ctx, options);
  auto file = child(share, "a.txt")->hash;
  for(const auto* owner : {"alice", "bob", "carol"}) {
    store->register_peer(owner, "");
    store->declare(owner, share.declaration);
  }
  store->withdraw("carol");
  bool ok = expect(store->owner_lock_count() == 3, "one write lock per owner that wrote");

  store->mark_offline("alice");
  store->mark_offline("bob");
  store->register_peer("bob", "127.0.0.1:7002");
  auto later = std::chrono::system_clock::now() + std::chrono::minutes(5);
  ok = expect(store->expire_stale(later) == 1, "only the peer still offline expires") && ok;
  ok = expect(store->seeders(file).size() == 1 && store->seeders(file)[0].owner == "bob",
              "the returning peer keeps its declarations") && ok;
  ok = expect(store->owner_lock_count() == 0, "idle owner locks swept") && ok;

  store->declare("carol", share.declaration);
  ok = expect(store->lookup(file)->owner_count() == 2, "a swept owner can write again") && ok;
  return ok;
}

bool test_all_declarations(TestContext& ctx) {
  ScratchDir dir("store_all");
  auto a = make_share(dir, "movies", {{"film.mkv", "film"}});
  auto b = make_share(dir, "books", {{"book.epub", "book"}});
  auto store = make_store(ctx);
  store->declare("alice", a.declaration);
  store->declare("bob", b.declaration);

  auto all = store->all_declarations();
  bool ok = expect(all.size() == 2, "one row per declared root");
  std::map<std::string, DeclaredRoot> by_owner;
  for(const auto& root : all) by_owner[root.owner] = root;
  ok = expect(by_owner["alice"].root_name == "movies" && by_owner["alice"].size == 4, "alice's root listed") && ok;
  ok = expect(by_owner["bob"].root == b.declaration.root, "bob's root listed") && ok;
  return ok;
}

bool test_plan_transfer(TestContext& ctx) {
  ScratchDir dir("store_plan");
  std::filesystem::create_directories(dir / "album/empty");
  auto share = make_share(dir, "album", {
    {"01.flac", patterned_bytes(2500, 1)},
    {"art/front.png", patterned_bytes(100, 2)},
  });
  auto store = make_store(ctx);
  store->declare("alice", share.declaration);

  auto folder = store->plan_transfer(share.declaration.root, TreeHash{});
  bool ok = expect(folder.has_value(), "declared root plans");
  if(!ok) return false;
  ok = expect(folder->target_kind == EntryKind::Tree && folder->root_name == "album", "folder plan named after root") && ok;
  ok = expect(folder->files.size() == 2 && folder->total_bytes() == 2600, "every file planned") && ok;
  ok = expect(folder->total_chunks() == 4, "chunks of every file counted") && ok;
  bool has_empty = false;
  for(const auto& d : folder->directories) has_empty = has_empty || d == "empty";
  ok = expect(has_empty, "empty directories are recreated") && ok;

  auto flac = child(share, "01.flac")->hash;
  auto file = store->plan_transfer(flac, TreeHash{});
  ok = expect(file && file->target_kind == EntryKind::File && file->root_name == "01.flac", "file plan") && ok;
  ok = expect(file && file->context == share.declaration.root, "best context chosen when none given") && ok;

  ok = expect(!store->plan_transfer(ContentHash::of("unknown"), TreeHash{}), "unknown target") && ok;
  ok = expect(!store->plan_transfer(flac, ContentHash::of("elsewhere")), "target outside the given context") && ok;
  return ok;
}

bool test_concurrent_declare_and_read(TestContext& ctx) {
  ScratchDir dir("store_concurrent");
  std::vector<IndexResult> shares;
  for(int i = 0; i < 4; ++i) {
    shares.push_back(make_share(dir, "s" + std::to_string(i), {
      {"common.bin", "common"},
      {"own" + std::to_string(i) + ".bin", "own" + std::to_string(i)},
    }));
  }
  auto common = child(shares[0], "common.bin")->hash;
  auto store = make_store(ctx);

  std::atomic<bool> torn{false};
  std::atomic<bool> done{false};
  std::thread reader([&]{
    while(!done.load()) {
      store->read([&](const IndexState& state){
        for(const auto& [hash, entry] : state.entries()) {
          if(entry.refs.empty()) torn = true;
        }
        return 0;
      });
    }
  });
  std::vector<std::thread> writers;
  for(int i = 0; i < 4; ++i) {
    writers.emplace_back([&, i]{
      auto owner = "owner" + std::to_string(i);
      for(int round = 0; round < 25; ++round) {
        store->declare(owner, shares[static_cast<std::size_t>(i)].declaration);
        if(round % 5 == 4) store->withdraw(owner);
      }
      store->declare(owner, shares[static_cast<std::size_t>(i)].declaration);
    });
  }
  for(auto& w : writers) w.join();
  done = true;
  reader.join();

  auto entry = store->lookup(common);
  bool ok = expect(!torn.load(), "readers never observe a half-applied declaration");
  ok = expect(entry && entry->owner_count() == 4, "every owner ends up holding the common file") && ok;
  ok = expect(store->all_declarations().size() == 4, "one root per owner") && ok;
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"redeclare_is_idempotent", test_redeclare_is_idempotent},
    {"withdraw_prunes_entries", test_withdraw_prunes_entries},
    {"withdraw_single_root", test_withdraw_single_root},
    {"redeclare_changed_tree_replaces_refs", test_redeclare_changed_tree_replaces_refs},
    {"declare_rejects_invalid", test_declare_rejects_invalid},
    {"consensus_prefers_replicas", test_consensus_prefers_replicas},
    {"tie_break_policies", test_tie_break_policies},
    {"peer_registry_and_expiry", test_peer_registry_and_expiry},
    {"expiry_rechecks_and_sweeps_owner_locks", test_expiry_rechecks_and_sweeps_owner_locks},
    {"all_declarations", test_all_declarations},
    {"plan_transfer", test_plan_transfer},
    {"concurrent_declare_and_read", test_concurrent_declare_and_read},
  };
  return run_suite("tree store", tests, argc, argv);
}
