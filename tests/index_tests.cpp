#include "content_hash.hpp"
#include "errors.hpp"
#include "indexer.hpp"
#include "log.hpp"
#include "test_runner_utils.hpp"
#include "tree.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using namespace treeswarm::test;

constexpr uint32_t kSmallChunk = 1024;

IndexResult index_dir(TestContext& ctx, const std::filesystem::path& root, uint32_t chunk_size = kSmallChunk) {
  auto logger = std::make_shared<Logger>("indexer");
  ctx.logs.attach(logger);
  IndexOptions options;
  options.chunk_size = chunk_size;
  return Indexer(options, logger).index(root);
}

const TreeEntry* root_entry(const IndexResult& result, const std::string& name) {
  const auto* node = result.declaration.node(result.declaration.root);
  return node ? node->find(name) : nullptr;
}

bool test_identical_bytes_share_file_hash(TestContext& ctx) {
  ScratchDir dir("index_same_bytes");
  auto content = patterned_bytes(3000, 7);
  write_file(dir / "share/song.mp3", content);
  write_file(dir / "share/copy of song.mp3", content);
  write_file(dir / "share/other.mp3", patterned_bytes(3000, 8));

  auto result = index_dir(ctx, dir / "share");
  const auto* a = root_entry(result, "song.mp3");
  const auto* b = root_entry(result, "copy of song.mp3");
  const auto* c = root_entry(result, "other.mp3");
  bool ok = expect(a && b && c, "all three files indexed");
  if(!ok) return false;
  ok = expect(a->hash == b->hash, "same bytes under different names hash equal") && ok;
  ok = expect(a->hash != c->hash, "different bytes hash differently") && ok;
  ok = expect(a->hash == ContentHash::of(content), "FileHash is the SHA-256 of the bytes") && ok;
  ok = expect(result.declaration.files.size() == 2, "one manifest per distinct FileHash") && ok;
  ok = expect(result.file_count == 3, "every file counted") && ok;
  return ok;
}

bool test_identical_trees_ignore_root_name(TestContext& ctx) {
  ScratchDir dir("index_same_tree");
  for(const char* root : {"alpha", "beta"}) {
    auto base = dir / root;
    write_file(base / "a.txt", "first");
    write_file(base / "sub/b.txt", "second");
    std::filesystem::create_directories(base / "sub/empty");
  }

  auto alpha = index_dir(ctx, dir / "alpha");
  auto beta = index_dir(ctx, dir / "beta");
  bool ok = expect(alpha.declaration.root == beta.declaration.root, "root TreeHash independent of root name");
  ok = expect(alpha.declaration.root_name == "alpha" && beta.declaration.root_name == "beta",
              "root names kept as declared") && ok;
  ok = expect(alpha.directory_count == 3, "root, sub and sub/empty are directories") && ok;

  write_file(dir / "beta/sub/b.txt", "Second");
  auto changed = index_dir(ctx, dir / "beta");
  ok = expect(changed.declaration.root != alpha.declaration.root, "a changed byte changes the root") && ok;

  std::filesystem::rename(dir / "alpha/a.txt", dir / "alpha/renamed.txt");
  auto renamed = index_dir(ctx, dir / "alpha");
  ok = expect(renamed.declaration.root != beta.declaration.root, "a renamed child changes the root") && ok;
  return ok;
}

bool test_chunk_manifest(TestContext& ctx) {
  ScratchDir dir("index_manifest");
  auto content = patterned_bytes(kSmallChunk * 2 + 300, 3);
  write_file(dir / "share/data.bin", content);

  auto result = index_dir(ctx, dir / "share");
  const auto* entry = root_entry(result, "data.bin");
  if(!expect(entry != nullptr, "data.bin indexed")) return false;
  const auto* manifest = result.declaration.file(entry->hash);
  if(!expect(manifest != nullptr, "manifest present")) return false;

  bool ok = expect(manifest->chunk_count() == 3, "2.3 chunks round up to 3");
  ok = expect(manifest->chunk_length(2) == 300, "last chunk holds the remainder") && ok;
  for(std::size_t i = 0; i < manifest->chunk_count() && ok; ++i) {
    auto slice = content.substr(manifest->chunk_offset(i), manifest->chunk_length(i));
    ok = expect(manifest->chunk_hashes[i] == ContentHash::of(slice),
                "chunk " + std::to_string(i) + " digest matches its byte range") && ok;
  }
  ok = expect(hash_file_contents(dir / "share/data.bin") == entry->hash, "streaming hash agrees") && ok;

  auto local = result.local_files.find(entry->hash);
  ok = expect(local != result.local_files.end() &&
              local->second.path.filename() == "data.bin", "local path recorded for serving") && ok;
  return ok;
}

bool test_empty_file_and_directory(TestContext& ctx) {
  ScratchDir dir("index_empty");
  write_file(dir / "share/empty.txt", "");
  std::filesystem::create_directories(dir / "share/nothing");

  auto result = index_dir(ctx, dir / "share");
  const auto* file = root_entry(result, "empty.txt");
  const auto* folder = root_entry(result, "nothing");
  bool ok = expect(file && folder, "empty file and empty directory both declared");
  if(!ok) return false;
  ok = expect(result.declaration.file(file->hash)->chunk_count() == 0, "empty file has no chunks") && ok;
  ok = expect(folder->kind == EntryKind::Tree && folder->size == 0, "empty directory is an empty tree") && ok;
  const auto* node = result.declaration.node(folder->hash);
  ok = expect(node && node->entries.empty(), "empty tree node carried") && ok;
  return ok;
}

bool test_symlinks_are_not_followed(TestContext& ctx) {
  ScratchDir dir("index_symlink");
  write_file(dir / "share/real.txt", "real");
  write_file(dir / "outside/secret.txt", "secret");
  std::error_code ec;
  std::filesystem::create_symlink(dir / "outside/secret.txt", dir / "share/link.txt", ec);
  std::filesystem::create_directory_symlink(dir / "outside", dir / "share/linkdir", ec);

  auto result = index_dir(ctx, dir / "share");
  bool ok = expect(root_entry(result, "real.txt") != nullptr, "regular file kept");
  ok = expect(root_entry(result, "link.txt") == nullptr, "file symlink skipped") && ok;
  ok = expect(root_entry(result, "linkdir") == nullptr, "directory symlink skipped") && ok;
  ok = expect(result.declaration.issues.empty(), "skipping a symlink is not an issue") && ok;
  return ok;
}

bool test_unreadable_entries_become_issues(TestContext& ctx) {
  ScratchDir dir("index_unreadable");
  write_file(dir / "share/ok.txt", "fine");
  write_file(dir / "share/locked.txt", "hidden");
  std::filesystem::create_directories(dir / "share/closed");
  write_file(dir / "share/closed/inner.txt", "inner");
  std::error_code ec;
  std::filesystem::permissions(dir / "share/locked.txt", std::filesystem::perms::none, ec);
  std::filesystem::permissions(dir / "share/closed", std::filesystem::perms::none, ec);

  // Privileged users read through permission bits; nothing to observe then.
  bool privileged = static_cast<bool>(std::ifstream(dir / "share/locked.txt"));

  auto result = index_dir(ctx, dir / "share");
  std::filesystem::permissions(dir / "share/closed", std::filesystem::perms::owner_all, ec);
  std::filesystem::permissions(dir / "share/locked.txt", std::filesystem::perms::owner_all, ec);

  bool ok = expect(root_entry(result, "ok.txt") != nullptr, "readable sibling still declared");
  if(privileged) return ok;
  ok = expect(root_entry(result, "locked.txt") == nullptr, "unreadable file left out") && ok;
  ok = expect(root_entry(result, "closed") == nullptr, "unlistable directory left out") && ok;
  ok = expect(result.declaration.issues.size() == 2, "both problems reported") && ok;
  ok = expect(ctx.logs.contains("Skipping"), "skips are logged") && ok;
  return ok;
}

bool test_non_utf8_names_become_issues(TestContext& ctx) {
  ScratchDir dir("index_non_utf8");
  const std::filesystem::path share = dir / std::string("r\xe9sum\xe9s");
  write_file(share / "ok.txt", "fine");
  write_file(share / std::string("caf\xe9.txt"), "latin-1 name");

  auto result = index_dir(ctx, share);
  bool ok = expect(root_entry(result, "ok.txt") != nullptr, "valid sibling declared");
  ok = expect(root_entry(result, "caf\xe9.txt") == nullptr, "undecodable name left out") && ok;
  ok = expect(result.declaration.issues.size() == 1 &&
              result.declaration.issues[0].reason == "unsupported file name", "name reported as an issue") && ok;
  ok = expect(result.declaration.root_name == "r\\xe9sum\\xe9s", "root name escaped") && ok;

  bool dumped = true;
  std::string wire;
  try {
    wire = declaration_to_json(result.declaration).dump();
  } catch(const nlohmann::json::exception&) {
    dumped = false;
  }
  ok = expect(dumped, "declaration serializes") && ok;
  ok = expect(dumped && declaration_from_json(nlohmann::json::parse(wire)).root == result.declaration.root,
              "declaration parses back") && ok;

  // A forged node whose hash re-derives but whose name does not decode.
  auto forged = result.declaration;
  TreeNode node = *forged.node(forged.root);
  node.entries[0].name = "caf\xe9.txt";
  node.canonicalize();
  forged.nodes.erase(forged.root);
  forged.root = compute_tree_hash(node);
  forged.nodes[forged.root] = node;
  bool rejected = false;
  try {
    validate_declaration(forged);
  } catch(const ProtocolError&) {
    rejected = true;
  }
  ok = expect(rejected, "non UTF-8 entry name rejected") && ok;

  auto bad_root = result.declaration;
  bad_root.root_name = "r\xe9sum\xe9s";
  rejected = false;
  try {
    validate_declaration(bad_root);
  } catch(const ProtocolError&) {
    rejected = true;
  }
  ok = expect(rejected, "non UTF-8 root name rejected") && ok;

  ok = expect(is_valid_utf8("caf\xc3\xa9") && !is_valid_utf8("\xc0\xaf") && !is_valid_utf8("\xed\xa0\x80"),
              "overlong and surrogate forms refused") && ok;
  ok = expect(escape_invalid_utf8("caf\xc3\xa9 caf\xe9") == "caf\xc3\xa9 caf\\xe9", "only bad bytes escaped") && ok;
  return ok;
}

bool test_missing_root_throws(TestContext& ctx) {
  ScratchDir dir("index_missing");
  write_file(dir / "plain.txt", "not a directory");
  bool missing = false;
  bool not_dir = false;
  try {
    index_dir(ctx, dir / "does-not-exist");
  } catch(const FilesystemError&) {
    missing = true;
  }
  try {
    index_dir(ctx, dir / "plain.txt");
  } catch(const FilesystemError& e) {
    not_dir = e.path().find("plain.txt") != std::string::npos;
  }
  return expect(missing, "missing root throws FilesystemError") &&
         expect(not_dir, "file root throws FilesystemError naming it");
}

bool test_canonical_order(TestContext&) {
  TreeNode a;
  a.entries.push_back({"zeta", EntryKind::File, ContentHash::of("z"), 1});
  a.entries.push_back({"Alpha", EntryKind::File, ContentHash::of("a"), 1});
  a.entries.push_back({"beta", EntryKind::Tree, ContentHash::of("b"), 0});
  TreeNode b;
  b.entries = {a.entries[2], a.entries[0], a.entries[1]};
  a.canonicalize();
  b.canonicalize();
  bool ok = expect(compute_tree_hash(a) == compute_tree_hash(b), "insertion order does not matter");
  ok = expect(a.entries.front().name == "Alpha", "byte-wise order puts uppercase first") && ok;

  TreeNode as_tree = a;
  as_tree.entries[0].kind = EntryKind::Tree;
  ok = expect(compute_tree_hash(as_tree) != compute_tree_hash(a), "entry kind is part of the hash") && ok;
  return ok;
}

bool test_declaration_json(TestContext& ctx) {
  ScratchDir dir("index_json");
  write_file(dir / "share/a.txt", patterned_bytes(2500, 1));
  write_file(dir / "share/sub/b.txt", patterned_bytes(10, 2));
  auto result = index_dir(ctx, dir / "share");

  auto j = declaration_to_json(result.declaration);
  auto decoded = declaration_from_json(nlohmann::json::parse(j.dump()));
  bool ok = expect(decoded.root == result.declaration.root, "root survives the wire");
  ok = expect(decoded.nodes.size() == result.declaration.nodes.size(), "every node survives") && ok;
  ok = expect(decoded.files.size() == result.declaration.files.size(), "every manifest survives") && ok;

  auto renamed = j;
  auto root_hex = result.declaration.root.to_hex();
  renamed["nodes"][root_hex][0]["name"] = "tampered.txt";
  bool tamper_rejected = false;
  try {
    declaration_from_json(renamed);
  } catch(const ProtocolError&) {
    tamper_rejected = true;
  }
  ok = expect(tamper_rejected, "node contents must match their hash") && ok;

  auto missing_file = j;
  missing_file["files"] = nlohmann::json::object();
  bool missing_rejected = false;
  try {
    declaration_from_json(missing_file);
  } catch(const ProtocolError&) {
    missing_rejected = true;
  }
  ok = expect(missing_rejected, "referenced manifests must be present") && ok;

  bool bad_hex = false;
  try {
    auto broken = j;
    broken["root"] = "xyz";
    declaration_from_json(broken);
  } catch(const ProtocolError&) {
    bad_hex = true;
  }
  ok = expect(bad_hex, "malformed root hash rejected") && ok;
  return ok;
}

bool test_hash_text_form(TestContext&) {
  auto h = ContentHash::of("treeswarm");
  auto parsed = ContentHash::from_hex(h.to_hex());
  bool ok = expect(parsed && *parsed == h, "hex form parses back");
  ok = expect(h.short_hex() == h.to_hex().substr(0, 8), "short form is the hex prefix") && ok;
  ok = expect(!ContentHash::from_hex("abc"), "short hex rejected") && ok;
  ok = expect(!ContentHash::from_hex(std::string(64, 'g')), "non-hex rejected") && ok;
  ok = expect(ContentHash{}.is_zero() && !h.is_zero(), "zero hash detected") && ok;
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"identical_bytes_share_file_hash", test_identical_bytes_share_file_hash},
    {"identical_trees_ignore_root_name", test_identical_trees_ignore_root_name},
    {"chunk_manifest", test_chunk_manifest},
    {"empty_file_and_directory", test_empty_file_and_directory},
    {"symlinks_are_not_followed", test_symlinks_are_not_followed},
    {"unreadable_entries_become_issues", test_unreadable_entries_become_issues},
    {"non_utf8_names_become_issues", test_non_utf8_names_become_issues},
    {"missing_root_throws", test_missing_root_throws},
    {"canonical_order", test_canonical_order},
    {"declaration_json", test_declaration_json},
    {"hash_text_form", test_hash_text_form},
  };
  return run_suite("index", tests, argc, argv);
}
