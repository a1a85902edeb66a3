#include "chunk_store.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "indexer.hpp"

namespace {

constexpr int kCheckpointVersion = 1;

char state_char(ChunkState state) {
  switch(state) {
    case ChunkState::Verified: return 'V';
    case ChunkState::Fetched: return 'F';
    case ChunkState::Missing: break;
  }
  return 'M';
}

// Identity of the chunk layout: file order, file digests and chunk digests.
std::string layout_fingerprint(const TransferPlan& plan) {
  Sha256Stream digest;
  for(const auto& file : plan.files) {
    digest.update(file.hash.bytes.data(), file.hash.bytes.size());
    uint32_t chunk_size = file.manifest.chunk_size;
    digest.update(&chunk_size, sizeof(chunk_size));
    for(const auto& chunk : file.manifest.chunk_hashes) {
      digest.update(chunk.bytes.data(), chunk.bytes.size());
    }
  }
  return digest.finish().to_hex();
}

void move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if(!ec) return;
  // Store and download directories may sit on different filesystems.
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if(ec) {
    throw FilesystemError(to.string(), ec.message());
  }
  std::filesystem::remove(from, ec);
}

} // namespace

ChunkStore::ChunkStore(std::filesystem::path dir,
                       std::string transfer_id,
                       TransferPlan plan,
                       std::shared_ptr<Logger> logger)
  : dir_(std::move(dir)),
    transfer_id_(std::move(transfer_id)),
    plan_(std::move(plan)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("chunk-store")) {}

ChunkStore::~ChunkStore() = default;

std::unique_ptr<ChunkStore> ChunkStore::open(const std::filesystem::path& store_root,
                                             const std::string& transfer_id,
                                             const TransferPlan& plan,
                                             std::shared_ptr<Logger> logger) {
  std::unique_ptr<ChunkStore> store(new ChunkStore(store_root / transfer_id, transfer_id, plan, std::move(logger)));
  store->build_arena();

  std::error_code ec;
  std::filesystem::create_directories(store->dir_, ec);
  if(ec) {
    throw FilesystemError(store->dir_.string(), ec.message());
  }

  if(std::filesystem::exists(store->checkpoint_path(), ec)) {
    store->load_checkpoint(store->checkpoint_path());
    store->prepare_part_files();
    store->logger_->info("Resuming {} with {}/{} chunks on disk",
                         transfer_id,
                         store->chunk_count() - store->chunks_in(ChunkState::Missing).size(),
                         store->chunk_count());
  } else {
    store->prepare_part_files();
    store->checkpoint();
    store->logger_->debug("Created store {} ({} chunks)", store->dir_.string(), store->chunk_count());
  }
  return store;
}

bool ChunkStore::remove(const std::filesystem::path& store_root, const std::string& transfer_id) {
  std::error_code ec;
  auto removed = std::filesystem::remove_all(store_root / transfer_id, ec);
  return !ec && removed > 0;
}

void ChunkStore::build_arena() {
  chunks_.clear();
  first_chunk_.clear();
  file_mutexes_.clear();
  for(std::size_t f = 0; f < plan_.files.size(); ++f) {
    const auto& manifest = plan_.files[f].manifest;
    first_chunk_.push_back(chunks_.size());
    file_mutexes_.push_back(std::make_unique<std::mutex>());
    for(std::size_t c = 0; c < manifest.chunk_count(); ++c) {
      ChunkRecord record;
      record.file_index = f;
      record.chunk_index = c;
      record.offset = manifest.chunk_offset(c);
      record.length = manifest.chunk_length(c);
      record.expected = manifest.chunk_hashes[c];
      chunks_.push_back(record);
    }
  }
}

std::filesystem::path ChunkStore::part_path(std::size_t file_index) const {
  return dir_ / (std::to_string(file_index) + ".part");
}

void ChunkStore::prepare_part_files() {
  for(std::size_t f = 0; f < plan_.files.size(); ++f) {
    auto path = part_path(f);
    std::error_code ec;
    uint64_t wanted = plan_.files[f].manifest.size;
    if(!std::filesystem::exists(path, ec)) {
      std::ofstream create(path, std::ios::binary);
      if(!create) {
        throw FilesystemError(path.string(), "cannot create part file");
      }
    }
    if(std::filesystem::file_size(path, ec) != wanted || ec) {
      std::filesystem::resize_file(path, wanted, ec);
      if(ec) {
        throw FilesystemError(path.string(), ec.message());
      }
    }
  }
}

void ChunkStore::load_checkpoint(const std::filesystem::path& file) {
  nlohmann::json doc;
  try {
    std::ifstream in(file);
    if(!in) throw StoreCorruptionError("cannot read " + file.string());
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw StoreCorruptionError("unreadable checkpoint " + file.string() + ": " + e.what());
  }

  if(doc.value("version", 0) != kCheckpointVersion) {
    throw StoreCorruptionError("unsupported checkpoint version in " + file.string());
  }
  if(doc.value("transfer_id", "") != transfer_id_ ||
     doc.value("target", "") != plan_.target.to_hex() ||
     doc.value("context", "") != plan_.context.to_hex()) {
    throw StoreCorruptionError("checkpoint " + file.string() + " belongs to another target");
  }
  if(doc.value("layout", "") != layout_fingerprint(plan_)) {
    throw StoreCorruptionError("checkpoint " + file.string() + " has a different chunk layout");
  }
  auto states = doc.value("states", "");
  if(states.size() != chunks_.size()) {
    throw StoreCorruptionError("checkpoint " + file.string() + " chunk map has the wrong length");
  }

  for(std::size_t f = 0; f < plan_.files.size(); ++f) {
    std::error_code ec;
    auto size = std::filesystem::file_size(part_path(f), ec);
    bool needs_bytes = false;
    for(std::size_t id = first_chunk_[f]; id < chunks_.size() && chunks_[id].file_index == f; ++id) {
      if(states[id] != 'M') needs_bytes = true;
    }
    if(needs_bytes && (ec || size != plan_.files[f].manifest.size)) {
      throw StoreCorruptionError("part file for " + plan_.files[f].relative_path + " is missing or truncated");
    }
  }

  std::lock_guard lg(mutex_);
  for(std::size_t id = 0; id < chunks_.size(); ++id) {
    switch(states[id]) {
      case 'V': chunks_[id].state = ChunkState::Verified; break;
      case 'F': chunks_[id].state = ChunkState::Fetched; break;
      case 'M': chunks_[id].state = ChunkState::Missing; break;
      default:
        throw StoreCorruptionError("checkpoint " + file.string() + " has an invalid chunk state");
    }
  }
}

void ChunkStore::checkpoint() {
  std::lock_guard cg(checkpoint_mutex_);
  if(finished_) return;
  std::string states;
  {
    std::lock_guard lg(mutex_);
    states.reserve(chunks_.size());
    for(const auto& c : chunks_) states.push_back(state_char(c.state));
  }

  nlohmann::json doc;
  doc["version"] = kCheckpointVersion;
  doc["transfer_id"] = transfer_id_;
  doc["target"] = plan_.target.to_hex();
  doc["context"] = plan_.context.to_hex();
  doc["layout"] = layout_fingerprint(plan_);
  doc["plan"] = transfer_plan_to_json(plan_);
  doc["states"] = states;

  auto tmp = checkpoint_path();
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      throw FilesystemError(tmp.string(), "cannot write checkpoint");
    }
    out << doc.dump();
    if(!out) {
      throw FilesystemError(tmp.string(), "short write");
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, checkpoint_path(), ec);
  if(ec) {
    throw FilesystemError(checkpoint_path().string(), ec.message());
  }
}

ChunkRecord ChunkStore::chunk(std::size_t id) const {
  std::lock_guard lg(mutex_);
  return chunks_.at(id);
}

std::optional<std::size_t> ChunkStore::chunk_id(std::size_t file_index, std::size_t chunk_index) const {
  if(file_index >= plan_.files.size()) return std::nullopt;
  if(chunk_index >= plan_.files[file_index].manifest.chunk_count()) return std::nullopt;
  return first_chunk_[file_index] + chunk_index;
}

ChunkState ChunkStore::state(std::size_t id) const {
  std::lock_guard lg(mutex_);
  return chunks_.at(id).state;
}

bool ChunkStore::has_chunk(std::size_t id) const {
  return state(id) != ChunkState::Missing;
}

std::vector<std::size_t> ChunkStore::chunks_in(ChunkState wanted) const {
  std::lock_guard lg(mutex_);
  std::vector<std::size_t> out;
  for(std::size_t id = 0; id < chunks_.size(); ++id) {
    if(chunks_[id].state == wanted) out.push_back(id);
  }
  return out;
}

uint64_t ChunkStore::bytes_present() const {
  std::lock_guard lg(mutex_);
  uint64_t total = 0;
  for(const auto& c : chunks_) {
    if(c.state != ChunkState::Missing) total += c.length;
  }
  return total;
}

uint64_t ChunkStore::bytes_verified() const {
  std::lock_guard lg(mutex_);
  uint64_t total = 0;
  for(const auto& c : chunks_) {
    if(c.state == ChunkState::Verified) total += c.length;
  }
  return total;
}

bool ChunkStore::complete() const {
  std::lock_guard lg(mutex_);
  for(const auto& c : chunks_) {
    if(c.state != ChunkState::Verified) return false;
  }
  return true;
}

void ChunkStore::write_chunk(std::size_t id, const std::vector<char>& data) {
  auto record = chunk(id);
  if(record.state == ChunkState::Verified) return;
  if(data.size() != record.length) {
    throw IntegrityError("chunk " + std::to_string(id) + " has " + std::to_string(data.size()) +
                         " bytes, expected " + std::to_string(record.length));
  }
  auto path = part_path(record.file_index);
  {
    std::lock_guard fg(*file_mutexes_[record.file_index]);
    std::fstream out(path, std::ios::in | std::ios::out | std::ios::binary);
    if(!out) {
      throw FilesystemError(path.string(), "cannot open part file");
    }
    out.seekp(static_cast<std::streamoff>(record.offset), std::ios::beg);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if(!out) {
      throw FilesystemError(path.string(), "write failed");
    }
  }
  std::lock_guard lg(mutex_);
  if(chunks_[id].state == ChunkState::Missing) {
    chunks_[id].state = ChunkState::Fetched;
  }
}

std::vector<char> ChunkStore::read_range(std::size_t file_index, uint64_t offset, uint32_t length) const {
  auto path = part_path(file_index);
  std::lock_guard fg(*file_mutexes_[file_index]);
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw FilesystemError(path.string(), "cannot open part file");
  }
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  std::vector<char> buffer(length);
  in.read(buffer.data(), static_cast<std::streamsize>(length));
  if(in.gcount() != static_cast<std::streamsize>(length)) {
    throw FilesystemError(path.string(), "short read");
  }
  return buffer;
}

bool ChunkStore::verify_chunk(std::size_t id) {
  auto record = chunk(id);
  if(record.state == ChunkState::Verified) return true;
  if(record.state == ChunkState::Missing) return false;
  auto data = read_range(record.file_index, record.offset, record.length);
  bool ok = ContentHash::of(data.data(), data.size()) == record.expected;
  std::lock_guard lg(mutex_);
  chunks_[id].state = ok ? ChunkState::Verified : ChunkState::Missing;
  return ok;
}

void ChunkStore::evict(std::size_t id) {
  std::lock_guard lg(mutex_);
  chunks_.at(id).state = ChunkState::Missing;
}

std::filesystem::path ChunkStore::finalize(const std::filesystem::path& download_root) {
  if(!complete()) {
    throw IntegrityError("transfer " + transfer_id_ + " finalized before every chunk verified");
  }
  checkpoint();
  for(std::size_t f = 0; f < plan_.files.size(); ++f) {
    auto actual = hash_file_contents(part_path(f));
    if(actual != plan_.files[f].hash) {
      throw IntegrityError(plan_.files[f].relative_path + " assembled to " + actual.short_hex() +
                           ", expected " + plan_.files[f].hash.short_hex());
    }
  }

  std::error_code ec;
  auto base = plan_.target_kind == EntryKind::Tree ? download_root / plan_.root_name : download_root;
  std::filesystem::create_directories(base, ec);
  if(ec) {
    throw FilesystemError(base.string(), ec.message());
  }
  for(const auto& dir : plan_.directories) {
    std::filesystem::create_directories(base / dir, ec);
    if(ec) {
      throw FilesystemError((base / dir).string(), ec.message());
    }
  }

  // Every destination is checked before anything leaves the store, so a
  // conflict leaves the verified chunk map usable for a retry.
  std::vector<bool> present(plan_.files.size(), false);
  for(std::size_t f = 0; f < plan_.files.size(); ++f) {
    const auto& file = plan_.files[f];
    auto dest = base / file.relative_path;
    if(!std::filesystem::exists(dest, ec)) continue;
    if(!std::filesystem::is_regular_file(dest, ec) || hash_file_contents(dest) != file.hash) {
      throw FilesystemError(dest.string(), "already exists with different content");
    }
    present[f] = true;
  }

  std::vector<std::size_t> moved;
  try {
    for(std::size_t f = 0; f < plan_.files.size(); ++f) {
      const auto& file = plan_.files[f];
      auto dest = base / file.relative_path;
      if(present[f]) {
        logger_->debug("{} already present", dest.string());
        continue;
      }
      if(dest.has_parent_path()) {
        std::filesystem::create_directories(dest.parent_path(), ec);
      }
      move_file(part_path(f), dest);
      moved.push_back(f);
    }
  } catch(const FilesystemError&) {
    // Files already moved no longer have bytes here. Their destinations hold
    // the right content and are kept as present on the next attempt.
    {
      std::lock_guard lg(mutex_);
      for(auto f : moved) {
        for(std::size_t id = first_chunk_[f]; id < chunks_.size() && chunks_[id].file_index == f; ++id) {
          chunks_[id].state = ChunkState::Missing;
        }
      }
    }
    checkpoint();
    throw;
  }

  {
    std::lock_guard cg(checkpoint_mutex_);
    finished_ = true;
  }
  std::filesystem::remove_all(dir_, ec);
  if(ec) {
    logger_->warn("Could not remove store {}: {}", dir_.string(), ec.message());
  }

  auto top = plan_.target_kind == EntryKind::Tree || plan_.files.empty()
    ? base
    : base / plan_.files.front().relative_path;
  logger_->info("Materialized {} ({} files) at {}", transfer_id_, plan_.files.size(), top.string());
  return top;
}

void ChunkStore::discard() {
  {
    std::lock_guard cg(checkpoint_mutex_);
    finished_ = true;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  if(ec) {
    logger_->warn("Could not remove store {}: {}", dir_.string(), ec.message());
  }
}
