#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "transfer_plan.hpp"

enum class ChunkState : uint8_t { Missing, Fetched, Verified };

struct ChunkRecord {
  std::size_t file_index = 0;
  std::size_t chunk_index = 0;
  uint64_t offset = 0;
  uint32_t length = 0;
  ContentHash expected;
  ChunkState state = ChunkState::Missing;
};

// Chunk-addressable container for one transfer. Chunks of every planned file
// live in a single arena indexed by chunk id; bytes go to pre-sized part files
// under <store_root>/<transfer_id>/ and the chunk map is checkpointed next to
// them so a later open resumes instead of starting over.
class ChunkStore {
public:
  // Throws StoreCorruptionError when an existing checkpoint is unreadable or
  // describes another target, FilesystemError when the store cannot be created.
  static std::unique_ptr<ChunkStore> open(const std::filesystem::path& store_root,
                                          const std::string& transfer_id,
                                          const TransferPlan& plan,
                                          std::shared_ptr<Logger> logger = nullptr);
  // Deletes a transfer's store directory. Returns false when nothing was there.
  static bool remove(const std::filesystem::path& store_root, const std::string& transfer_id);

  ~ChunkStore();

  const TransferPlan& plan() const { return plan_; }
  const std::string& transfer_id() const { return transfer_id_; }
  const std::filesystem::path& directory() const { return dir_; }

  std::size_t chunk_count() const { return chunks_.size(); }
  ChunkRecord chunk(std::size_t id) const;
  std::optional<std::size_t> chunk_id(std::size_t file_index, std::size_t chunk_index) const;

  ChunkState state(std::size_t id) const;
  bool has_chunk(std::size_t id) const;
  std::vector<std::size_t> chunks_in(ChunkState state) const;
  uint64_t bytes_present() const;
  uint64_t bytes_verified() const;
  bool complete() const;

  // Out-of-order write. Throws IntegrityError on a length mismatch and
  // FilesystemError on I/O failure.
  void write_chunk(std::size_t id, const std::vector<char>& data);
  // Reads the chunk back and checks it against its expected digest. A
  // mismatch evicts the chunk and returns false.
  bool verify_chunk(std::size_t id);
  void evict(std::size_t id);

  void checkpoint();

  // Requires every chunk verified. Checks each whole file against its
  // FileHash, recreates the planned hierarchy under download_root and removes
  // the store. Returns the materialized top-level path.
  std::filesystem::path finalize(const std::filesystem::path& download_root);
  void discard();

private:
  ChunkStore(std::filesystem::path dir, std::string transfer_id, TransferPlan plan, std::shared_ptr<Logger> logger);

  void build_arena();
  void prepare_part_files();
  void load_checkpoint(const std::filesystem::path& file);
  std::filesystem::path part_path(std::size_t file_index) const;
  std::filesystem::path checkpoint_path() const { return dir_ / "checkpoint.json"; }
  std::vector<char> read_range(std::size_t file_index, uint64_t offset, uint32_t length) const;

  std::filesystem::path dir_;
  std::string transfer_id_;
  TransferPlan plan_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::vector<ChunkRecord> chunks_;
  std::vector<std::size_t> first_chunk_; // per file, offset into chunks_
  std::vector<std::unique_ptr<std::mutex>> file_mutexes_;
  mutable std::mutex checkpoint_mutex_;
  bool finished_ = false;
};
