#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>

#include "log.hpp"
#include "tree.hpp"

inline constexpr uint32_t kDefaultChunkSize = 256 * 1024;

struct IndexOptions {
  uint32_t chunk_size = kDefaultChunkSize;
};

struct LocalFile {
  std::filesystem::path path;
  FileManifest manifest;
};

struct IndexResult {
  Declaration declaration;
  // Where each indexed FileHash can be read back from, for serving chunks.
  std::map<FileHash, LocalFile> local_files;
  std::size_t file_count = 0;
  std::size_t directory_count = 0;
};

// Whole-file digest only. Throws FilesystemError.
FileHash hash_file_contents(const std::filesystem::path& file);

// Walks a root directory and produces its Declaration. Read only.
class Indexer {
public:
  explicit Indexer(IndexOptions options = {}, std::shared_ptr<Logger> logger = nullptr);

  // Throws FilesystemError when the root itself is missing or not a directory.
  // Problems below the root are recorded in declaration.issues.
  IndexResult index(const std::filesystem::path& root) const;

  // One streaming pass yields the FileHash and every chunk digest.
  // Throws FilesystemError.
  FileManifest hash_file(const std::filesystem::path& file, FileHash& file_hash) const;

  const IndexOptions& options() const { return options_; }

private:
  TreeEntry index_directory(const std::filesystem::path& dir,
                            const std::filesystem::path& root,
                            IndexResult& result) const;
  void record_issue(IndexResult& result,
                    const std::filesystem::path& path,
                    const std::string& reason) const;

  IndexOptions options_;
  std::shared_ptr<Logger> logger_;
};
