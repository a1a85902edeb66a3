#include "indexer.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

FileHash hash_file_contents(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if(!in) {
    throw FilesystemError(file.string(), "cannot open for reading");
  }
  Sha256Stream digest;
  std::array<char, 8192> buffer{};
  while(in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize read = in.gcount();
    if(read > 0) digest.update(buffer.data(), static_cast<std::size_t>(read));
  }
  if(in.bad()) {
    throw FilesystemError(file.string(), "read error");
  }
  return digest.finish();
}

Indexer::Indexer(IndexOptions options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("indexer")) {
  if(options_.chunk_size == 0) {
    options_.chunk_size = kDefaultChunkSize;
  }
}

FileManifest Indexer::hash_file(const std::filesystem::path& file, FileHash& file_hash) const {
  std::ifstream in(file, std::ios::binary);
  if(!in) {
    throw FilesystemError(file.string(), "cannot open for reading");
  }

  FileManifest manifest;
  manifest.chunk_size = options_.chunk_size;

  Sha256Stream whole;
  Sha256Stream chunk;
  uint64_t in_chunk = 0;

  std::array<char, 8192> buffer{};
  while(in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize read = in.gcount();
    if(read <= 0) break;
    const char* cursor = buffer.data();
    auto remaining = static_cast<uint64_t>(read);
    whole.update(cursor, remaining);
    manifest.size += remaining;
    while(remaining > 0) {
      uint64_t take = std::min<uint64_t>(remaining, options_.chunk_size - in_chunk);
      chunk.update(cursor, take);
      in_chunk += take;
      cursor += take;
      remaining -= take;
      if(in_chunk == options_.chunk_size) {
        manifest.chunk_hashes.push_back(chunk.finish());
        chunk = Sha256Stream();
        in_chunk = 0;
      }
    }
  }
  if(in.bad()) {
    throw FilesystemError(file.string(), "read error");
  }
  if(in_chunk > 0) {
    manifest.chunk_hashes.push_back(chunk.finish());
  }
  file_hash = whole.finish();
  return manifest;
}

void Indexer::record_issue(IndexResult& result,
                           const std::filesystem::path& path,
                           const std::string& reason) const {
  auto shown = escape_invalid_utf8(path.string());
  logger_->warn("Skipping {}: {}", shown, reason);
  result.declaration.issues.push_back({shown, reason});
}

TreeEntry Indexer::index_directory(const std::filesystem::path& dir,
                                   const std::filesystem::path& root,
                                   IndexResult& result) const {
  TreeNode node;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if(ec) {
    throw FilesystemError(dir.string(), ec.message());
  }

  for(; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if(ec) break;
    const auto& path = it->path();
    auto name = path.filename().string();
    if(!is_valid_entry_name(name)) {
      record_issue(result, path, "unsupported file name");
      continue;
    }

    std::error_code status_ec;
    auto status = it->symlink_status(status_ec);
    if(status_ec) {
      record_issue(result, path, status_ec.message());
      continue;
    }
    if(std::filesystem::is_symlink(status)) {
      logger_->debug("Ignoring symlink {}", path.string());
      continue;
    }

    if(std::filesystem::is_directory(status)) {
      try {
        auto child = index_directory(path, root, result);
        child.name = name;
        node.entries.push_back(std::move(child));
      } catch(const FilesystemError& e) {
        record_issue(result, path, e.what());
      }
    } else if(std::filesystem::is_regular_file(status)) {
      try {
        FileHash hash;
        auto manifest = hash_file(path, hash);
        TreeEntry entry;
        entry.name = name;
        entry.kind = EntryKind::File;
        entry.hash = hash;
        entry.size = manifest.size;
        result.local_files.emplace(hash, LocalFile{path, manifest});
        result.declaration.files.emplace(hash, std::move(manifest));
        node.entries.push_back(std::move(entry));
        ++result.file_count;
      } catch(const FilesystemError& e) {
        record_issue(result, path, e.what());
      }
    } else {
      logger_->debug("Ignoring special file {}", path.string());
    }
  }
  if(ec) {
    // Partial listing: what was read so far is kept.
    record_issue(result, dir, "listing interrupted: " + ec.message());
  }

  node.canonicalize();
  TreeEntry entry;
  entry.kind = EntryKind::Tree;
  entry.hash = compute_tree_hash(node);
  entry.size = node.total_size();
  result.declaration.nodes.emplace(entry.hash, std::move(node));
  ++result.directory_count;
  logger_->debug("Indexed {} -> {}", dir.lexically_relative(root).generic_string(), entry.hash.short_hex());
  return entry;
}

IndexResult Indexer::index(const std::filesystem::path& root) const {
  std::error_code ec;
  auto absolute = std::filesystem::weakly_canonical(root, ec);
  if(ec) absolute = root;
  if(!absolute.has_filename() && absolute.has_parent_path()) {
    absolute = absolute.parent_path();
  }
  if(!std::filesystem::is_directory(absolute, ec)) {
    throw FilesystemError(root.string(), "not a directory");
  }

  IndexResult result;
  auto top = index_directory(absolute, absolute, result);
  result.declaration.root = top.hash;
  result.declaration.root_name = absolute.filename().string();
  if(result.declaration.root_name.empty()) {
    result.declaration.root_name = absolute.root_path().string();
  }
  result.declaration.root_name = escape_invalid_utf8(result.declaration.root_name);
  logger_->info("Indexed {} ({} files, {} dirs, {}) root {}{}",
                absolute.string(),
                result.file_count,
                result.directory_count,
                format_size(top.size),
                top.hash.short_hex(),
                result.declaration.issues.empty()
                  ? std::string()
                  : fmt::format(", {} skipped", result.declaration.issues.size()));
  return result;
}
