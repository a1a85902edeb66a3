#include "share_service.hpp"

#include <fstream>

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

ShareService::ShareService(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("share")) {}

void ShareService::publish(const IndexResult& result) {
  std::lock_guard lg(m_);
  files_ = result.local_files;
  logger_->info("Serving {} files", files_.size());
}

std::size_t ShareService::file_count() const {
  std::lock_guard lg(m_);
  return files_.size();
}

bool ShareService::find(const FileHash& hash, LocalFile& out) const {
  std::lock_guard lg(m_);
  auto it = files_.find(hash);
  if(it == files_.end()) return false;
  out = it->second;
  return true;
}

void ShareService::on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) {
  conn->async_send_json(handle_request(message));
}

nlohmann::json ShareService::handle_request(const nlohmann::json& request) const {
  const std::string type = string_field(request, "type");
  try {
    if(type == "offer") return handle_offer(request);
    if(type == "chunk") return handle_chunk(request);
    if(type == "hello") return make_response(request);
  } catch(const ProtocolError& e) {
    logger_->warn("Rejected {}: {}", type, e.what());
    return make_error_response(request, std::string(kUnavailable) + ": " + e.what());
  } catch(const nlohmann::json::exception& e) {
    logger_->warn("Rejected malformed {}: {}", type, e.what());
    return make_error_response(request, std::string(kUnavailable) + ": malformed request: " + e.what());
  }
  return make_error_response(request, "unknown request type '" + type + "'");
}

nlohmann::json ShareService::handle_offer(const nlohmann::json& request) const {
  auto file = parse_hash_field(request, "file");
  LocalFile local;
  if(!find(file, local)) {
    return make_error_response(request, std::string(kUnavailable) + ": not shared here");
  }
  auto response = make_response(request);
  response["file"] = file.to_hex();
  nlohmann::json chunks = nlohmann::json::array();
  for(std::size_t i = 0; i < local.manifest.chunk_count(); ++i) chunks.push_back(i);
  response["chunks"] = chunks;
  return response;
}

nlohmann::json ShareService::handle_chunk(const nlohmann::json& request) const {
  auto file = parse_hash_field(request, "file");
  uint64_t offset = request.value("offset", uint64_t{0});
  uint64_t length = request.value("length", uint64_t{0});

  LocalFile local;
  if(!find(file, local)) {
    return make_error_response(request, std::string(kUnavailable) + ": not shared here");
  }
  if(length == 0 || length > kMaxServedChunk || offset + length > local.manifest.size) {
    return make_error_response(request, std::string(kUnavailable) + ": range outside file");
  }

  std::ifstream in(local.path, std::ios::binary);
  if(!in) {
    logger_->warn("Cannot open {} for {}", local.path.string(), file.short_hex());
    return make_error_response(request, std::string(kUnavailable) + ": cannot open file");
  }
  std::vector<char> buffer(static_cast<std::size_t>(length));
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  in.read(buffer.data(), static_cast<std::streamsize>(length));
  if(in.gcount() != static_cast<std::streamsize>(length)) {
    logger_->warn("Short read of {} at {}", local.path.string(), offset);
    return make_error_response(request, std::string(kUnavailable) + ": file changed on disk");
  }

  auto response = make_response(request);
  response["file"] = file.to_hex();
  response["index"] = request.value("index", std::size_t{0});
  response["offset"] = offset;
  response["length"] = buffer.size();
  response["chunk_sha"] = sha256_hex(std::string(buffer.data(), buffer.size()));
  response["data"] = base64_encode(buffer.data(), buffer.size());
  return response;
}
