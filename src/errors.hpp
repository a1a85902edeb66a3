#pragma once

#include <stdexcept>
#include <string>

class SwarmError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Unreadable file or directory. Indexing records these per item and keeps going.
class FilesystemError : public SwarmError {
public:
  FilesystemError(const std::string& path, const std::string& reason)
    : SwarmError(path + ": " + reason), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class IntegrityError : public SwarmError {
public:
  using SwarmError::SwarmError;
};

class PeerUnavailableError : public SwarmError {
public:
  PeerUnavailableError(const std::string& peer_id, const std::string& reason)
    : SwarmError("peer " + peer_id + " unavailable: " + reason), peer_id_(peer_id) {}

  const std::string& peer_id() const { return peer_id_; }

private:
  std::string peer_id_;
};

// Persisted chunk map is unreadable or belongs to another target.
class StoreCorruptionError : public SwarmError {
public:
  using SwarmError::SwarmError;
};

class ProtocolError : public SwarmError {
public:
  using SwarmError::SwarmError;
};

class QueryError : public SwarmError {
public:
  using SwarmError::SwarmError;
};
