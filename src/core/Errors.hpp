#pragma once

#include <stdexcept>
#include <string>

// Error kinds raised by the session pipeline. All are local to one session:
// the caller logs and continues, except SessionNotFound which closes the connection.

// Malformed or unrecognized control message.
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// PCM frame that cannot be decoded (empty, odd length, partial frame).
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Recording file could not be opened, written or finalized.
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Message addressed to a session that was never initialized or is already torn down.
class SessionNotFound : public std::runtime_error {
public:
  explicit SessionNotFound(const std::string& sessionId)
    : std::runtime_error("session not found: " + sessionId), sessionId_(sessionId) {}
  const std::string& sessionId() const { return sessionId_; }

private:
  std::string sessionId_;
};

// Invalid server configuration (file, environment or command line).
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
