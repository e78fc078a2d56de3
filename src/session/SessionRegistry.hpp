#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include "Session.hpp"

// Process-wide table of live sessions. The only structure shared between connections.
class SessionRegistry {
public:
  SessionRegistry(SessionOptions options, RecordingCatalog* catalog)
    : options_(std::move(options)), catalog_(catalog) {}

  // Claim id for one connection. False if another live connection holds it.
  bool reserve(const std::string& id);
  // Drop the claim and tear down the session, if any.
  void release(const std::string& id);

  // Create the session on first init, reconfigure it afterwards.
  std::shared_ptr<Session> initialize(const std::string& id, uint32_t sampleRate, uint32_t channels);

  std::shared_ptr<Session> find(const std::string& id) const;
  // Like find(), but throws SessionNotFound.
  std::shared_ptr<Session> require(const std::string& id) const;

  // Close and remove the session; purges its recordings when configured.
  void destroy(const std::string& id);
  void closeAll();

  size_t size() const;
  const SessionOptions& options() const { return options_; }

private:
  SessionOptions options_;
  RecordingCatalog* catalog_;
  mutable std::mutex m_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  std::unordered_set<std::string> claimed_;
};
