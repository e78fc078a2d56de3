#include "SessionRegistry.hpp"
#include <cstdio>
#include <vector>
#include "../core/Errors.hpp"

bool SessionRegistry::reserve(const std::string& id) {
  std::lock_guard<std::mutex> lock(m_);
  return claimed_.insert(id).second;
}

void SessionRegistry::release(const std::string& id) {
  destroy(id);
  std::lock_guard<std::mutex> lock(m_);
  claimed_.erase(id);
}

std::shared_ptr<Session> SessionRegistry::initialize(const std::string& id, uint32_t sampleRate, uint32_t channels) {
  std::shared_ptr<Session> s = find(id);
  if (s) {
    // Configuration runs outside the lock; only the owning strand touches the session
    s->init(sampleRate, channels);
    return s;
  }
  // A session becomes visible only once its first init succeeded
  s = std::make_shared<Session>(id, options_, catalog_);
  s->init(sampleRate, channels);
  std::lock_guard<std::mutex> lock(m_);
  sessions_[id] = s;
  return s;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(m_);
  auto it = sessions_.find(id);
  return (it != sessions_.end()) ? it->second : nullptr;
}

std::shared_ptr<Session> SessionRegistry::require(const std::string& id) const {
  auto s = find(id);
  if (!s || s->closed()) throw SessionNotFound(id);
  return s;
}

void SessionRegistry::destroy(const std::string& id) {
  std::shared_ptr<Session> s;
  {
    std::lock_guard<std::mutex> lock(m_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;
    s = std::move(it->second);
    sessions_.erase(it);
  }
  s->close();
  if (options_.purgeOnDisconnect && catalog_) {
    try {
      const size_t n = catalog_->removeSession(id);
      if (n > 0) std::fprintf(stderr, "[session] %s purged %zu recording(s)\n", id.c_str(), n);
    } catch (const StorageError& e) {
      std::fprintf(stderr, "[session] %s purge failed: %s\n", id.c_str(), e.what());
    }
  }
}

void SessionRegistry::closeAll() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(m_);
    for (const auto& kv : sessions_) ids.push_back(kv.first);
  }
  for (const auto& id : ids) destroy(id);
  std::lock_guard<std::mutex> lock(m_);
  claimed_.clear();
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(m_);
  return sessions_.size();
}
