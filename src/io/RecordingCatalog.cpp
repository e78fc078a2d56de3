#include "RecordingCatalog.hpp"
#include "../core/Errors.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using nlohmann::json;

std::string recordToJsonLine(const RecordingRecord& rec) {
  json j;
  j["id"] = rec.id;
  j["filename"] = rec.filename;
  j["session_id"] = rec.sessionId;
  j["duration_seconds"] = rec.durationSec;
  j["timestamp"] = rec.createdAt;
  j["sample_rate"] = rec.sampleRate;
  j["channels"] = rec.channels;
  j["settings"] = {
    {"gain", rec.settings.gainDb},
    {"filter", rec.settings.filterEnabled},
    {"cutoff", rec.settings.cutoffHz},
    {"integration_time", rec.settings.integrationTimeSec},
  };
  return j.dump();
}

RecordingRecord recordFromJsonLine(const std::string& line) {
  const json j = json::parse(line);
  RecordingRecord rec;
  rec.id = j.at("id").get<int64_t>();
  rec.filename = j.at("filename").get<std::string>();
  rec.sessionId = j.value("session_id", std::string());
  rec.durationSec = j.value("duration_seconds", 0.0);
  rec.createdAt = j.value("timestamp", std::string());
  rec.sampleRate = j.value("sample_rate", 44100u);
  rec.channels = j.value("channels", 2u);
  if (j.contains("settings") && j["settings"].is_object()) {
    const auto& s = j["settings"];
    rec.settings.gainDb = s.value("gain", rec.settings.gainDb);
    rec.settings.filterEnabled = s.value("filter", rec.settings.filterEnabled);
    rec.settings.cutoffHz = s.value("cutoff", rec.settings.cutoffHz);
    rec.settings.integrationTimeSec = s.value("integration_time", rec.settings.integrationTimeSec);
  }
  return rec;
}

NdjsonRecordingCatalog::NdjsonRecordingCatalog(std::string indexPath, std::string recordingsDir)
  : indexPath_(std::move(indexPath)), recordingsDir_(std::move(recordingsDir)) {
  std::lock_guard<std::mutex> lock(m_);
  for (const auto& r : loadAllLocked()) {
    if (r.id >= nextId_) nextId_ = r.id + 1;
  }
}

std::vector<RecordingRecord> NdjsonRecordingCatalog::loadAllLocked() const {
  std::vector<RecordingRecord> out;
  std::ifstream f(indexPath_);
  if (!f) return out; // no index yet
  std::string line;
  size_t lineNo = 0;
  while (std::getline(f, line)) {
    ++lineNo;
    if (line.empty()) continue;
    try {
      out.push_back(recordFromJsonLine(line));
    } catch (const std::exception& e) {
      std::fprintf(stderr, "[catalog] skipping bad line %zu in %s: %s\n", lineNo, indexPath_.c_str(), e.what());
    }
  }
  return out;
}

void NdjsonRecordingCatalog::rewriteLocked(const std::vector<RecordingRecord>& records) {
  const std::string tmp = indexPath_ + ".tmp";
  {
    std::ofstream f(tmp, std::ios::out | std::ios::trunc);
    if (!f) throw StorageError("cannot write " + tmp);
    for (const auto& r : records) f << recordToJsonLine(r) << "\n";
    f.flush();
    if (!f) throw StorageError("write failed for " + tmp);
  }
  std::error_code ec;
  std::filesystem::rename(tmp, indexPath_, ec);
  if (ec) throw StorageError("cannot replace " + indexPath_ + ": " + ec.message());
}

RecordingRecord NdjsonRecordingCatalog::persist(RecordingRecord rec) {
  std::lock_guard<std::mutex> lock(m_);
  rec.id = nextId_;
  std::ofstream f(indexPath_, std::ios::out | std::ios::app);
  if (!f) throw StorageError("cannot open catalog " + indexPath_);
  f << recordToJsonLine(rec) << "\n";
  f.flush();
  if (!f) throw StorageError("append failed for catalog " + indexPath_);
  ++nextId_;
  return rec;
}

std::vector<RecordingRecord> NdjsonRecordingCatalog::listBySession(const std::string& sessionId) const {
  std::lock_guard<std::mutex> lock(m_);
  std::vector<RecordingRecord> out;
  for (auto& r : loadAllLocked()) {
    if (r.sessionId == sessionId) out.push_back(std::move(r));
  }
  return out;
}

size_t NdjsonRecordingCatalog::removeSession(const std::string& sessionId) {
  std::lock_guard<std::mutex> lock(m_);
  std::vector<RecordingRecord> keep;
  size_t removed = 0;
  for (auto& r : loadAllLocked()) {
    if (r.sessionId != sessionId) { keep.push_back(std::move(r)); continue; }
    const std::filesystem::path file = std::filesystem::path(recordingsDir_) / r.filename;
    std::error_code ec;
    std::filesystem::remove(file, ec);
    if (ec) std::fprintf(stderr, "[catalog] error deleting %s: %s\n", file.c_str(), ec.message().c_str());
    ++removed;
  }
  if (removed > 0) rewriteLocked(keep);
  return removed;
}
