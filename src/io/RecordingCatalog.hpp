#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "../dsp/DspParams.hpp"

// One finished recording.
struct RecordingRecord {
  int64_t id = 0;              // assigned by the catalog
  std::string filename;        // relative to the recordings directory
  std::string sessionId;
  double durationSec = 0.0;
  std::string createdAt;       // UTC ISO-8601, recording start
  uint32_t sampleRate = 44100;
  uint32_t channels = 2;
  DspParameters settings{};    // parameters in effect at start
};

// Metadata store for finished recordings.
class RecordingCatalog {
public:
  virtual ~RecordingCatalog() = default;
  // Store rec and return it with its id assigned. Throws StorageError.
  virtual RecordingRecord persist(RecordingRecord rec) = 0;
  virtual std::vector<RecordingRecord> listBySession(const std::string& sessionId) const = 0;
  // Drop the session's records and delete their files; returns the number removed.
  virtual size_t removeSession(const std::string& sessionId) = 0;
};

// Append-only NDJSON file, one record per line. Ids continue from the highest on disk.
class NdjsonRecordingCatalog final : public RecordingCatalog {
public:
  NdjsonRecordingCatalog(std::string indexPath, std::string recordingsDir);

  RecordingRecord persist(RecordingRecord rec) override;
  std::vector<RecordingRecord> listBySession(const std::string& sessionId) const override;
  size_t removeSession(const std::string& sessionId) override;

  const std::string& indexPath() const { return indexPath_; }

private:
  std::vector<RecordingRecord> loadAllLocked() const;
  void rewriteLocked(const std::vector<RecordingRecord>& records);

  std::string indexPath_;
  std::string recordingsDir_;
  mutable std::mutex m_;
  int64_t nextId_ = 1;
};

// JSON helpers shared with the protocol layer
std::string recordToJsonLine(const RecordingRecord& rec);
RecordingRecord recordFromJsonLine(const std::string& line);
