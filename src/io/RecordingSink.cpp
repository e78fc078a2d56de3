#include "RecordingSink.hpp"
#include <cctype>
#include <cstdio>
#include <filesystem>
#include "../core/Diagnostics.hpp"
#include "../core/Errors.hpp"

namespace fs = std::filesystem;

static constexpr size_t kSessionPrefixLen = 8;
static constexpr uint32_t kFileChannels = 2;

static std::string sanitizeSessionPrefix(const std::string& sessionId) {
  std::string out;
  for (char c : sessionId) {
    if (out.size() >= kSessionPrefixLen) break;
    const unsigned char u = static_cast<unsigned char>(c);
    out.push_back((std::isalnum(u) || c == '-' || c == '_') ? c : '_');
  }
  if (out.empty()) out = "session";
  return out;
}

// Name choice and file creation must be atomic across sessions: two sessions
// can share a prefix and start in the same second.
static std::mutex& filenameMutex() {
  static std::mutex m;
  return m;
}

std::string makeRecordingFilename(const std::string& dir, const std::string& sessionId,
                                  std::chrono::system_clock::time_point when) {
  const std::string stem = "rec_" + formatUtc(when, true) + "_" + sanitizeSessionPrefix(sessionId);
  std::string name = stem + ".wav";
  for (int n = 1; fs::exists(fs::path(dir) / name); ++n) {
    name = stem + "_" + std::to_string(n) + ".wav";
  }
  return name;
}

RecordingSink::RecordingSink(std::string recordingsDir, RecordingCatalog* catalog, double maxQueuedSeconds,
                             AudioFileWriterFactory writerFactory)
  : dir_(std::move(recordingsDir)), catalog_(catalog),
    maxQueuedSeconds_(maxQueuedSeconds > 0.0 ? maxQueuedSeconds : 10.0),
    writerFactory_(std::move(writerFactory)) {}

RecordingSink::~RecordingSink() {
  if (!active_) return;
  const RecordingOutcome out = stop();
  if (!out.ok) std::fprintf(stderr, "[record] finalize on teardown failed: %s\n", out.error.c_str());
}

void RecordingSink::start(const RecordingRequest& req) {
  if (active_) {
    const RecordingOutcome prev = stop();
    if (!prev.ok) std::fprintf(stderr, "[record] previous recording failed: %s\n", prev.error.c_str());
  }
  if (req.sampleRate == 0) throw StorageError("recording sample rate must be positive");

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) throw StorageError("cannot create recordings dir " + dir_ + ": " + ec.message());

  startedAt_ = std::chrono::system_clock::now();
  AudioFileSpec spec;
  spec.sampleRate = req.sampleRate;
  spec.channels = kFileChannels;
  writer_ = writerFactory_ ? writerFactory_() : std::make_unique<AudioFileWriter>();
  if (!writer_) throw StorageError("writer factory returned no writer");
  {
    std::lock_guard<std::mutex> lock(filenameMutex());
    filename_ = makeRecordingFilename(dir_, req.sessionId, startedAt_);
    writer_->open((fs::path(dir_) / filename_).string(), spec);
  }

  req_ = req;
  {
    std::lock_guard<std::mutex> lock(m_);
    queue_.clear();
    queuedFrames_ = 0;
    maxQueuedFrames_ = static_cast<uint64_t>(maxQueuedSeconds_ * req.sampleRate);
    if (maxQueuedFrames_ == 0) maxQueuedFrames_ = 1;
    stopping_ = false;
    failed_ = false;
    error_.clear();
  }
  framesAccepted_ = 0;
  active_ = true;
  thread_ = std::thread([this] { this->writerLoop(); });
  std::fprintf(stderr, "[record] started %s (%u Hz)\n", filename_.c_str(), req.sampleRate);
}

bool RecordingSink::failed() const {
  std::lock_guard<std::mutex> lock(m_);
  return failed_;
}

void RecordingSink::append(const std::vector<int16_t>& interleaved) {
  if (!active_ || interleaved.empty()) return;
  const uint64_t frames = interleaved.size() / kFileChannels;
  if (frames == 0) return;
  {
    std::unique_lock<std::mutex> lock(m_);
    // A block larger than the whole budget is still admitted once the queue is empty
    cv_.wait(lock, [&] {
      return failed_ || queue_.empty() || queuedFrames_ + frames <= maxQueuedFrames_;
    });
    if (failed_) return;
    queue_.emplace_back(interleaved.begin(), interleaved.begin() + static_cast<std::ptrdiff_t>(frames * kFileChannels));
    queuedFrames_ += frames;
  }
  framesAccepted_ += frames;
  cv_.notify_all();
}

void RecordingSink::writerLoop() {
  for (;;) {
    std::vector<int16_t> block;
    {
      std::unique_lock<std::mutex> lock(m_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return; // stopping and drained
      block = std::move(queue_.front());
      queue_.pop_front();
    }
    const uint64_t frames = block.size() / kFileChannels;
    try {
      writer_->writeFrames(block.data(), frames);
    } catch (const StorageError& e) {
      std::fprintf(stderr, "[record] %s\n", e.what());
      std::lock_guard<std::mutex> lock(m_);
      failed_ = true;
      error_ = e.what();
      queue_.clear();
      queuedFrames_ = 0;
    }
    {
      std::lock_guard<std::mutex> lock(m_);
      queuedFrames_ = (queuedFrames_ >= frames) ? queuedFrames_ - frames : 0;
    }
    cv_.notify_all();
  }
}

RecordingOutcome RecordingSink::stop() {
  RecordingOutcome out;
  if (!active_) {
    out.error = "no recording in progress";
    return out;
  }
  {
    std::lock_guard<std::mutex> lock(m_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  active_ = false;

  const uint64_t framesWritten = writer_->framesWritten();
  try {
    writer_->close();
  } catch (const StorageError& e) {
    std::lock_guard<std::mutex> lock(m_);
    if (!failed_) { failed_ = true; error_ = e.what(); }
  }
  {
    std::lock_guard<std::mutex> lock(m_);
    if (failed_) {
      out.error = error_;
      std::fprintf(stderr, "[record] %s failed: %s\n", filename_.c_str(), error_.c_str());
      return out;
    }
  }

  RecordingRecord rec;
  rec.filename = filename_;
  rec.sessionId = req_.sessionId;
  rec.durationSec = static_cast<double>(framesWritten) / static_cast<double>(req_.sampleRate);
  rec.createdAt = formatUtc(startedAt_, false);
  rec.sampleRate = req_.sampleRate;
  rec.channels = kFileChannels;
  rec.settings = req_.settings;
  try {
    out.record = catalog_ ? catalog_->persist(rec) : rec;
  } catch (const StorageError& e) {
    out.error = e.what();
    std::fprintf(stderr, "[record] catalog: %s\n", e.what());
    return out;
  }
  out.ok = true;
  std::fprintf(stderr, "[record] saved %s id=%lld (%.3f s)\n", rec.filename.c_str(),
               static_cast<long long>(out.record.id), rec.durationSec);
  return out;
}
