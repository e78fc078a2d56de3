#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct ServerConfig {
  std::string bindAddress = "0.0.0.0";
  uint16_t port = 8000;
  uint32_t ioThreads = 2;
  std::string recordingsDir = "recordings_data";
  std::string catalogPath;            // empty: <recordingsDir>/recordings.ndjson
  uint32_t meterIntervalMs = 50;
  uint32_t spectrumWindow = 1024;
  uint32_t spectrumBins = 64;
  std::string recordSource = "processed"; // "processed" | "raw"
  double maxQueuedRecordingSec = 10.0;
  uint64_t maxMessageBytes = 1u << 20;
  bool purgeOnDisconnect = false;
  bool verbose = false;

  std::string resolvedCatalogPath() const;
};

// Merge a JSON config file into cfg. Relative paths are also searched under
// config/ and the colon-separated METERD_SEARCH_PATHS. Unknown keys warn.
// Throws ConfigError.
void loadServerConfigJson(const std::string& path, ServerConfig& cfg);

// Apply METERD_PORT and METERD_RECORDINGS_DIR when set. Throws ConfigError.
void applyServerConfigEnvironment(ServerConfig& cfg);

// Apply command-line flags (argv[0] is skipped). --config is consumed by
// resolveServerConfig and ignored here. Throws ConfigError.
void applyServerConfigArgs(int argc, const char* const* argv, ServerConfig& cfg);

// Throws ConfigError naming the first invalid field.
void validateServerConfig(const ServerConfig& cfg);

// defaults < --config file < environment < command line, then validate.
ServerConfig resolveServerConfig(int argc, const char* const* argv);
