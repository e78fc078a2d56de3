#include "ServerConfig.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "Errors.hpp"

using nlohmann::json;

std::string ServerConfig::resolvedCatalogPath() const {
  if (!catalogPath.empty()) return catalogPath;
  return (std::filesystem::path(recordingsDir) / "recordings.ndjson").string();
}

static std::string readFileToString(const std::string& path) {
  auto tryRead = [](const std::string& p, std::string& out) -> bool {
    std::ifstream f(p);
    if (!f) return false;
    std::ostringstream ss; ss << f.rdbuf();
    out = ss.str();
    return true;
  };

  std::string text;
  if (tryRead(path, text)) return text;
  if (std::filesystem::path(path).is_absolute()) {
    throw ConfigError("Failed to open config file: " + path);
  }

  std::vector<std::string> roots;
  roots.emplace_back("config/");
  if (const char* env = std::getenv("METERD_SEARCH_PATHS")) {
    std::string s(env);
    size_t start = 0; while (start <= s.size()) {
      size_t sep = s.find(':', start);
      std::string tok = (sep == std::string::npos) ? s.substr(start) : s.substr(start, sep - start);
      if (!tok.empty()) {
        if (tok.back() != '/') tok.push_back('/');
        roots.push_back(tok);
      }
      if (sep == std::string::npos) break; else start = sep + 1;
    }
  }
  for (const auto& r : roots) {
    if (tryRead(r + path, text)) return text;
  }
  throw ConfigError("Failed to open config file: " + path);
}

static uint64_t parseUnsigned(const std::string& field, const std::string& text) {
  if (text.empty() || text[0] == '-') throw ConfigError(field + ": expected a non-negative integer, got '" + text + "'");
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    throw ConfigError(field + ": expected a non-negative integer, got '" + text + "'");
  }
  return static_cast<uint64_t>(v);
}

static double parseDouble(const std::string& field, const std::string& text) {
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (text.empty() || errno != 0 || end == text.c_str() || *end != '\0') {
    throw ConfigError(field + ": expected a number, got '" + text + "'");
  }
  return v;
}

static uint16_t toPort(const std::string& field, uint64_t v) {
  if (v > 65535) throw ConfigError(field + ": port out of range: " + std::to_string(v));
  return static_cast<uint16_t>(v);
}

static uint32_t toU32(const std::string& field, uint64_t v) {
  if (v > 0xFFFFFFFFull) throw ConfigError(field + ": value too large");
  return static_cast<uint32_t>(v);
}

void loadServerConfigJson(const std::string& path, ServerConfig& cfg) {
  const std::string text = readFileToString(path);
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  if (!j.is_object()) throw ConfigError(path + ": top level must be an object");

  auto getUInt = [&](const std::string& key) -> uint64_t {
    const json& v = j.at(key);
    if (!v.is_number_unsigned()) throw ConfigError(path + ": '" + key + "' must be a non-negative integer");
    return v.get<uint64_t>();
  };
  auto getString = [&](const std::string& key) -> std::string {
    const json& v = j.at(key);
    if (!v.is_string()) throw ConfigError(path + ": '" + key + "' must be a string");
    return v.get<std::string>();
  };
  auto getBool = [&](const std::string& key) -> bool {
    const json& v = j.at(key);
    if (!v.is_boolean()) throw ConfigError(path + ": '" + key + "' must be a boolean");
    return v.get<bool>();
  };

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& k = it.key();
    if (k == "bind_address") cfg.bindAddress = getString(k);
    else if (k == "port") cfg.port = toPort(k, getUInt(k));
    else if (k == "io_threads") cfg.ioThreads = toU32(k, getUInt(k));
    else if (k == "recordings_dir") cfg.recordingsDir = getString(k);
    else if (k == "catalog_path") cfg.catalogPath = getString(k);
    else if (k == "meter_interval_ms") cfg.meterIntervalMs = toU32(k, getUInt(k));
    else if (k == "spectrum_window") cfg.spectrumWindow = toU32(k, getUInt(k));
    else if (k == "spectrum_bins") cfg.spectrumBins = toU32(k, getUInt(k));
    else if (k == "record_source") cfg.recordSource = getString(k);
    else if (k == "max_queued_recording_seconds") {
      if (!it->is_number()) throw ConfigError(path + ": '" + k + "' must be a number");
      cfg.maxQueuedRecordingSec = it->get<double>();
    }
    else if (k == "max_message_bytes") cfg.maxMessageBytes = getUInt(k);
    else if (k == "purge_on_disconnect") cfg.purgeOnDisconnect = getBool(k);
    else if (k == "verbose") cfg.verbose = getBool(k);
    else std::fprintf(stderr, "[config] %s: unknown key '%s' ignored\n", path.c_str(), k.c_str());
  }
}

void applyServerConfigEnvironment(ServerConfig& cfg) {
  if (const char* p = std::getenv("METERD_PORT")) {
    if (*p) cfg.port = toPort("METERD_PORT", parseUnsigned("METERD_PORT", p));
  }
  if (const char* d = std::getenv("METERD_RECORDINGS_DIR")) {
    if (*d) cfg.recordingsDir = d;
  }
}

void applyServerConfigArgs(int argc, const char* const* argv, ServerConfig& cfg) {
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) throw ConfigError(std::string(a) + " requires a value");
      return argv[++i];
    };
    if (std::strcmp(a, "--config") == 0) {
      (void)value();
    } else if (std::strcmp(a, "--host") == 0 || std::strcmp(a, "--bind") == 0) {
      cfg.bindAddress = value();
    } else if (std::strcmp(a, "--port") == 0) {
      cfg.port = toPort(a, parseUnsigned(a, value()));
    } else if (std::strcmp(a, "--threads") == 0) {
      cfg.ioThreads = toU32(a, parseUnsigned(a, value()));
    } else if (std::strcmp(a, "--recordings-dir") == 0) {
      cfg.recordingsDir = value();
    } else if (std::strcmp(a, "--catalog") == 0) {
      cfg.catalogPath = value();
    } else if (std::strcmp(a, "--meter-interval-ms") == 0) {
      cfg.meterIntervalMs = toU32(a, parseUnsigned(a, value()));
    } else if (std::strcmp(a, "--spectrum-window") == 0) {
      cfg.spectrumWindow = toU32(a, parseUnsigned(a, value()));
    } else if (std::strcmp(a, "--spectrum-bins") == 0) {
      cfg.spectrumBins = toU32(a, parseUnsigned(a, value()));
    } else if (std::strcmp(a, "--record-source") == 0) {
      cfg.recordSource = value();
    } else if (std::strcmp(a, "--max-queued-sec") == 0) {
      cfg.maxQueuedRecordingSec = parseDouble(a, value());
    } else if (std::strcmp(a, "--max-message-bytes") == 0) {
      cfg.maxMessageBytes = parseUnsigned(a, value());
    } else if (std::strcmp(a, "--purge-on-disconnect") == 0) {
      cfg.purgeOnDisconnect = true;
    } else if (std::strcmp(a, "--verbose") == 0 || std::strcmp(a, "-v") == 0) {
      cfg.verbose = true;
    } else {
      throw ConfigError(std::string("unknown option: ") + a);
    }
  }
}

void validateServerConfig(const ServerConfig& cfg) {
  if (cfg.bindAddress.empty()) throw ConfigError("bind_address must not be empty");
  if (cfg.ioThreads == 0 || cfg.ioThreads > 256) throw ConfigError("io_threads must be in [1, 256]");
  if (cfg.recordingsDir.empty()) throw ConfigError("recordings_dir must not be empty");
  if (cfg.meterIntervalMs < 5 || cfg.meterIntervalMs > 10000) throw ConfigError("meter_interval_ms must be in [5, 10000]");
  const uint32_t w = cfg.spectrumWindow;
  if (w < 64 || (w & (w - 1)) != 0) throw ConfigError("spectrum_window must be a power of two >= 64");
  if (cfg.spectrumBins == 0 || cfg.spectrumBins > w / 2) throw ConfigError("spectrum_bins must be in [1, spectrum_window/2]");
  if (cfg.recordSource != "processed" && cfg.recordSource != "raw") {
    throw ConfigError("record_source must be 'processed' or 'raw', got '" + cfg.recordSource + "'");
  }
  if (!(cfg.maxQueuedRecordingSec > 0.0) || cfg.maxQueuedRecordingSec > 600.0) {
    throw ConfigError("max_queued_recording_seconds must be in (0, 600]");
  }
  if (cfg.maxMessageBytes < 1024) throw ConfigError("max_message_bytes must be >= 1024");
}

ServerConfig resolveServerConfig(int argc, const char* const* argv) {
  ServerConfig cfg;
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      loadServerConfigJson(argv[i + 1], cfg);
      break;
    }
  }
  applyServerConfigEnvironment(cfg);
  applyServerConfigArgs(argc, argv, cfg);
  validateServerConfig(cfg);
  return cfg;
}
