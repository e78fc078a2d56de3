#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include "core/Diagnostics.hpp"
#include "core/Errors.hpp"
#include "core/ServerConfig.hpp"
#include "io/RecordingCatalog.hpp"
#include "net/WebSocketServer.hpp"
#include "session/SessionRegistry.hpp"

static std::atomic<bool> gRunning{true};

static void onSigInt(int) {
  gRunning.store(false);
}

static void printUsage(const char* exe) {
  std::fprintf(stderr,
               "Usage: %s [--config path.json] [--host addr] [--port N] [--threads N]\n"
               "          [--recordings-dir dir] [--catalog path.ndjson]\n"
               "          [--meter-interval-ms N] [--spectrum-window N] [--spectrum-bins N]\n"
               "          [--record-source processed|raw] [--max-queued-sec S]\n"
               "          [--max-message-bytes N] [--purge-on-disconnect] [--verbose]\n"
               "\n"
               "Endpoints:\n"
               "  ws://<host>:<port>/ws/audio?session_id=<id>   PCM in, meters out\n"
               "  GET /health                                  liveness\n"
               "\n"
               "Environment: METERD_PORT, METERD_RECORDINGS_DIR override the config file;\n"
               "command-line flags override both.\n",
               exe);
}

static SessionOptions makeSessionOptions(const ServerConfig& cfg) {
  SessionOptions o;
  o.recordingsDir = cfg.recordingsDir;
  o.meterInterval = std::chrono::milliseconds(cfg.meterIntervalMs);
  o.spectrumWindow = cfg.spectrumWindow;
  o.spectrumBins = cfg.spectrumBins;
  o.recordSource = (cfg.recordSource == "raw") ? RecordSource::Raw : RecordSource::Processed;
  o.maxQueuedRecordingSec = cfg.maxQueuedRecordingSec;
  o.purgeOnDisconnect = cfg.purgeOnDisconnect;
  return o;
}

int main(int argc, char** argv) {
  {
    static const char* kMeterdVersion = "0.1.0";
    std::fprintf(stderr, "meterd -- version %s starting up (built %s %s)\n", kMeterdVersion, __DATE__, __TIME__);
  }
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    }
  }

  ServerConfig cfg;
  try {
    cfg = resolveServerConfig(argc, argv);
  } catch (const ConfigError& e) {
    std::fprintf(stderr, "[config] %s\n", e.what());
    printUsage(argv[0]);
    return 1;
  }
  gVerbose = cfg.verbose;
  std::fprintf(stderr, "[config] %s:%u threads=%u recordings=%s catalog=%s meter=%ums window=%u bins=%u source=%s\n",
               cfg.bindAddress.c_str(), static_cast<unsigned>(cfg.port), cfg.ioThreads,
               cfg.recordingsDir.c_str(), cfg.resolvedCatalogPath().c_str(), cfg.meterIntervalMs,
               cfg.spectrumWindow, cfg.spectrumBins, cfg.recordSource.c_str());

  std::error_code ec;
  std::filesystem::create_directories(cfg.recordingsDir, ec);
  if (ec) {
    std::fprintf(stderr, "[config] cannot create %s: %s\n", cfg.recordingsDir.c_str(), ec.message().c_str());
    return 1;
  }

  NdjsonRecordingCatalog catalog(cfg.resolvedCatalogPath(), cfg.recordingsDir);
  SessionRegistry registry(makeSessionOptions(cfg), &catalog);

  boost::asio::io_context ioc(static_cast<int>(cfg.ioThreads));
  WebSocketServer server(ioc, registry, static_cast<size_t>(cfg.maxMessageBytes));
  try {
    server.start(cfg.bindAddress, cfg.port);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[server] %s\n", e.what());
    return 1;
  }

  std::signal(SIGINT, onSigInt);
  std::signal(SIGTERM, onSigInt);

  std::vector<std::thread> threads;
  threads.reserve(cfg.ioThreads);
  for (uint32_t i = 0; i < cfg.ioThreads; ++i) {
    threads.emplace_back([&ioc] { ioc.run(); });
  }

  while (gRunning.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::fprintf(stderr, "[server] shutting down (%zu live session(s))\n", registry.size());
  server.stop();
  ioc.stop();
  for (auto& t : threads) if (t.joinable()) t.join();
  // Connections are gone with the io_context; finalize whatever they left behind
  registry.closeAll();
  std::fprintf(stderr, "[server] bye\n");
  return 0;
}
