#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/ServerConfig.hpp"

// Clears the variables the loader reads, before and after each test.
class ServerConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clearEnv(); }
  void TearDown() override { clearEnv(); }
  static void clearEnv() {
    ::unsetenv("METERD_PORT");
    ::unsetenv("METERD_RECORDINGS_DIR");
    ::unsetenv("METERD_SEARCH_PATHS");
  }

  static ServerConfig resolve(std::vector<std::string> args) {
    args.insert(args.begin(), "meterd");
    std::vector<const char*> argv;
    for (const auto& a : args) argv.push_back(a.c_str());
    return resolveServerConfig(static_cast<int>(argv.size()), argv.data());
  }

  std::string writeJson(const std::string& name, const std::string& text) {
    const std::string path = (dir.path() / name).string();
    std::ofstream(path) << text;
    return path;
  }

  TempDir dir;
};

TEST_F(ServerConfigTest, Defaults) {
  const ServerConfig cfg = resolve({});
  EXPECT_EQ(cfg.bindAddress, "0.0.0.0");
  EXPECT_EQ(cfg.port, 8000);
  EXPECT_EQ(cfg.ioThreads, 2u);
  EXPECT_EQ(cfg.recordingsDir, "recordings_data");
  EXPECT_EQ(cfg.meterIntervalMs, 50u);
  EXPECT_EQ(cfg.spectrumWindow, 1024u);
  EXPECT_EQ(cfg.spectrumBins, 64u);
  EXPECT_EQ(cfg.recordSource, "processed");
  EXPECT_DOUBLE_EQ(cfg.maxQueuedRecordingSec, 10.0);
  EXPECT_EQ(cfg.maxMessageBytes, 1u << 20);
  EXPECT_FALSE(cfg.purgeOnDisconnect);
  EXPECT_EQ(cfg.resolvedCatalogPath(), "recordings_data/recordings.ndjson");
}

TEST_F(ServerConfigTest, LaterSourcesWin) {
  const std::string path = writeJson("c.json", R"({
    "port": 9000, "recordings_dir": "from_file", "meter_interval_ms": 100,
    "record_source": "raw", "purge_on_disconnect": true, "mystery": 1
  })");
  ::setenv("METERD_PORT", "9100", 1);

  ServerConfig cfg = resolve({"--config", path});
  EXPECT_EQ(cfg.port, 9100);
  EXPECT_EQ(cfg.recordingsDir, "from_file");
  EXPECT_EQ(cfg.meterIntervalMs, 100u);
  EXPECT_EQ(cfg.recordSource, "raw");
  EXPECT_TRUE(cfg.purgeOnDisconnect);

  ::setenv("METERD_RECORDINGS_DIR", "from_env", 1);
  cfg = resolve({"--config", path, "--port", "9200"});
  EXPECT_EQ(cfg.port, 9200);
  EXPECT_EQ(cfg.recordingsDir, "from_env");

  cfg = resolve({"--config", path, "--recordings-dir", "from_cli", "--catalog", "/tmp/cat.ndjson"});
  EXPECT_EQ(cfg.recordingsDir, "from_cli");
  EXPECT_EQ(cfg.resolvedCatalogPath(), "/tmp/cat.ndjson");
}

TEST_F(ServerConfigTest, ConfigFileFoundOnSearchPath) {
  writeJson("found.json", R"({"io_threads": 4})");
  ::setenv("METERD_SEARCH_PATHS", ("/nonexistent:" + dir.str()).c_str(), 1);
  EXPECT_EQ(resolve({"--config", "found.json"}).ioThreads, 4u);
  EXPECT_THROW(resolve({"--config", "absent.json"}), ConfigError);
}

TEST_F(ServerConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(resolve({"--port", "abc"}), ConfigError);
  EXPECT_THROW(resolve({"--port", "70000"}), ConfigError);
  EXPECT_THROW(resolve({"--threads", "0"}), ConfigError);
  EXPECT_THROW(resolve({"--spectrum-window", "1000"}), ConfigError);
  EXPECT_THROW(resolve({"--spectrum-bins", "600"}), ConfigError);
  EXPECT_THROW(resolve({"--record-source", "both"}), ConfigError);
  EXPECT_THROW(resolve({"--max-queued-sec", "-1"}), ConfigError);
  EXPECT_THROW(resolve({"--port"}), ConfigError);
  EXPECT_THROW(resolve({"--bogus"}), ConfigError);
  EXPECT_THROW(resolve({"--config", writeJson("bad.json", "{oops")}), ConfigError);
  EXPECT_THROW(resolve({"--config", writeJson("neg.json", R"({"port": -5})")}), ConfigError);
  ::setenv("METERD_PORT", "eighty", 1);
  EXPECT_THROW(resolve({}), ConfigError);
}

TEST_F(ServerConfigTest, FlagsWithoutValues) {
  const ServerConfig cfg = resolve({"--purge-on-disconnect", "-v", "--threads", "8", "--host", "127.0.0.1"});
  EXPECT_TRUE(cfg.purgeOnDisconnect);
  EXPECT_TRUE(cfg.verbose);
  EXPECT_EQ(cfg.ioThreads, 8u);
  EXPECT_EQ(cfg.bindAddress, "127.0.0.1");
}
