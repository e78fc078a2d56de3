#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "io/RecordingCatalog.hpp"
#include "net/ControlMessage.hpp"
#include "net/ProtocolMultiplexer.hpp"
#include "net/RequestTarget.hpp"
#include "session/SessionRegistry.hpp"

using nlohmann::json;

class ProtocolTest : public ::testing::Test {
protected:
  void SetUp() override {
    catalog = std::make_unique<NdjsonRecordingCatalog>((dir.path() / "recordings.ndjson").string(), dir.str());
    options.recordingsDir = dir.str();
    registry = std::make_unique<SessionRegistry>(options, catalog.get());
    ASSERT_TRUE(registry->reserve("s1"));
    mux = std::make_unique<ProtocolMultiplexer>("s1", *registry, sink);
  }

  void sendBinary(const std::vector<uint8_t>& bytes) { mux->onBinary(bytes.data(), bytes.size()); }

  json lastMeter() {
    EXPECT_FALSE(sink.meters.empty());
    return sink.meters.empty() ? json() : json::parse(sink.meters.back());
  }

  TempDir dir;
  SessionOptions options;
  std::unique_ptr<NdjsonRecordingCatalog> catalog;
  std::unique_ptr<SessionRegistry> registry;
  FakeMessageSink sink;
  std::unique_ptr<ProtocolMultiplexer> mux;
};

TEST_F(ProtocolTest, SilenceThenRecordingScenario) {
  mux->onText(R"({"action":"init","sample_rate":44100,"channels":2})");
  sendBinary(makeSilentFrames(1024));
  mux->onMeterTick();
  const json meter = lastMeter();
  EXPECT_EQ(meter["type"], "meter");
  EXPECT_LE(meter["rms"].get<double>(), -100.0);
  EXPECT_EQ(meter["panning"].get<double>(), 0.0);
  ASSERT_EQ(meter["spectrum"].size(), 64u);
  for (const auto& v : meter["spectrum"]) EXPECT_NEAR(v.get<double>(), 0.0, 1e-9);

  mux->onText(R"({"action":"start_record"})");
  const uint32_t n = 4410;
  for (uint32_t off = 0; off < n; off += 441) sendBinary(makeSineFrames(441, 440.0, 44100.0, 0.5, 0.5, off));
  mux->onText(R"({"action":"stop_record"})");

  ASSERT_EQ(sink.notices.size(), 1u);
  const json saved = json::parse(sink.notices[0]);
  EXPECT_EQ(saved["type"], "recording_saved");
  EXPECT_EQ(saved["id"].get<int64_t>(), 1);
  const std::string filename = saved["filename"].get<std::string>();
  EXPECT_TRUE(std::filesystem::exists(dir.path() / filename));

  const auto recs = catalog->listBySession("s1");
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_NEAR(recs[0].durationSec, n / 44100.0, 1.0 / 44100.0);
  EXPECT_FALSE(sink.closeCode.has_value());
}

TEST_F(ProtocolTest, FrameBeforeInitClosesWith4004) {
  sendBinary(makeSilentFrames(16));
  ASSERT_TRUE(sink.closeCode.has_value());
  EXPECT_EQ(*sink.closeCode, kCloseSessionNotFound);
  EXPECT_TRUE(mux->closing());
}

TEST_F(ProtocolTest, ControlBeforeInitClosesWith4004) {
  mux->onText(R"({"action":"set_params","gain":3})");
  ASSERT_TRUE(sink.closeCode.has_value());
  EXPECT_EQ(*sink.closeCode, kCloseSessionNotFound);
}

TEST_F(ProtocolTest, MalformedControlIsIgnored) {
  mux->onText("{not json");
  mux->onText(R"({"action":"dance"})");
  mux->onText(R"({"gain":3})");
  mux->onText(R"({"action":"set_params","gain":"loud"})");
  EXPECT_FALSE(sink.closeCode.has_value());
  mux->onText(R"({"action":"init"})");
  EXPECT_NE(registry->find("s1"), nullptr);
}

TEST_F(ProtocolTest, BadFrameIsDroppedSessionContinues) {
  mux->onText(R"({"action":"init"})");
  const std::vector<uint8_t> odd(7, 0);
  sendBinary(odd);
  EXPECT_FALSE(sink.closeCode.has_value());
  sendBinary(makeSineFrames(512, 1000.0, 44100.0, 0.5, 0.5));
  EXPECT_EQ(registry->require("s1")->engine().framesProcessed(), 512u);
}

TEST_F(ProtocolTest, SetParamsKeepsMissingFields) {
  mux->onText(R"({"action":"init"})");
  mux->onText(R"({"action":"set_params","gain":12,"filter_enabled":true,"cutoff_freq":2000,"integration_time":0.2})");
  mux->onText(R"({"action":"set_params","cutoff_freq":800})");
  const DspParameters p = registry->require("s1")->parameters();
  EXPECT_FLOAT_EQ(p.gainDb, 12.0f);
  EXPECT_TRUE(p.filterEnabled);
  EXPECT_FLOAT_EQ(p.cutoffHz, 800.0f);
  EXPECT_FLOAT_EQ(p.integrationTimeSec, 0.2f);
}

TEST_F(ProtocolTest, ReinitKeepsParameters) {
  mux->onText(R"({"action":"init","sample_rate":48000})");
  mux->onText(R"({"action":"set_params","gain":6})");
  mux->onText(R"({"action":"init","sample_rate":22050,"channels":1})");
  auto s = registry->require("s1");
  EXPECT_EQ(s->sampleRate(), 22050u);
  EXPECT_EQ(s->channels(), 1u);
  EXPECT_FLOAT_EQ(s->parameters().gainDb, 6.0f);
}

TEST_F(ProtocolTest, MonoSessionAcceptsTwoByteFrames) {
  mux->onText(R"({"action":"init","channels":1})");
  const std::vector<uint8_t> mono(6, 0);
  sendBinary(mono);
  EXPECT_FALSE(sink.closeCode.has_value());
  EXPECT_EQ(registry->require("s1")->engine().framesProcessed(), 3u);
}

TEST_F(ProtocolTest, StartRecordWithNewRateReinitializes) {
  mux->onText(R"({"action":"init"})");
  mux->onText(R"({"action":"start_record","sample_rate":48000})");
  auto s = registry->require("s1");
  EXPECT_TRUE(s->recording());
  EXPECT_EQ(s->sampleRate(), 48000u);
  sendBinary(makeSilentFrames(480));
  mux->onText(R"({"action":"stop_record"})");
  const auto recs = catalog->listBySession("s1");
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].sampleRate, 48000u);
  EXPECT_NEAR(recs[0].durationSec, 0.01, 1e-9);
}

TEST_F(ProtocolTest, RateChangeDuringRecordingIsRejected) {
  mux->onText(R"({"action":"init","sample_rate":44100})");
  mux->onText(R"({"action":"start_record"})");
  sendBinary(makeSilentFrames(4410));
  mux->onText(R"({"action":"init","sample_rate":22050})");
  EXPECT_FALSE(sink.closeCode.has_value());
  auto s = registry->require("s1");
  EXPECT_EQ(s->sampleRate(), 44100u);
  EXPECT_TRUE(s->recording());
  sendBinary(makeSilentFrames(2205));
  mux->onText(R"({"action":"stop_record"})");

  const auto recs = catalog->listBySession("s1");
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].sampleRate, 44100u);
  EXPECT_NEAR(recs[0].durationSec, 6615.0 / 44100.0, 1e-9);
}

TEST_F(ProtocolTest, StartRecordAtNewRateFinishesPreviousFile) {
  mux->onText(R"({"action":"init","sample_rate":44100})");
  mux->onText(R"({"action":"start_record"})");
  sendBinary(makeSilentFrames(4410));
  mux->onText(R"({"action":"start_record","sample_rate":22050})");
  sendBinary(makeSilentFrames(2205));
  mux->onText(R"({"action":"stop_record"})");

  const auto recs = catalog->listBySession("s1");
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].sampleRate, 44100u);
  EXPECT_NEAR(recs[0].durationSec, 0.1, 1e-9);
  EXPECT_EQ(recs[1].sampleRate, 22050u);
  EXPECT_NEAR(recs[1].durationSec, 0.1, 1e-9);
  EXPECT_NE(recs[0].filename, recs[1].filename);
}

TEST_F(ProtocolTest, StopWithoutRecordingSendsNothing) {
  mux->onText(R"({"action":"init"})");
  mux->onText(R"({"action":"stop_record"})");
  EXPECT_TRUE(sink.notices.empty());
  EXPECT_FALSE(sink.closeCode.has_value());
}

TEST_F(ProtocolTest, DisconnectFinalizesActiveRecording) {
  mux->onText(R"({"action":"init"})");
  mux->onText(R"({"action":"start_record"})");
  sendBinary(makeSineFrames(882, 440.0, 44100.0, 0.3, 0.3));
  mux->onClose();
  EXPECT_EQ(registry->find("s1"), nullptr);
  const auto recs = catalog->listBySession("s1");
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_NEAR(recs[0].durationSec, 882.0 / 44100.0, 1e-9);
  EXPECT_TRUE(sink.notices.empty());
  // The id is free again
  EXPECT_TRUE(registry->reserve("s1"));
}

TEST_F(ProtocolTest, NoMeterBeforeInit) {
  mux->onMeterTick();
  EXPECT_TRUE(sink.meters.empty());
  mux->onText(R"({"action":"init"})");
  mux->onMeterTick();
  EXPECT_EQ(sink.meters.size(), 1u);
}

TEST(SessionRegistry, ReserveIsExclusive) {
  TempDir dir;
  SessionOptions o;
  o.recordingsDir = dir.str();
  SessionRegistry registry(o, nullptr);
  EXPECT_TRUE(registry.reserve("a"));
  EXPECT_FALSE(registry.reserve("a"));
  EXPECT_TRUE(registry.reserve("b"));
  registry.release("a");
  EXPECT_TRUE(registry.reserve("a"));
}

TEST(SessionRegistry, RequireAfterDestroyThrows) {
  TempDir dir;
  SessionOptions o;
  o.recordingsDir = dir.str();
  SessionRegistry registry(o, nullptr);
  EXPECT_THROW(registry.require("x"), SessionNotFound);
  auto s = registry.initialize("x", 44100, 2);
  EXPECT_EQ(registry.size(), 1u);
  registry.destroy("x");
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_TRUE(s->closed());
  const auto frames = makeSilentFrames(4);
  EXPECT_THROW(s->ingest(frames.data(), frames.size()), SessionNotFound);
  EXPECT_THROW(registry.require("x"), SessionNotFound);
}

TEST(SessionRegistry, InvalidInitIsRejected) {
  TempDir dir;
  SessionOptions o;
  o.recordingsDir = dir.str();
  SessionRegistry registry(o, nullptr);
  EXPECT_THROW(registry.initialize("x", 44100, 3), ProtocolError);
  EXPECT_THROW(registry.initialize("y", 0, 2), ProtocolError);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistry, PurgeOnDisconnectRemovesRecordings) {
  TempDir dir;
  NdjsonRecordingCatalog catalog((dir.path() / "recordings.ndjson").string(), dir.str());
  SessionOptions o;
  o.recordingsDir = dir.str();
  o.purgeOnDisconnect = true;
  SessionRegistry registry(o, &catalog);
  auto s = registry.initialize("p", 44100, 2);
  s->startRecording(std::nullopt, std::nullopt);
  const auto frames = makeSilentFrames(441);
  s->ingest(frames.data(), frames.size());
  const RecordingOutcome out = s->stopRecording();
  ASSERT_TRUE(out.ok);
  EXPECT_TRUE(std::filesystem::exists(dir.path() / out.record.filename));
  registry.release("p");
  EXPECT_TRUE(catalog.listBySession("p").empty());
  EXPECT_FALSE(std::filesystem::exists(dir.path() / out.record.filename));
}

TEST(SessionRegistry, WriteFailureSendsNoNoticeAndMeteringContinues) {
  TempDir dir;
  NdjsonRecordingCatalog catalog((dir.path() / "recordings.ndjson").string(), dir.str());
  SessionOptions o;
  o.recordingsDir = dir.str();
  o.writerFactory = [] { return std::make_unique<FailingAudioFileWriter>(441); };
  SessionRegistry registry(o, &catalog);
  FakeMessageSink sink;
  ProtocolMultiplexer mux("f", registry, sink);

  mux.onText(R"({"action":"init"})");
  mux.onText(R"({"action":"start_record"})");
  for (uint32_t off = 0; off < 4410; off += 441) {
    const auto frames = makeSineFrames(441, 440.0, 44100.0, 0.5, 0.5, off);
    mux.onBinary(frames.data(), frames.size());
  }
  mux.onText(R"({"action":"stop_record"})");

  EXPECT_TRUE(sink.notices.empty());
  EXPECT_FALSE(sink.closeCode.has_value());
  EXPECT_TRUE(catalog.listBySession("f").empty());
  EXPECT_FALSE(registry.require("f")->recording());

  const auto more = makeSineFrames(441, 440.0, 44100.0, 0.5, 0.5);
  mux.onBinary(more.data(), more.size());
  mux.onMeterTick();
  ASSERT_EQ(sink.meters.size(), 1u);
  EXPECT_GT(json::parse(sink.meters.back())["rms"].get<double>(), -100.0);
  EXPECT_EQ(registry.require("f")->engine().framesProcessed(), 4410u + 441u);
}

TEST(ControlMessage, ParsesActions) {
  const ControlMessage init = parseControlMessage(R"({"action":"init","sample_rate":48000,"channels":1})");
  EXPECT_EQ(init.action, ControlAction::Init);
  EXPECT_EQ(init.sampleRate.value_or(0), 48000u);
  EXPECT_EQ(init.channels.value_or(0), 1u);

  const ControlMessage set = parseControlMessage(R"({"action":"set_params","filter_enabled":false,"gain":3.5})");
  EXPECT_EQ(set.action, ControlAction::SetParams);
  EXPECT_FLOAT_EQ(set.params.gainDb.value_or(-1.0f), 3.5f);
  EXPECT_FALSE(set.params.filterEnabled.value_or(true));
  EXPECT_FALSE(set.params.cutoffHz.has_value());

  EXPECT_EQ(parseControlMessage(R"({"action":"stop_record"})").action, ControlAction::StopRecord);
  EXPECT_THROW(parseControlMessage("[1,2]"), ProtocolError);
  EXPECT_THROW(parseControlMessage(R"({"action":"init","sample_rate":-1})"), ProtocolError);
}

TEST(ProtocolSerialize, MeterAndNoticeShapes) {
  MeteringSample m;
  m.rmsDb = -12.5;
  m.panning = 0.25;
  m.spectrum = {0.0f, 1.0f};
  const json meter = json::parse(ProtocolMultiplexer::serializeMeter(m));
  EXPECT_EQ(meter["type"], "meter");
  EXPECT_DOUBLE_EQ(meter["rms"].get<double>(), -12.5);
  EXPECT_DOUBLE_EQ(meter["panning"].get<double>(), 0.25);
  EXPECT_EQ(meter["spectrum"].size(), 2u);

  RecordingRecord rec;
  rec.id = 42;
  rec.filename = "rec_x.wav";
  const json saved = json::parse(ProtocolMultiplexer::serializeRecordingSaved(rec));
  EXPECT_EQ(saved, json({{"type", "recording_saved"}, {"id", 42}, {"filename", "rec_x.wav"}}));
}

TEST(RequestTarget, ExtractsSessionId) {
  const RequestTarget t = parseRequestTarget("/ws/audio?session_id=abc%2D1&x=2");
  EXPECT_EQ(t.path, "/ws/audio");
  EXPECT_EQ(t.param("session_id"), "abc-1");
  EXPECT_EQ(t.param("x"), "2");
  EXPECT_EQ(t.param("missing"), "");
  EXPECT_EQ(parseRequestTarget("/ws/audio").param("session_id"), "");
  EXPECT_EQ(percentDecode("a+b%zz"), "a b%zz");
}
