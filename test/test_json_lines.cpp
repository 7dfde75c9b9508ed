#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <ArduinoJson.h>

#include "TestSupport.h"
#include "comms/JsonLines.h"

namespace {

// Parses the single line written to out
bool parseLine(const std::string& text, StaticJsonDocument<2048>& doc) {
  if (text.empty() || text[text.size() - 1] != '\n') return false;
  return !deserializeJson(doc, text.c_str());
}

}  // namespace

TEST(JsonLines, SampleLineCarriesEveryField) {
  const std::vector<uint8_t> b = makeFrame(FrameFields());
  TelemetrySample s;
  ASSERT_EQ(protocol::decodeTelemetryFrame(b.data(), b.size(), s), DecodeStatus::OK);
  s.received_at_us = 123456789ULL;

  std::ostringstream out;
  protocol::encodeSampleLine(s, out);

  StaticJsonDocument<2048> doc;
  ASSERT_TRUE(parseLine(out.str(), doc)) << out.str();

  EXPECT_STREQ(doc["type"].as<const char*>(), "telemetry");
  EXPECT_EQ(doc["t_us"].as<uint64_t>(), 123456789ULL);
  EXPECT_EQ(doc["mode"].as<int>(), 1);
  EXPECT_STREQ(doc["mode_name"].as<const char*>(), "FAN");
  EXPECT_EQ(doc["height"]["setpoint_mm"].as<int>(), 250);
  EXPECT_EQ(doc["height"]["measured_mm"].as<int>(), 240);
  EXPECT_EQ(doc["tof_raw"].as<int>(), 1234);
  EXPECT_EQ(doc["temperature"]["x10"].as<int>(), 235);
  EXPECT_STREQ(doc["temperature"]["text"].as<const char*>(), "23.5");
  EXPECT_NEAR(doc["temperature"]["c"].as<double>(), 23.5, 1e-6);
  EXPECT_EQ(doc["valve"]["setpoint_raw"].as<int>(), 100);
  EXPECT_EQ(doc["valve"]["position_raw"].as<int>(), 98);
  EXPECT_EQ(doc["fan"]["duty_raw"].as<int>(), 512);
  EXPECT_NEAR(doc["fan"]["duty_pct"].as<double>(), 512.0 * 100.0 / 1023.0, 1e-6);
}

TEST(JsonLines, HealthLineReportsCountersAndNote) {
  LinkReader::Health h;
  h.bytes_in = 1500;
  h.frames_ok = 98;
  h.resync_events = 2;
  h.truncated_frames = 1;
  h.dropped_bytes = 17;

  std::ostringstream out;
  protocol::encodeHealthLine(h, 42, 60, "gap flush: dropped 3 buffered bytes", out);

  StaticJsonDocument<2048> doc;
  ASSERT_TRUE(parseLine(out.str(), doc)) << out.str();
  EXPECT_STREQ(doc["type"].as<const char*>(), "health");
  EXPECT_EQ(doc["frames_ok"].as<int>(), 98);
  EXPECT_EQ(doc["degraded"].as<int>(), 3);
  EXPECT_EQ(doc["detail"]["dropped_bytes"].as<int>(), 17);
  EXPECT_EQ(doc["window"]["samples"].as<int>(), 42);
  EXPECT_EQ(doc["window"]["retention_s"].as<int>(), 60);
  EXPECT_STREQ(doc["note"].as<const char*>(), "gap flush: dropped 3 buffered bytes");

  std::ostringstream quiet;
  protocol::encodeHealthLine(h, 0, 60, "", quiet);
  StaticJsonDocument<2048> doc2;
  ASSERT_TRUE(parseLine(quiet.str(), doc2));
  EXPECT_TRUE(doc2["note"].isNull());
}

TEST(JsonLines, SentLineShowsHexBytes) {
  CommandDispatcher d;
  const SubmitResult r = d.submit(1, 250, 512, 100);
  ASSERT_TRUE(r.ok());

  std::ostringstream out;
  protocol::encodeSentLine(r, out);

  StaticJsonDocument<2048> doc;
  ASSERT_TRUE(parseLine(out.str(), doc));
  EXPECT_STREQ(doc["type"].as<const char*>(), "sent");
  EXPECT_STREQ(doc["hex"].as<const char*>(), "01 00 FA 02 00 00 64");
  EXPECT_EQ(doc["valve"].as<int>(), 100);
}

TEST(JsonLines, ErrorLine) {
  std::ostringstream out;
  protocol::encodeErrorLine("rejected", "INVALID_MODE", out);

  StaticJsonDocument<2048> doc;
  ASSERT_TRUE(parseLine(out.str(), doc));
  EXPECT_STREQ(doc["reason"].as<const char*>(), "rejected");
  EXPECT_STREQ(doc["detail"].as<const char*>(), "INVALID_MODE");
}

TEST(JsonLines, FormatHexStopsAtBuffer) {
  const uint8_t data[] = { 0x00, 0xAB, 0xFF };
  char out[16];
  EXPECT_EQ(protocol::formatHex(data, 3, out, sizeof(out)), 8u);
  EXPECT_STREQ(out, "00 AB FF");

  char small[6];
  protocol::formatHex(data, 3, small, sizeof(small));
  EXPECT_STREQ(small, "00 AB");
}

TEST(JsonLines, DecodesRawCommand) {
  protocol::OperatorInput in;
  ASSERT_TRUE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd\",\"mode\":2,\"height_mm\":300,\"duty\":1000,\"valve\":-4}", in));
  EXPECT_EQ(in.kind, protocol::OperatorKind::CMD_RAW);
  EXPECT_EQ(in.mode, 2);
  EXPECT_EQ(in.height_mm, 300);
  EXPECT_EQ(in.duty, 1000);
  EXPECT_EQ(in.valve, -4);
}

TEST(JsonLines, DecodesPercentCommandWithDefaults) {
  protocol::OperatorInput in;
  ASSERT_TRUE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd_pct\",\"mode\":1,\"duty_pct\":37.5}", in));
  EXPECT_EQ(in.kind, protocol::OperatorKind::CMD_PERCENT);
  EXPECT_EQ(in.height_mm, 0);
  EXPECT_DOUBLE_EQ(in.duty_pct, 37.5);
  EXPECT_DOUBLE_EQ(in.valve_pct, 0.0);
}

TEST(JsonLines, DecodesResetAndRetention) {
  protocol::OperatorInput in;
  ASSERT_TRUE(protocol::decodeOperatorLine("{\"type\":\"reset\"}", in));
  EXPECT_EQ(in.kind, protocol::OperatorKind::RESET);

  ASSERT_TRUE(protocol::decodeOperatorLine("{\"type\":\"retention\",\"seconds\":120}", in));
  EXPECT_EQ(in.kind, protocol::OperatorKind::RETENTION);
  EXPECT_EQ(in.retention_s, 120);
}

TEST(JsonLines, HugeNumbersSaturateInsteadOfWrapping) {
  protocol::OperatorInput in;
  ASSERT_TRUE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd\",\"mode\":0,\"height_mm\":1e12,\"duty\":-1e12}", in));
  EXPECT_EQ(in.height_mm, INT32_MAX);
  EXPECT_EQ(in.duty, INT32_MIN);
}

TEST(JsonLines, RejectsBadOperatorLines) {
  protocol::OperatorInput in;
  const char* why = nullptr;

  EXPECT_FALSE(protocol::decodeOperatorLine("not json", in, &why));
  EXPECT_STREQ(why, "bad json");

  EXPECT_FALSE(protocol::decodeOperatorLine("[1,2]", in, &why));
  EXPECT_STREQ(why, "not an object");

  EXPECT_FALSE(protocol::decodeOperatorLine("{\"mode\":1}", in, &why));
  EXPECT_STREQ(why, "missing type");

  EXPECT_FALSE(protocol::decodeOperatorLine("{\"type\":\"fly\"}", in, &why));
  EXPECT_STREQ(why, "unknown type");

  EXPECT_FALSE(protocol::decodeOperatorLine("{\"type\":\"cmd\",\"height_mm\":5}", in, &why));
  EXPECT_STREQ(why, "missing mode");

  EXPECT_FALSE(protocol::decodeOperatorLine("{\"type\":\"cmd\",\"mode\":\"fan\"}", in, &why));
  EXPECT_STREQ(why, "missing mode");

  EXPECT_FALSE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd\",\"mode\":1,\"height_mm\":\"300\"}", in, &why));
  EXPECT_STREQ(why, "bad height_mm");

  EXPECT_FALSE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd\",\"mode\":1,\"duty\":true}", in, &why));
  EXPECT_STREQ(why, "bad duty");

  EXPECT_FALSE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd\",\"mode\":1,\"valve\":[1]}", in, &why));
  EXPECT_STREQ(why, "bad valve");

  EXPECT_FALSE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd_pct\",\"mode\":1,\"duty_pct\":\"50%\"}", in, &why));
  EXPECT_STREQ(why, "bad duty_pct");

  EXPECT_FALSE(protocol::decodeOperatorLine(
      "{\"type\":\"cmd_pct\",\"mode\":1,\"valve_pct\":null}", in, &why));
  EXPECT_STREQ(why, "bad valve_pct");

  EXPECT_FALSE(protocol::decodeOperatorLine("{\"type\":\"retention\"}", in, &why));
  EXPECT_STREQ(why, "missing seconds");

  EXPECT_FALSE(protocol::decodeOperatorLine(nullptr, in, &why));
  EXPECT_EQ(in.kind, protocol::OperatorKind::NONE);
}
