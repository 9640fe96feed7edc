/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and robot_config.hpp.
 */

#include "miia/config.hpp"
#include "miia/robot_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <cstdio>
#include <cstring>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore SetValue and typed getters", "[config]") {
  miia::ConfigStore store;
  REQUIRE(store.SetValue("serial", "baud", "57600").has_value());
  REQUIRE(store.SetValue("serial", "checksum", "on").has_value());
  REQUIRE(store.SetValue("serial", "port", "/dev/ttyACM0").has_value());

  REQUIRE(store.GetUint("serial", "baud") == 57600U);
  REQUIRE(store.GetBool("serial", "checksum") == true);
  REQUIRE(std::strcmp(store.GetString("serial", "port"), "/dev/ttyACM0") == 0);
  REQUIRE(store.HasSection("SERIAL"));
  REQUIRE(store.HasKey("serial", "Port"));
  REQUIRE(store.EntryCount() == 3U);

  REQUIRE(store.SetValue("serial", "baud", "9600").has_value());
  REQUIRE(store.GetUint("serial", "baud") == 9600U);
  REQUIRE(store.EntryCount() == 3U);
}

TEST_CASE("ConfigStore FindInt rejects partial numbers", "[config]") {
  miia::ConfigStore store;
  (void)store.SetValue("protocol", "reply_timeout_ms", "100ms");
  (void)store.SetValue("motor", "calibration_a", "-12");

  REQUIRE(!store.FindInt("protocol", "reply_timeout_ms").has_value());
  REQUIRE(store.FindInt("motor", "calibration_a").value() == -12);
  REQUIRE(store.GetInt("missing", "key", 7) == 7);
}

TEST_CASE("ConfigStore FindInt rejects values outside int32_t", "[config]") {
  miia::ConfigStore store;
  (void)store.SetValue("protocol", "reply_timeout_ms", "4294967396");
  (void)store.SetValue("motor", "calibration_a", "-2147483649");
  (void)store.SetValue("motor", "calibration_b", "99999999999999999999999");
  (void)store.SetValue("serial", "baud", "2147483647");

  REQUIRE(!store.FindInt("protocol", "reply_timeout_ms").has_value());
  REQUIRE(!store.FindInt("motor", "calibration_a").has_value());
  REQUIRE(!store.FindInt("motor", "calibration_b").has_value());
  REQUIRE(store.FindInt("serial", "baud").value() == INT32_MAX);
}

TEST_CASE("ConfigStore FindBool", "[config]") {
  miia::ConfigStore store;
  (void)store.SetValue("f", "a", "yes");
  (void)store.SetValue("f", "b", "OFF");
  (void)store.SetValue("f", "c", "maybe");

  REQUIRE(store.FindBool("f", "a").value() == true);
  REQUIRE(store.FindBool("f", "b").value() == false);
  REQUIRE(!store.FindBool("f", "c").has_value());
  REQUIRE(!store.FindBool("f", "d").has_value());
}

TEST_CASE("ConfigStore capacity", "[config]") {
  miia::ConfigStore store;
  char key[16];
  for (uint32_t i = 0; i < miia::ConfigStore::kMaxEntries; ++i) {
    std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.SetValue("s", key, "1").has_value());
  }
  auto r = store.SetValue("s", "overflow", "1");
  REQUIRE(r.get_error() == miia::ConfigError::kBufferFull);
}

// ============================================================================
// LoadRobotConfig
// ============================================================================

TEST_CASE("LoadRobotConfig defaults on an empty store", "[config][robot]") {
  miia::ConfigStore store;
  auto r = miia::LoadRobotConfig(store);
  REQUIRE(r.has_value());

  const miia::RobotConfig& cfg = r.value();
  REQUIRE(cfg.session.port_name == "/dev/ttyUSB0");
  REQUIRE(cfg.session.baud_rate == 57600U);
  REQUIRE(cfg.session.codec.checksum == false);
  REQUIRE(cfg.dispatcher.reply_timeout_ms == 100U);
  REQUIRE(cfg.dispatcher.motor_a_calibration == 0);
  REQUIRE(!cfg.log_level.has_value());
}

TEST_CASE("LoadRobotConfig reads every key", "[config][robot]") {
  miia::ConfigStore store;
  (void)store.SetValue("serial", "port", "/dev/ttyACM1");
  (void)store.SetValue("serial", "baud", "115200");
  (void)store.SetValue("serial", "checksum", "true");
  (void)store.SetValue("serial", "handshake_timeout_ms", "3000");
  (void)store.SetValue("serial", "handshake_interval_ms", "250");
  (void)store.SetValue("protocol", "reply_timeout_ms", "150");
  (void)store.SetValue("motor", "calibration_a", "-5");
  (void)store.SetValue("motor", "calibration_b", "50");
  (void)store.SetValue("log", "level", "warn");

  auto r = miia::LoadRobotConfig(store);
  REQUIRE(r.has_value());
  const miia::RobotConfig& cfg = r.value();
  REQUIRE(cfg.session.port_name == "/dev/ttyACM1");
  REQUIRE(cfg.session.baud_rate == 115200U);
  REQUIRE(cfg.session.codec.checksum == true);
  REQUIRE(cfg.session.handshake_timeout_ms == 3000U);
  REQUIRE(cfg.session.handshake_interval_ms == 250U);
  REQUIRE(cfg.dispatcher.reply_timeout_ms == 150U);
  REQUIRE(cfg.dispatcher.motor_a_calibration == -5);
  REQUIRE(cfg.dispatcher.motor_b_calibration == 50);
  REQUIRE(cfg.log_level.value() == miia::log::Level::kWarn);
}

TEST_CASE("LoadRobotConfig rejects bad values", "[config][robot]") {
  miia::ConfigStore store;

  SECTION("empty port") { (void)store.SetValue("serial", "port", ""); }
  SECTION("unsupported baud") { (void)store.SetValue("serial", "baud", "12345"); }
  SECTION("non-numeric baud") { (void)store.SetValue("serial", "baud", "fast"); }
  SECTION("reply timeout wraps past 32 bits") {
    (void)store.SetValue("protocol", "reply_timeout_ms", "4294967396");
  }
  SECTION("zero reply timeout") {
    (void)store.SetValue("protocol", "reply_timeout_ms", "0");
  }
  SECTION("negative handshake timeout") {
    (void)store.SetValue("serial", "handshake_timeout_ms", "-1");
  }
  SECTION("checksum not boolean") {
    (void)store.SetValue("serial", "checksum", "crc16");
  }
  SECTION("calibration out of range") {
    (void)store.SetValue("motor", "calibration_b", "51");
  }
  SECTION("unknown log level") { (void)store.SetValue("log", "level", "loud"); }

  auto r = miia::LoadRobotConfig(store);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == miia::ConfigError::kInvalidValue);
}

TEST_CASE("LoadRobotConfig layers over caller defaults", "[config][robot]") {
  miia::RobotConfig defaults;
  defaults.session.port_name.assign(miia::TruncateToCapacity, "/dev/ttyS3");
  defaults.dispatcher.motor_a_calibration = 7;

  miia::ConfigStore store;
  (void)store.SetValue("serial", "baud", "9600");

  auto r = miia::LoadRobotConfig(store, defaults);
  REQUIRE(r.has_value());
  REQUIRE(r.value().session.port_name == "/dev/ttyS3");
  REQUIRE(r.value().session.baud_rate == 9600U);
  REQUIRE(r.value().dispatcher.motor_a_calibration == 7);
}

// ============================================================================
// Backend tags
// ============================================================================

TEST_CASE("Backend MatchesExtension", "[config][tag]") {
  REQUIRE(miia::IniBackend::MatchesExtension("ini"));
  REQUIRE(miia::IniBackend::MatchesExtension("CONF"));
  REQUIRE(miia::JsonBackend::MatchesExtension("json"));
  REQUIRE(miia::YamlBackend::MatchesExtension("yml"));
  REQUIRE(!miia::YamlBackend::MatchesExtension("ini"));
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef MIIA_CONFIG_INI_ENABLED

TEST_CASE("INI robot file", "[config][ini]") {
  const char* ini_data =
      "[serial]\n"
      "port = /dev/ttyUSB1\n"
      "baud = 57600\n"
      "checksum = no\n"
      "[motor]\n"
      "calibration_a = 3\n"
      "[log]\n"
      "level = debug\n";

  miia::IniConfig cfg;
  auto loaded = cfg.LoadBuffer(ini_data,
                               static_cast<uint32_t>(std::strlen(ini_data)),
                               miia::ConfigFormat::kIni);
  REQUIRE(loaded.has_value());

  auto r = miia::LoadRobotConfig(cfg);
  REQUIRE(r.has_value());
  REQUIRE(r.value().session.port_name == "/dev/ttyUSB1");
  REQUIRE(r.value().dispatcher.motor_a_calibration == 3);
  REQUIRE(r.value().log_level.value() == miia::log::Level::kDebug);
}

TEST_CASE("INI LoadFile from disk", "[config][ini]") {
  const char* path = "/tmp/__miia_test_config__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[protocol]\nreply_timeout_ms = 200\n");
  std::fclose(f);

  miia::IniConfig cfg;
  auto result = cfg.LoadFile(path);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetUint("protocol", "reply_timeout_ms") == 200U);

  std::remove(path);
}

TEST_CASE("INI LoadFile nonexistent", "[config][ini]") {
  miia::IniConfig cfg;
  auto result = cfg.LoadFile("/tmp/__nonexistent__.ini");
  REQUIRE(result.get_error() == miia::ConfigError::kFileNotFound);
}

TEST_CASE("INI format not supported returns error", "[config][ini]") {
  miia::IniConfig cfg;
  auto result = cfg.LoadBuffer("{}", 2, miia::ConfigFormat::kJson);
  REQUIRE(result.get_error() == miia::ConfigError::kFormatNotSupported);
}

#endif  // MIIA_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef MIIA_CONFIG_JSON_ENABLED

TEST_CASE("JSON robot file", "[config][json]") {
  const char* json_data = R"({
    "serial": { "port": "/dev/ttyUSB2", "baud": 19200, "checksum": true },
    "motor": { "calibration_b": -10 }
  })";

  miia::JsonConfig cfg;
  auto loaded = cfg.LoadBuffer(json_data,
                               static_cast<uint32_t>(std::strlen(json_data)),
                               miia::ConfigFormat::kJson);
  REQUIRE(loaded.has_value());

  auto r = miia::LoadRobotConfig(cfg);
  REQUIRE(r.has_value());
  REQUIRE(r.value().session.baud_rate == 19200U);
  REQUIRE(r.value().session.codec.checksum == true);
  REQUIRE(r.value().dispatcher.motor_b_calibration == -10);
}

TEST_CASE("JSON parse error", "[config][json]") {
  const char* bad = "{ \"serial\": ";
  miia::JsonConfig cfg;
  auto result = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                               miia::ConfigFormat::kJson);
  REQUIRE(result.get_error() == miia::ConfigError::kParseError);
}

#endif  // MIIA_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef MIIA_CONFIG_YAML_ENABLED

TEST_CASE("YAML robot file", "[config][yaml]") {
  const char* yaml_data =
      "serial:\n"
      "  port: /dev/ttyUSB3\n"
      "  baud: 38400\n"
      "protocol:\n"
      "  reply_timeout_ms: 120\n";

  miia::YamlConfig cfg;
  auto loaded = cfg.LoadBuffer(yaml_data,
                               static_cast<uint32_t>(std::strlen(yaml_data)),
                               miia::ConfigFormat::kYaml);
  REQUIRE(loaded.has_value());

  auto r = miia::LoadRobotConfig(cfg);
  REQUIRE(r.has_value());
  REQUIRE(r.value().session.port_name == "/dev/ttyUSB3");
  REQUIRE(r.value().session.baud_rate == 38400U);
  REQUIRE(r.value().dispatcher.reply_timeout_ms == 120U);
}

#endif  // MIIA_CONFIG_YAML_ENABLED
