/**
 * @file robot_config.hpp
 * @brief Typed host settings read from a ConfigStore.
 *
 * Recognised keys (all optional, defaults from SessionConfig /
 * DispatcherConfig):
 *
 * @code
 *   [serial]
 *   port = /dev/ttyUSB0
 *   baud = 57600
 *   checksum = false
 *   handshake_timeout_ms = 2000
 *   handshake_interval_ms = 100
 *
 *   [protocol]
 *   reply_timeout_ms = 100
 *
 *   [motor]
 *   calibration_a = 0      ; -50 .. 50
 *   calibration_b = 0
 *
 *   [log]
 *   level = info           ; debug | info | warn | error | fatal | off
 * @endcode
 */

#ifndef MIIA_ROBOT_CONFIG_HPP_
#define MIIA_ROBOT_CONFIG_HPP_

#include "miia/config.hpp"
#include "miia/dispatcher.hpp"
#include "miia/log.hpp"
#include "miia/serial_session.hpp"
#include "miia/vocabulary.hpp"

#include <cstdint>

namespace miia {

struct RobotConfig {
  SessionConfig session;
  DispatcherConfig dispatcher;
  optional<log::Level> log_level;  ///< Empty: leave the logger alone
};

namespace detail {

/// Present-but-unparsable values are errors; absent keys keep @p out.
inline bool ReadUint(const ConfigStore& store, const char* section,
                     const char* key, uint32_t& out) {
  if (!store.HasKey(section, key)) return true;
  const optional<int32_t> v = store.FindInt(section, key);
  if (!v || v.value() < 0) {
    MIIA_LOG_ERROR("config", "[%s] %s = '%s' is not a non-negative integer",
                   section, key, store.GetString(section, key));
    return false;
  }
  out = static_cast<uint32_t>(v.value());
  return true;
}

inline bool ReadCalibration(const ConfigStore& store, const char* key,
                            int32_t& out) {
  if (!store.HasKey("motor", key)) return true;
  const optional<int32_t> v = store.FindInt("motor", key);
  if (!v || v.value() < kCalibrationMin || v.value() > kCalibrationMax) {
    MIIA_LOG_ERROR("config", "[motor] %s = '%s' outside [%d, %d]", key,
                   store.GetString("motor", key), kCalibrationMin,
                   kCalibrationMax);
    return false;
  }
  out = v.value();
  return true;
}

}  // namespace detail

/**
 * @brief Build a RobotConfig from @p store on top of @p defaults.
 * @return ConfigError::kInvalidValue on any malformed or out-of-range value.
 */
inline expected<RobotConfig, ConfigError> LoadRobotConfig(
    const ConfigStore& store, const RobotConfig& defaults = RobotConfig{}) {
  RobotConfig out = defaults;
  const auto invalid = []() {
    return expected<RobotConfig, ConfigError>::error(ConfigError::kInvalidValue);
  };

  if (store.HasKey("serial", "port")) {
    const char* port = store.GetString("serial", "port");
    if (port[0] == '\0') {
      MIIA_LOG_ERROR("config", "[serial] port is empty");
      return invalid();
    }
    out.session.port_name.assign(TruncateToCapacity, port);
  }

  if (!detail::ReadUint(store, "serial", "baud", out.session.baud_rate) ||
      !detail::ReadUint(store, "serial", "handshake_timeout_ms",
                        out.session.handshake_timeout_ms) ||
      !detail::ReadUint(store, "serial", "handshake_interval_ms",
                        out.session.handshake_interval_ms) ||
      !detail::ReadUint(store, "protocol", "reply_timeout_ms",
                        out.dispatcher.reply_timeout_ms)) {
    return invalid();
  }
  if (!SerialSession::IsSupportedBaud(out.session.baud_rate)) {
    MIIA_LOG_ERROR("config", "[serial] baud %u is not supported",
                   out.session.baud_rate);
    return invalid();
  }
  if (out.session.handshake_timeout_ms == 0U ||
      out.session.handshake_interval_ms == 0U ||
      out.dispatcher.reply_timeout_ms == 0U) {
    MIIA_LOG_ERROR("config", "timeouts must be non-zero");
    return invalid();
  }

  if (store.HasKey("serial", "checksum")) {
    const optional<bool> crc = store.FindBool("serial", "checksum");
    if (!crc) {
      MIIA_LOG_ERROR("config", "[serial] checksum = '%s' is not a boolean",
                     store.GetString("serial", "checksum"));
      return invalid();
    }
    out.session.codec.checksum = crc.value();
  }

  if (!detail::ReadCalibration(store, "calibration_a",
                               out.dispatcher.motor_a_calibration) ||
      !detail::ReadCalibration(store, "calibration_b",
                               out.dispatcher.motor_b_calibration)) {
    return invalid();
  }

  if (store.HasKey("log", "level")) {
    log::Level level = log::Level::kInfo;
    if (!log::ParseLevel(store.GetString("log", "level"), level)) {
      MIIA_LOG_ERROR("config", "[log] level = '%s' is unknown",
                     store.GetString("log", "level"));
      return invalid();
    }
    out.log_level = level;
  }

  return expected<RobotConfig, ConfigError>::success(out);
}

}  // namespace miia

#endif  // MIIA_ROBOT_CONFIG_HPP_
