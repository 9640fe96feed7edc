/**
 * @file dispatcher.hpp
 * @brief Typed robot operations on top of a request/reply link.
 *
 * BasicDispatcher<Link> is the public contract for driving the robot. Link is
 * any type providing:
 *
 * @code
 *   expected<Frame, RobotError> Exchange(const Frame& req,
 *                                        uint32_t expected_reply_len,
 *                                        uint32_t timeout_ms);
 *   expected<void, RobotError> Reopen();
 *   const CodecOptions& GetCodecOptions() const;
 * @endcode
 *
 * SerialSession is the production link (see Dispatcher alias); tests plug in
 * a recording fake.
 *
 * Policy:
 *   - Arguments are validated before any I/O. kInvalidArgument means nothing
 *     was written.
 *   - Actuator commands (and Ping) are retried once on kTimeout. The link is
 *     Degraded after a timeout, so the retry reopens it first.
 *   - Sensor queries are never retried. The cached snapshot changes only
 *     after a fully decoded reply.
 *   - Every other failure is returned unchanged.
 *
 * Not thread-safe; callers sharing one dispatcher must serialize calls.
 */

#ifndef MIIA_DISPATCHER_HPP_
#define MIIA_DISPATCHER_HPP_

#include "miia/frame_codec.hpp"
#include "miia/log.hpp"
#include "miia/sensor_cache.hpp"
#include "miia/serial_session.hpp"
#include "miia/vocabulary.hpp"

#include <cstdint>
#include <cstring>

namespace miia {

// ============================================================================
// Operation Vocabulary
// ============================================================================

enum class MotorId : uint8_t {
  kA = 0U,
  kB = 1U,
};

enum class Direction : uint8_t {
  kForward = kDirectionForward,
  kReverse = kDirectionReverse,
  kStop = kDirectionStop,
};

enum class BuzzerState : uint8_t {
  kOff = 0U,
  kOn = 1U,
};

static constexpr int32_t kMotorSpeedMin = 0;
static constexpr int32_t kMotorSpeedMax = 100;
static constexpr int32_t kCalibrationMin = -50;
static constexpr int32_t kCalibrationMax = 50;

/// Automatic retries for actuator commands after a timeout.
static constexpr uint32_t kActuatorRetries = 1U;

/// "a" / "b" (lowercase, as printed on the board).
inline optional<MotorId> ParseMotorId(char c) noexcept {
  if (c == 'a') return optional<MotorId>(MotorId::kA);
  if (c == 'b') return optional<MotorId>(MotorId::kB);
  return {};
}

inline optional<Direction> ParseDirection(const char* s) noexcept {
  if (s == nullptr) return {};
  if (std::strcmp(s, "forward") == 0) return optional<Direction>(Direction::kForward);
  if (std::strcmp(s, "reverse") == 0) return optional<Direction>(Direction::kReverse);
  if (std::strcmp(s, "stop") == 0) return optional<Direction>(Direction::kStop);
  return {};
}

inline optional<BuzzerState> ParseBuzzerState(const char* s) noexcept {
  if (s == nullptr) return {};
  if (std::strcmp(s, "on") == 0) return optional<BuzzerState>(BuzzerState::kOn);
  if (std::strcmp(s, "off") == 0) return optional<BuzzerState>(BuzzerState::kOff);
  return {};
}

// ============================================================================
// Dispatcher Config / Statistics
// ============================================================================

struct DispatcherConfig {
  uint32_t reply_timeout_ms = kDefaultReplyTimeoutMs;
  int32_t motor_a_calibration = 0;
  int32_t motor_b_calibration = 0;
};

struct DispatcherStatistics {
  uint64_t commands = 0U;           ///< Operations that reached the link
  uint64_t retries = 0U;
  uint64_t timeouts = 0U;
  uint64_t malformed_replies = 0U;
  uint64_t firmware_errors = 0U;
  uint64_t invalid_arguments = 0U;
  uint64_t sensor_refreshes = 0U;   ///< Successful RefreshSensors() calls
};

// ============================================================================
// BasicDispatcher
// ============================================================================

template <typename Link>
class BasicDispatcher {
 public:
  explicit BasicDispatcher(Link& link, const DispatcherConfig& cfg = {}) noexcept
      : link_(link),
        cfg_(cfg),
        calibration_{cfg.motor_a_calibration, cfg.motor_b_calibration} {}

  BasicDispatcher(const BasicDispatcher&) = delete;
  BasicDispatcher& operator=(const BasicDispatcher&) = delete;

  // ------------------------------------------------------------------
  // Actuators
  // ------------------------------------------------------------------

  /// @brief Mix the LED colour; each channel 0..255, all 0 turns it off.
  expected<void, RobotError> SetRgbLed(int32_t red, int32_t green,
                                       int32_t blue) noexcept {
    return RunActuator(Command(Opcode::kRgbLed, red, green, blue));
  }

  /// @brief Move the positional servo; 0..100 spans 0..180 degrees.
  expected<void, RobotError> SetServoAngle(int32_t position) noexcept {
    return RunActuator(Command(Opcode::kServo, position));
  }

  /**
   * @brief Drive one DC motor.
   *
   * The motor's calibration factor is added to @p speed and the result
   * clamped to 0..100. kStop always sends speed 0.
   */
  expected<void, RobotError> SetMotor(MotorId motor, Direction direction,
                                      int32_t speed) noexcept {
    if (!IsValid(motor) || !IsValid(direction)) {
      return Reject("set_motor: unknown motor or direction");
    }
    if (speed < kMotorSpeedMin || speed > kMotorSpeedMax) {
      MIIA_LOG_WARN("dispatch", "set_motor: speed %d outside [%d, %d]", speed,
                    kMotorSpeedMin, kMotorSpeedMax);
      ++stats_.invalid_arguments;
      return expected<void, RobotError>::error(RobotError::kInvalidArgument);
    }

    int32_t effective = speed + calibration_[static_cast<uint8_t>(motor)];
    if (effective < kMotorSpeedMin) effective = kMotorSpeedMin;
    if (effective > kMotorSpeedMax) effective = kMotorSpeedMax;
    if (direction == Direction::kStop) effective = 0;

    const Opcode op = (motor == MotorId::kA) ? Opcode::kMotorA : Opcode::kMotorB;
    return RunActuator(
        Command(op, static_cast<int32_t>(direction), effective));
  }

  /// @brief Text form: motor "a"/"b", direction "forward"/"reverse"/"stop".
  expected<void, RobotError> SetMotor(char motor, const char* direction,
                                      int32_t speed) noexcept {
    const optional<MotorId> m = ParseMotorId(motor);
    const optional<Direction> d = ParseDirection(direction);
    if (!m || !d) {
      return Reject("set_motor: motor must be 'a' or 'b', direction "
                    "forward/reverse/stop");
    }
    return SetMotor(m.value(), d.value(), speed);
  }

  expected<void, RobotError> SetBuzzer(BuzzerState state) noexcept {
    if (state != BuzzerState::kOn && state != BuzzerState::kOff) {
      return Reject("set_buzzer: unknown state");
    }
    return RunActuator(Command(Opcode::kBuzzer, static_cast<int32_t>(state)));
  }

  /// @brief Text form: "on" / "off".
  expected<void, RobotError> SetBuzzer(const char* state) noexcept {
    const optional<BuzzerState> s = ParseBuzzerState(state);
    if (!s) return Reject("set_buzzer: state must be 'on' or 'off'");
    return SetBuzzer(s.value());
  }

  // ------------------------------------------------------------------
  // Calibration (host-side only, nothing is sent)
  // ------------------------------------------------------------------

  expected<void, RobotError> SetMotorCalibration(MotorId motor,
                                                 int32_t factor) noexcept {
    if (!IsValid(motor)) return Reject("calibration: unknown motor");
    if (factor < kCalibrationMin || factor > kCalibrationMax) {
      MIIA_LOG_WARN("dispatch", "calibration %d outside [%d, %d]", factor,
                    kCalibrationMin, kCalibrationMax);
      ++stats_.invalid_arguments;
      return expected<void, RobotError>::error(RobotError::kInvalidArgument);
    }
    calibration_[static_cast<uint8_t>(motor)] = factor;
    MIIA_LOG_DEBUG("dispatch", "motor %c calibration = %d",
                   (motor == MotorId::kA) ? 'a' : 'b', factor);
    return expected<void, RobotError>::success();
  }

  expected<void, RobotError> SetMotorCalibration(char motor,
                                                 int32_t factor) noexcept {
    const optional<MotorId> m = ParseMotorId(motor);
    if (!m) return Reject("calibration: motor must be 'a' or 'b'");
    return SetMotorCalibration(m.value(), factor);
  }

  int32_t MotorCalibration(MotorId motor) const noexcept {
    return IsValid(motor) ? calibration_[static_cast<uint8_t>(motor)] : 0;
  }

  // ------------------------------------------------------------------
  // Sensors
  // ------------------------------------------------------------------

  /**
   * @brief Query every sensor in one exchange and publish the snapshot.
   *
   * On any failure the previously cached snapshot is kept and the error is
   * returned. Never retried.
   */
  expected<SensorSnapshot, RobotError> RefreshSensors() noexcept {
    const Command cmd(Opcode::kSensors);
    auto frame = FrameCodec::Encode(cmd, link_.GetCodecOptions());
    if (!frame) {
      return expected<SensorSnapshot, RobotError>::error(frame.get_error());
    }

    auto resp = ExchangeOnce(cmd.opcode, frame.value());
    if (!resp) {
      return expected<SensorSnapshot, RobotError>::error(resp.get_error());
    }

    auto snap = FrameCodec::DecodeSensorSnapshot(resp.value());
    if (!snap) {
      ++stats_.malformed_replies;
      return snap;
    }

    const SensorSnapshot& published = sensors_.Replace(snap.value());
    ++stats_.sensor_refreshes;
    MIIA_LOG_DEBUG("dispatch", "sensors #%u: button=%d distance=%u",
                   published.sequence, published.input_button_state ? 1 : 0,
                   static_cast<unsigned>(published.distance_sensor));
    return expected<SensorSnapshot, RobotError>::success(published);
  }

  /// @brief Liveness check; same frame the session uses for its handshake.
  expected<void, RobotError> Ping() noexcept {
    return RunActuator(Command(Opcode::kPing));
  }

  // ------------------------------------------------------------------
  // Accessors
  // ------------------------------------------------------------------

  const SensorCache& Sensors() const noexcept { return sensors_; }

  /// Raw status byte of the most recent firmware fault, 0 if none yet.
  uint8_t LastFirmwareCode() const noexcept { return last_firmware_code_; }

  const DispatcherConfig& GetConfig() const noexcept { return cfg_; }
  DispatcherStatistics GetStatistics() const noexcept { return stats_; }
  Link& GetLink() noexcept { return link_; }

 private:
  static bool IsValid(MotorId m) noexcept {
    return m == MotorId::kA || m == MotorId::kB;
  }

  static bool IsValid(Direction d) noexcept {
    return d == Direction::kForward || d == Direction::kReverse ||
           d == Direction::kStop;
  }

  expected<void, RobotError> Reject(const char* why) noexcept {
    MIIA_LOG_WARN("dispatch", "%s", why);
    ++stats_.invalid_arguments;
    return expected<void, RobotError>::error(RobotError::kInvalidArgument);
  }

  /// Encode, exchange, and on kTimeout reopen the link and send once more.
  /// The reopen handshakes first: if the board is still silent the retried
  /// frame is never sent, the call returns kConnectionError and the link is
  /// left Closed until the caller reconnects.
  expected<void, RobotError> RunActuator(const Command& cmd) noexcept {
    auto frame = FrameCodec::Encode(cmd, link_.GetCodecOptions());
    if (!frame) {
      ++stats_.invalid_arguments;
      return expected<void, RobotError>::error(frame.get_error());
    }

    for (uint32_t attempt = 0U;; ++attempt) {
      auto resp = ExchangeOnce(cmd.opcode, frame.value());
      if (resp) return expected<void, RobotError>::success();

      const RobotError err = resp.get_error();
      if (err != RobotError::kTimeout || attempt >= kActuatorRetries) {
        return expected<void, RobotError>::error(err);
      }

      ++stats_.retries;
      MIIA_LOG_WARN("dispatch", "%s timed out, reopening link for retry",
                    OpcodeName(cmd.opcode));
      auto reopened = link_.Reopen();
      if (!reopened) {
        MIIA_LOG_ERROR("dispatch", "%s retry abandoned: reopen failed (%s)",
                       OpcodeName(cmd.opcode),
                       RobotErrorToString(reopened.get_error()));
        return reopened;
      }
    }
  }

  /// One exchange + decode. Firmware faults become kFirmwareError here.
  expected<Response, RobotError> ExchangeOnce(Opcode op,
                                              const Frame& frame) noexcept {
    const CodecOptions& opts = link_.GetCodecOptions();
    ++stats_.commands;

    auto raw = link_.Exchange(frame, FrameCodec::ReplySize(op, opts),
                              cfg_.reply_timeout_ms);
    if (!raw) {
      if (raw.get_error() == RobotError::kTimeout) ++stats_.timeouts;
      return expected<Response, RobotError>::error(raw.get_error());
    }

    auto resp = FrameCodec::Decode(raw.value().bytes, raw.value().size, op, opts);
    if (!resp) {
      ++stats_.malformed_replies;
      return resp;
    }

    if (!resp.value().ok()) {
      last_firmware_code_ = resp.value().firmware_code;
      ++stats_.firmware_errors;
      MIIA_LOG_ERROR("dispatch", "%s: firmware fault 0x%02X", OpcodeName(op),
                     static_cast<unsigned>(last_firmware_code_));
      return expected<Response, RobotError>::error(RobotError::kFirmwareError);
    }
    return resp;
  }

  Link& link_;
  DispatcherConfig cfg_;
  int32_t calibration_[2];
  SensorCache sensors_;
  uint8_t last_firmware_code_ = 0U;
  DispatcherStatistics stats_;
};

using Dispatcher = BasicDispatcher<SerialSession>;

}  // namespace miia

#endif  // MIIA_DISPATCHER_HPP_
