/**
 * @file frame_codec.hpp
 * @brief MiiA.bit wire format: command encoding and reply decoding.
 *
 * Request frame (host -> firmware), fixed length per opcode:
 *   [opcode][arg0][arg1]...            (+ crc16 LE when checksum enabled)
 *   RGB is special: [0xCC r 0xCD g 0xCE b], one sub-opcode per channel.
 *
 * Reply frame (firmware -> host), fixed length per opcode:
 *   [opcode echo][status][payload...]  (+ crc16 LE when checksum enabled)
 *   status 0 = success, anything else is the firmware fault code.
 *
 * Sensor payload (7 bytes, markers as sent by the firmware):
 *   ['c'][button]['c']['z'][distance_hi][distance_lo]['z']
 *
 * No dynamic allocation; every frame fits in a Frame stack buffer.
 */

#ifndef MIIA_FRAME_CODEC_HPP_
#define MIIA_FRAME_CODEC_HPP_

#include "miia/log.hpp"
#include "miia/platform.hpp"
#include "miia/vocabulary.hpp"

#include <cstdint>
#include <cstring>

namespace miia {

// ============================================================================
// Robot Error
// ============================================================================

enum class RobotError : uint8_t {
  kInvalidArgument,    ///< Caller value out of range; nothing was sent
  kConnectionError,    ///< Port could not be opened or handshake failed
  kTimeout,            ///< No or incomplete reply within the bound
  kMalformedResponse,  ///< Reply length / echo / marker / checksum mismatch
  kFirmwareError,      ///< Firmware reported a fault code
  kNotConnected,       ///< Session is closed
  kLinkDegraded,       ///< Session must be closed and reopened first
  kIoError,            ///< read/write/poll failed mid-exchange
};

inline const char* RobotErrorToString(RobotError e) noexcept {
  switch (e) {
    case RobotError::kInvalidArgument:
      return "InvalidArgument";
    case RobotError::kConnectionError:
      return "ConnectionError";
    case RobotError::kTimeout:
      return "Timeout";
    case RobotError::kMalformedResponse:
      return "MalformedResponse";
    case RobotError::kFirmwareError:
      return "FirmwareError";
    case RobotError::kNotConnected:
      return "NotConnected";
    case RobotError::kLinkDegraded:
      return "LinkDegraded";
    case RobotError::kIoError:
      return "IoError";
    default:
      return "Unknown";
  }
}

// ============================================================================
// Wire Constants
// ============================================================================

enum class Opcode : uint8_t {
  kPing = 0x00U,
  kBuzzer = 201U,
  kMotorA = 202U,
  kMotorB = 203U,
  kRgbLed = 204U,  ///< Doubles as the red channel sub-opcode
  kSensors = 207U,
  kServo = 208U,
};

static constexpr uint8_t kRgbGreenChannel = 205U;
static constexpr uint8_t kRgbBlueChannel = 206U;

static constexpr uint8_t kReplyStatusOk = 0x00U;
static constexpr uint8_t kSensorButtonMarker = 0x63U;    // 'c'
static constexpr uint8_t kSensorDistanceMarker = 0x7AU;  // 'z'

static constexpr uint32_t kMaxCommandArgs = 3U;
static constexpr uint32_t kReplyHeaderSize = 2U;  // echo + status
static constexpr uint32_t kSensorPayloadSize = 7U;
static constexpr uint32_t kMaxPayloadSize = kSensorPayloadSize;
static constexpr uint32_t kChecksumSize = 2U;

/// Largest request (RGB, 6) or reply (sensors, 9) plus checksum, rounded up.
static constexpr uint32_t kMaxFrameSize = 16U;

static_assert(kReplyHeaderSize + kMaxPayloadSize + kChecksumSize <= kMaxFrameSize,
              "sensor reply must fit in a Frame");

/// Motor direction codes as understood by the firmware.
static constexpr int32_t kDirectionForward = 0;
static constexpr int32_t kDirectionReverse = 1;
static constexpr int32_t kDirectionStop = 2;

// ============================================================================
// Codec Options
// ============================================================================

struct CodecOptions {
  /// Append / verify CRC-16/CCITT on every request and reply.
  bool checksum = false;
};

// ============================================================================
// Frame / Command / Response
// ============================================================================

struct Frame {
  uint8_t bytes[kMaxFrameSize] = {};
  uint32_t size = 0U;
};

/// One host action: opcode plus its ordered numeric arguments.
struct Command {
  Opcode opcode = Opcode::kPing;
  int32_t args[kMaxCommandArgs] = {};
  uint8_t arg_count = 0U;

  Command() = default;
  explicit Command(Opcode op) noexcept : opcode(op) {}
  Command(Opcode op, int32_t a0) noexcept : opcode(op), arg_count(1U) {
    args[0] = a0;
  }
  Command(Opcode op, int32_t a0, int32_t a1) noexcept
      : opcode(op), arg_count(2U) {
    args[0] = a0;
    args[1] = a1;
  }
  Command(Opcode op, int32_t a0, int32_t a1, int32_t a2) noexcept
      : opcode(op), arg_count(3U) {
    args[0] = a0;
    args[1] = a1;
    args[2] = a2;
  }
};

enum class ResponseStatus : uint8_t {
  kSuccess = 0U,
  kFirmwareError = 1U,
};

struct Response {
  Opcode opcode = Opcode::kPing;
  ResponseStatus status = ResponseStatus::kSuccess;
  uint8_t firmware_code = kReplyStatusOk;  ///< Raw status byte from the reply
  uint8_t payload[kMaxPayloadSize] = {};
  uint8_t payload_size = 0U;

  bool ok() const noexcept { return status == ResponseStatus::kSuccess; }
};

/// One consistent reading of every sensor, decoded from a single reply.
struct SensorSnapshot {
  bool input_button_state = false;
  uint16_t distance_sensor = 0U;
  uint32_t sequence = 0U;  ///< Assigned by the cache, 1 for the first reading
};

// ============================================================================
// Opcode Table
// ============================================================================

struct ArgRange {
  int32_t min;
  int32_t max;
};

struct OpcodeTraits {
  Opcode opcode;
  const char* name;
  uint8_t arity;
  ArgRange ranges[kMaxCommandArgs];
  uint8_t request_size;        ///< Without checksum
  uint8_t reply_payload_size;  ///< Bytes after echo + status
};

inline constexpr OpcodeTraits kOpcodeTable[] = {
    {Opcode::kPing, "ping", 0U, {{0, 0}, {0, 0}, {0, 0}}, 1U, 0U},
    {Opcode::kBuzzer, "buzzer", 1U, {{0, 1}, {0, 0}, {0, 0}}, 2U, 0U},
    {Opcode::kMotorA, "motor_a", 2U, {{0, 2}, {0, 100}, {0, 0}}, 3U, 0U},
    {Opcode::kMotorB, "motor_b", 2U, {{0, 2}, {0, 100}, {0, 0}}, 3U, 0U},
    {Opcode::kRgbLed, "rgb_led", 3U, {{0, 255}, {0, 255}, {0, 255}}, 6U, 0U},
    {Opcode::kSensors, "sensors", 0U, {{0, 0}, {0, 0}, {0, 0}}, 1U,
     static_cast<uint8_t>(kSensorPayloadSize)},
    {Opcode::kServo, "servo", 1U, {{0, 100}, {0, 0}, {0, 0}}, 2U, 0U},
};

inline const OpcodeTraits* FindOpcode(Opcode op) noexcept {
  for (const auto& t : kOpcodeTable) {
    if (t.opcode == op) return &t;
  }
  return nullptr;
}

inline const char* OpcodeName(Opcode op) noexcept {
  const OpcodeTraits* t = FindOpcode(op);
  return (t != nullptr) ? t->name : "unknown";
}

// ============================================================================
// CRC-16/CCITT (poly 0x1021, init 0xFFFF)
// ============================================================================

class Crc16Ccitt {
 public:
  static uint16_t Calculate(const void* data, uint32_t size) noexcept {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint16_t crc = 0xFFFFU;
    for (uint32_t i = 0U; i < size; ++i) {
      crc = static_cast<uint16_t>(crc ^ (static_cast<uint16_t>(p[i]) << 8));
      for (uint8_t bit = 0U; bit < 8U; ++bit) {
        crc = ((crc & 0x8000U) != 0U)
                  ? static_cast<uint16_t>((crc << 1) ^ 0x1021U)
                  : static_cast<uint16_t>(crc << 1);
      }
    }
    return crc;
  }
};

// ============================================================================
// FrameCodec
// ============================================================================

class FrameCodec final {
 public:
  /// Exact request length for @p op, 0 for an unknown opcode.
  static uint32_t RequestSize(Opcode op, const CodecOptions& opts) noexcept {
    const OpcodeTraits* t = FindOpcode(op);
    if (t == nullptr) return 0U;
    return t->request_size + (opts.checksum ? kChecksumSize : 0U);
  }

  /// Exact reply length for @p op, 0 for an unknown opcode.
  static uint32_t ReplySize(Opcode op, const CodecOptions& opts) noexcept {
    const OpcodeTraits* t = FindOpcode(op);
    if (t == nullptr) return 0U;
    return kReplyHeaderSize + t->reply_payload_size +
           (opts.checksum ? kChecksumSize : 0U);
  }

  /**
   * @brief Encode a command into its request frame.
   * @return kInvalidArgument on unknown opcode, wrong arity, or any argument
   *         outside the opcode's declared range.
   */
  static expected<Frame, RobotError> Encode(const Command& cmd,
                                            const CodecOptions& opts) noexcept {
    const OpcodeTraits* t = FindOpcode(cmd.opcode);
    if (t == nullptr) {
      MIIA_LOG_WARN("codec", "unknown opcode 0x%02X",
                    static_cast<unsigned>(cmd.opcode));
      return expected<Frame, RobotError>::error(RobotError::kInvalidArgument);
    }
    if (cmd.arg_count != t->arity) {
      MIIA_LOG_WARN("codec", "%s expects %u args, got %u", t->name,
                    static_cast<unsigned>(t->arity),
                    static_cast<unsigned>(cmd.arg_count));
      return expected<Frame, RobotError>::error(RobotError::kInvalidArgument);
    }
    for (uint8_t i = 0U; i < t->arity; ++i) {
      const int32_t v = cmd.args[i];
      if (v < t->ranges[i].min || v > t->ranges[i].max) {
        MIIA_LOG_WARN("codec", "%s arg %u = %d outside [%d, %d]", t->name,
                      static_cast<unsigned>(i), v, t->ranges[i].min,
                      t->ranges[i].max);
        return expected<Frame, RobotError>::error(RobotError::kInvalidArgument);
      }
    }

    Frame f;
    if (cmd.opcode == Opcode::kRgbLed) {
      f.bytes[0] = static_cast<uint8_t>(Opcode::kRgbLed);
      f.bytes[1] = static_cast<uint8_t>(cmd.args[0]);
      f.bytes[2] = kRgbGreenChannel;
      f.bytes[3] = static_cast<uint8_t>(cmd.args[1]);
      f.bytes[4] = kRgbBlueChannel;
      f.bytes[5] = static_cast<uint8_t>(cmd.args[2]);
      f.size = 6U;
    } else {
      f.bytes[0] = static_cast<uint8_t>(cmd.opcode);
      f.size = 1U;
      for (uint8_t i = 0U; i < t->arity; ++i) {
        f.bytes[f.size] = static_cast<uint8_t>(cmd.args[i]);
        ++f.size;
      }
    }
    MIIA_ASSERT(f.size == t->request_size);

    if (opts.checksum) AppendChecksum(f);
    return expected<Frame, RobotError>::success(f);
  }

  /**
   * @brief Decode the reply to an outstanding @p op.
   *
   * A firmware-reported fault is a successful decode with
   * status == kFirmwareError and the raw code in firmware_code.
   *
   * @return kMalformedResponse on length, echo or checksum mismatch.
   */
  static expected<Response, RobotError> Decode(const uint8_t* data,
                                               uint32_t size, Opcode op,
                                               const CodecOptions& opts) noexcept {
    const OpcodeTraits* t = FindOpcode(op);
    if (t == nullptr) {
      return expected<Response, RobotError>::error(RobotError::kInvalidArgument);
    }

    const uint32_t want = ReplySize(op, opts);
    if (size != want || data == nullptr) {
      MIIA_LOG_WARN("codec", "%s reply is %u bytes, expected %u", t->name,
                    size, want);
      return expected<Response, RobotError>::error(
          RobotError::kMalformedResponse);
    }

    if (opts.checksum) {
      const uint32_t body = size - kChecksumSize;
      const uint16_t computed = Crc16Ccitt::Calculate(data, body);
      const uint16_t received = ReadLE16(data + body);
      if (computed != received) {
        MIIA_LOG_WARN("codec", "%s reply crc 0x%04X != 0x%04X", t->name,
                      received, computed);
        return expected<Response, RobotError>::error(
            RobotError::kMalformedResponse);
      }
    }

    if (data[0] != static_cast<uint8_t>(op)) {
      MIIA_LOG_WARN("codec", "%s reply echoes opcode 0x%02X", t->name,
                    static_cast<unsigned>(data[0]));
      return expected<Response, RobotError>::error(
          RobotError::kMalformedResponse);
    }

    Response r;
    r.opcode = op;
    r.firmware_code = data[1];
    r.status = (data[1] == kReplyStatusOk) ? ResponseStatus::kSuccess
                                           : ResponseStatus::kFirmwareError;
    r.payload_size = t->reply_payload_size;
    if (r.payload_size > 0U) {
      std::memcpy(r.payload, data + kReplyHeaderSize, r.payload_size);
    }
    return expected<Response, RobotError>::success(r);
  }

  /**
   * @brief Interpret a decoded sensor reply.
   * @return kFirmwareError if the firmware reported a fault,
   *         kMalformedResponse on bad markers or a non-boolean button byte.
   */
  static expected<SensorSnapshot, RobotError> DecodeSensorSnapshot(
      const Response& r) noexcept {
    if (r.opcode != Opcode::kSensors || r.payload_size != kSensorPayloadSize) {
      return expected<SensorSnapshot, RobotError>::error(
          RobotError::kMalformedResponse);
    }
    if (!r.ok()) {
      return expected<SensorSnapshot, RobotError>::error(
          RobotError::kFirmwareError);
    }
    const uint8_t* p = r.payload;
    if (p[0] != kSensorButtonMarker || p[2] != kSensorButtonMarker ||
        p[3] != kSensorDistanceMarker || p[6] != kSensorDistanceMarker) {
      MIIA_LOG_WARN("codec", "sensor markers %02X %02X %02X %02X", p[0], p[2],
                    p[3], p[6]);
      return expected<SensorSnapshot, RobotError>::error(
          RobotError::kMalformedResponse);
    }
    if (p[1] > 1U) {
      MIIA_LOG_WARN("codec", "button byte 0x%02X is not boolean", p[1]);
      return expected<SensorSnapshot, RobotError>::error(
          RobotError::kMalformedResponse);
    }

    SensorSnapshot s;
    s.input_button_state = (p[1] == 1U);
    s.distance_sensor =
        static_cast<uint16_t>((static_cast<uint16_t>(p[4]) << 8) | p[5]);
    return expected<SensorSnapshot, RobotError>::success(s);
  }

  /**
   * @brief Build the reply the firmware sends for @p op.
   *
   * Used by firmware simulators and loopback tests. @p payload must hold
   * exactly the opcode's reply payload size.
   */
  static expected<Frame, RobotError> EncodeReply(Opcode op, uint8_t status,
                                                 const uint8_t* payload,
                                                 uint32_t payload_size,
                                                 const CodecOptions& opts) noexcept {
    const OpcodeTraits* t = FindOpcode(op);
    if (t == nullptr || payload_size != t->reply_payload_size ||
        (payload_size > 0U && payload == nullptr)) {
      return expected<Frame, RobotError>::error(RobotError::kInvalidArgument);
    }
    Frame f;
    f.bytes[0] = static_cast<uint8_t>(op);
    f.bytes[1] = status;
    f.size = kReplyHeaderSize;
    if (payload_size > 0U) {
      std::memcpy(f.bytes + f.size, payload, payload_size);
      f.size += payload_size;
    }
    if (opts.checksum) AppendChecksum(f);
    return expected<Frame, RobotError>::success(f);
  }

  /// Sensor payload in firmware layout for @p button / @p distance.
  static void BuildSensorPayload(bool button, uint16_t distance,
                                 uint8_t (&out)[kSensorPayloadSize]) noexcept {
    out[0] = kSensorButtonMarker;
    out[1] = button ? 1U : 0U;
    out[2] = kSensorButtonMarker;
    out[3] = kSensorDistanceMarker;
    out[4] = static_cast<uint8_t>((distance >> 8) & 0xFFU);
    out[5] = static_cast<uint8_t>(distance & 0xFFU);
    out[6] = kSensorDistanceMarker;
  }

 private:
  static void AppendChecksum(Frame& f) noexcept {
    MIIA_ASSERT(f.size + kChecksumSize <= kMaxFrameSize);
    const uint16_t crc = Crc16Ccitt::Calculate(f.bytes, f.size);
    f.bytes[f.size] = static_cast<uint8_t>(crc & 0xFFU);
    f.bytes[f.size + 1U] = static_cast<uint8_t>((crc >> 8) & 0xFFU);
    f.size += kChecksumSize;
  }

  static uint16_t ReadLE16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>(static_cast<uint16_t>(p[0]) |
                                 static_cast<uint16_t>(p[1] << 8));
  }
};

}  // namespace miia

#endif  // MIIA_FRAME_CODEC_HPP_
