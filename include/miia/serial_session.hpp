/**
 * @file serial_session.hpp
 * @brief Blocking write-then-read serial session to the MiiA.bit firmware.
 *
 * State machine:
 *
 *   Closed --Open()--> Opening --handshake ok--> Open
 *   Open --Exchange()--> Exchanging --reply--> Open
 *   Exchanging --timeout / io error--> Degraded
 *   any --Close()--> Closing --> Closed
 *
 * Degraded is sticky: Exchange() and Open() refuse to run until Close() (or
 * Reopen(), which is Close() + Open()). The session never retries on its own;
 * retry policy belongs to the dispatcher.
 *
 * Every read is bounded by poll(2); there is no blocking read without a
 * deadline. Not thread-safe: concurrent callers must hold one lock across
 * each Exchange().
 *
 * Pure POSIX (termios + open/read/write/poll), header-only, C++17,
 * compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MIIA_SERIAL_SESSION_HPP_
#define MIIA_SERIAL_SESSION_HPP_

#include "miia/frame_codec.hpp"
#include "miia/log.hpp"
#include "miia/platform.hpp"
#include "miia/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#if defined(MIIA_PLATFORM_POSIX)
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>
#endif

namespace miia {

// ============================================================================
// Session State
// ============================================================================

enum class SessionState : uint8_t {
  kClosed = 0U,
  kOpening,
  kOpen,
  kExchanging,
  kClosing,
  kDegraded,
};

inline const char* SessionStateToString(SessionState s) noexcept {
  switch (s) {
    case SessionState::kClosed:
      return "Closed";
    case SessionState::kOpening:
      return "Opening";
    case SessionState::kOpen:
      return "Open";
    case SessionState::kExchanging:
      return "Exchanging";
    case SessionState::kClosing:
      return "Closing";
    case SessionState::kDegraded:
      return "Degraded";
    default:
      return "Unknown";
  }
}

// ============================================================================
// Session Config
// ============================================================================

/// MiiA.bit firmware defaults: 57600 baud 8N1, 100 ms reply window.
static constexpr uint32_t kDefaultBaudRate = 57600U;
static constexpr uint32_t kDefaultReplyTimeoutMs = 100U;

/// Longest read deadline Exchange() accepts; fits poll()'s int timeout.
static constexpr uint32_t kMaxExchangeTimeoutMs = 0x7FFFFFFFU;
/// Each poll() waits at most this long before the deadline is rechecked.
static constexpr uint64_t kMaxPollSliceMs = 1000U;

struct SessionConfig {
  FixedString<63> port_name{"/dev/ttyUSB0"};
  uint32_t baud_rate = kDefaultBaudRate;

  /// Total time Open() keeps pinging. The board resets when the port opens
  /// and ignores input until its bootloader hands over.
  uint32_t handshake_timeout_ms = 2000U;
  /// Wait per ping before sending the next one.
  uint32_t handshake_interval_ms = kDefaultReplyTimeoutMs;

  uint32_t write_retry_count = 3U;      ///< EAGAIN retries per write
  uint32_t write_retry_delay_us = 1000U;

  CodecOptions codec;
};

// ============================================================================
// Session Statistics
// ============================================================================

struct SessionStatistics {
  uint64_t frames_sent = 0U;
  uint64_t frames_received = 0U;
  uint64_t bytes_sent = 0U;
  uint64_t bytes_received = 0U;
  uint64_t stale_bytes_discarded = 0U;  ///< Input dropped before a request
  uint64_t timeouts = 0U;
  uint64_t io_errors = 0U;
  uint64_t handshake_failures = 0U;
  uint64_t write_retries = 0U;
};

// ============================================================================
// SerialSession
// ============================================================================

class SerialSession {
 public:
  explicit SerialSession(const SessionConfig& cfg) noexcept
      : cfg_(cfg), fd_(-1), state_(SessionState::kClosed), stats_{} {}

  ~SerialSession() { Close(); }

  SerialSession(const SerialSession&) = delete;
  SerialSession& operator=(const SerialSession&) = delete;

  // ------------------------------------------------------------------
  // Open / Close / Reopen
  // ------------------------------------------------------------------

  /**
   * @brief Open the port and handshake with the firmware.
   *
   * No-op when already Open.
   * @return kConnectionError if the port cannot be opened/configured or no
   *         ping ack arrives within handshake_timeout_ms (session stays
   *         Closed); kLinkDegraded if the session must be closed first.
   */
  expected<void, RobotError> Open() noexcept {
    if (state_ == SessionState::kOpen) {
      return expected<void, RobotError>::success();
    }
    if (state_ == SessionState::kDegraded) {
      MIIA_LOG_WARN("session", "%s: open refused while degraded",
                    cfg_.port_name.c_str());
      return expected<void, RobotError>::error(RobotError::kLinkDegraded);
    }

#if defined(MIIA_PLATFORM_POSIX)
    state_ = SessionState::kOpening;

    fd_ = ::open(cfg_.port_name.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
      MIIA_LOG_ERROR("session", "%s: open failed: %s", cfg_.port_name.c_str(),
                     std::strerror(errno));
      state_ = SessionState::kClosed;
      return expected<void, RobotError>::error(RobotError::kConnectionError);
    }

    if (!ConfigurePort()) {
      MIIA_LOG_ERROR("session", "%s: termios configuration failed: %s",
                     cfg_.port_name.c_str(), std::strerror(errno));
      CloseFd();
      state_ = SessionState::kClosed;
      return expected<void, RobotError>::error(RobotError::kConnectionError);
    }

    if (!Handshake()) {
      ++stats_.handshake_failures;
      MIIA_LOG_ERROR("session", "%s: no ping ack within %u ms",
                     cfg_.port_name.c_str(), cfg_.handshake_timeout_ms);
      CloseFd();
      state_ = SessionState::kClosed;
      return expected<void, RobotError>::error(RobotError::kConnectionError);
    }

    state_ = SessionState::kOpen;
    MIIA_LOG_INFO("session", "%s: open at %u baud%s", cfg_.port_name.c_str(),
                  cfg_.baud_rate, cfg_.codec.checksum ? " (crc)" : "");
    return expected<void, RobotError>::success();
#else
    return expected<void, RobotError>::error(RobotError::kConnectionError);
#endif
  }

  /// @brief Release the port. Idempotent; clears Degraded.
  void Close() noexcept {
    if (fd_ >= 0) {
      state_ = SessionState::kClosing;
      CloseFd();
      MIIA_LOG_INFO("session", "%s: closed", cfg_.port_name.c_str());
    }
    state_ = SessionState::kClosed;
  }

  /// @brief Close() then Open(); the only way out of Degraded.
  expected<void, RobotError> Reopen() noexcept {
    Close();
    return Open();
  }

  // ------------------------------------------------------------------
  // Exchange
  // ------------------------------------------------------------------

  /**
   * @brief Send @p request and block for its reply.
   *
   * Stale input is discarded before the write. Reading stops once
   * @p expected_reply_len bytes have arrived; bytes already queued behind
   * them are appended too so an over-long reply is visible to the decoder.
   *
   * @param timeout_ms Read deadline, 1..kMaxExchangeTimeoutMs.
   * @return The raw reply; kTimeout or kIoError (session becomes Degraded),
   *         kNotConnected / kLinkDegraded if not Open, kInvalidArgument on
   *         a zero or over-limit timeout or an oversize frame.
   */
  expected<Frame, RobotError> Exchange(const Frame& request,
                                       uint32_t expected_reply_len,
                                       uint32_t timeout_ms) noexcept {
    if (state_ == SessionState::kDegraded) {
      return expected<Frame, RobotError>::error(RobotError::kLinkDegraded);
    }
    if (state_ != SessionState::kOpen) {
      return expected<Frame, RobotError>::error(RobotError::kNotConnected);
    }
    if (timeout_ms == 0U || timeout_ms > kMaxExchangeTimeoutMs ||
        request.size == 0U ||
        request.size > kMaxFrameSize || expected_reply_len == 0U ||
        expected_reply_len > kMaxFrameSize) {
      return expected<Frame, RobotError>::error(RobotError::kInvalidArgument);
    }

    state_ = SessionState::kExchanging;
    auto reply = Transact(request, expected_reply_len, timeout_ms);
    if (!reply) {
      const RobotError err = reply.get_error();
      if (err == RobotError::kTimeout) {
        ++stats_.timeouts;
      } else {
        ++stats_.io_errors;
      }
      state_ = SessionState::kDegraded;
      MIIA_LOG_WARN("session", "%s: exchange of 0x%02X failed (%s), degraded",
                    cfg_.port_name.c_str(),
                    static_cast<unsigned>(request.bytes[0]),
                    RobotErrorToString(err));
      return reply;
    }

    state_ = SessionState::kOpen;
    return reply;
  }

  // ------------------------------------------------------------------
  // Accessors
  // ------------------------------------------------------------------

  SessionState State() const noexcept { return state_; }
  bool IsOpen() const noexcept { return state_ == SessionState::kOpen; }
  int GetFd() const noexcept { return fd_; }
  const SessionConfig& GetConfig() const noexcept { return cfg_; }
  const CodecOptions& GetCodecOptions() const noexcept { return cfg_.codec; }
  SessionStatistics GetStatistics() const noexcept { return stats_; }
  void ResetStatistics() noexcept { stats_ = SessionStatistics{}; }

  /// @brief Map a baud rate to its termios constant.
  /// @return false if the rate is not supported on this platform.
  static bool IsSupportedBaud(uint32_t baud) noexcept {
#if defined(MIIA_PLATFORM_POSIX)
    speed_t unused;
    return BaudToSpeed(baud, unused);
#else
    (void)baud;
    return false;
#endif
  }

 private:
#if defined(MIIA_PLATFORM_POSIX)
  // ------------------------------------------------------------------
  // Handshake
  // ------------------------------------------------------------------

  /// Ping every handshake_interval_ms until an ack arrives or the
  /// handshake window closes. Garbage from a resetting board is discarded.
  bool Handshake() noexcept {
    auto ping = FrameCodec::Encode(Command(Opcode::kPing), cfg_.codec);
    if (!ping) return false;

    const uint32_t reply_len = FrameCodec::ReplySize(Opcode::kPing, cfg_.codec);
    const uint64_t deadline = NowMs() + cfg_.handshake_timeout_ms;
    uint32_t attempt = 0U;

    for (;;) {
      const uint64_t now = NowMs();
      if (now >= deadline) return false;
      uint64_t window = deadline - now;
      if (window > cfg_.handshake_interval_ms) window = cfg_.handshake_interval_ms;
      if (window == 0U) window = 1U;

      ++attempt;
      auto reply = Transact(ping.value(), reply_len,
                            static_cast<uint32_t>(window));
      if (reply) {
        auto resp = FrameCodec::Decode(reply.value().bytes, reply.value().size,
                                       Opcode::kPing, cfg_.codec);
        if (resp && resp.value().ok()) {
          MIIA_LOG_DEBUG("session", "%s: ping ack after %u attempt(s)",
                         cfg_.port_name.c_str(), attempt);
          return true;
        }
        MIIA_LOG_DEBUG("session", "%s: rejected handshake reply",
                       cfg_.port_name.c_str());
      } else if (reply.get_error() == RobotError::kIoError) {
        return false;
      }
    }
  }

  // ------------------------------------------------------------------
  // Write-then-read
  // ------------------------------------------------------------------

  expected<Frame, RobotError> Transact(const Frame& request,
                                       uint32_t expected_reply_len,
                                       uint32_t timeout_ms) noexcept {
    DiscardInput();

    if (!WriteAll(request.bytes, request.size)) {
      return expected<Frame, RobotError>::error(RobotError::kIoError);
    }
    ++stats_.frames_sent;

    Frame reply;
    const uint64_t deadline = NowMs() + timeout_ms;
    while (reply.size < expected_reply_len) {
      const uint64_t now = NowMs();
      if (now >= deadline) {
        if (reply.size > 0U) {
          MIIA_LOG_DEBUG("session", "%s: partial reply %u/%u bytes",
                         cfg_.port_name.c_str(), reply.size,
                         expected_reply_len);
        }
        return expected<Frame, RobotError>::error(RobotError::kTimeout);
      }

      uint64_t wait = deadline - now;
      if (wait > kMaxPollSliceMs) wait = kMaxPollSliceMs;
      const int ready = WaitReadable(static_cast<int>(wait));
      if (ready < 0) {
        return expected<Frame, RobotError>::error(RobotError::kIoError);
      }
      if (ready == 0) continue;

      const ssize_t n = ::read(fd_, reply.bytes + reply.size,
                               expected_reply_len - reply.size);
      if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        MIIA_LOG_ERROR("session", "%s: read failed: %s",
                       cfg_.port_name.c_str(), std::strerror(errno));
        return expected<Frame, RobotError>::error(RobotError::kIoError);
      }
      reply.size += static_cast<uint32_t>(n);
      stats_.bytes_received += static_cast<uint64_t>(n);
    }

    // Pick up anything queued behind the expected bytes.
    while (reply.size < kMaxFrameSize) {
      const ssize_t n =
          ::read(fd_, reply.bytes + reply.size, kMaxFrameSize - reply.size);
      if (n <= 0) break;
      reply.size += static_cast<uint32_t>(n);
      stats_.bytes_received += static_cast<uint64_t>(n);
    }

    ++stats_.frames_received;
    return expected<Frame, RobotError>::success(reply);
  }

  /// @return 1 readable, 0 timed out, -1 error or hang-up.
  int WaitReadable(int timeout_ms) noexcept {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
      if (errno == EINTR) return 0;
      MIIA_LOG_ERROR("session", "%s: poll failed: %s", cfg_.port_name.c_str(),
                     std::strerror(errno));
      return -1;
    }
    if (rc == 0) return 0;
    if ((pfd.revents & POLLIN) != 0) return 1;
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      MIIA_LOG_ERROR("session", "%s: link hang-up (revents 0x%x)",
                     cfg_.port_name.c_str(), static_cast<unsigned>(pfd.revents));
      return -1;
    }
    return 0;
  }

  void DiscardInput() noexcept {
    uint8_t scratch[64];
    for (;;) {
      const ssize_t n = ::read(fd_, scratch, sizeof(scratch));
      if (n <= 0) break;
      stats_.stale_bytes_discarded += static_cast<uint64_t>(n);
    }
  }

  bool WriteAll(const uint8_t* data, uint32_t len) noexcept {
    MIIA_ASSERT(data != nullptr);
    uint32_t written = 0U;
    uint32_t retry_count = 0U;

    while (written < len) {
      const ssize_t n = ::write(fd_, data + written, len - written);
      if (n < 0) {
        const int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
          if (retry_count >= cfg_.write_retry_count) {
            MIIA_LOG_ERROR("session", "%s: write stalled",
                           cfg_.port_name.c_str());
            return false;
          }
          ++retry_count;
          ++stats_.write_retries;
          ::usleep(cfg_.write_retry_delay_us);
          continue;
        }
        MIIA_LOG_ERROR("session", "%s: write failed: %s",
                       cfg_.port_name.c_str(), std::strerror(err));
        return false;
      }
      written += static_cast<uint32_t>(n);
      retry_count = 0U;
    }

    stats_.bytes_sent += len;
    return true;
  }

  // ------------------------------------------------------------------
  // Port configuration (POSIX termios)
  // ------------------------------------------------------------------

  /// Raw 8N1, no flow control, non-blocking reads (VMIN=0, VTIME=0).
  bool ConfigurePort() noexcept {
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));
    if (::tcgetattr(fd_, &tio) != 0) return false;

    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                           INLCR | IGNCR | ICRNL | IXON |
                                           IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &=
        static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD | CS8);
#ifdef CRTSCTS
    tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    speed_t speed;
    if (!BaudToSpeed(cfg_.baud_rate, speed)) {
      MIIA_LOG_ERROR("session", "unsupported baud rate %u", cfg_.baud_rate);
      return false;
    }
    if (::cfsetispeed(&tio, speed) != 0 || ::cfsetospeed(&tio, speed) != 0) {
      return false;
    }
    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) return false;

    (void)::tcflush(fd_, TCIOFLUSH);
    return true;
  }

  static bool BaudToSpeed(uint32_t baud, speed_t& out) noexcept {
    switch (baud) {
      case 9600U:
        out = B9600;
        return true;
      case 19200U:
        out = B19200;
        return true;
      case 38400U:
        out = B38400;
        return true;
      case 57600U:
        out = B57600;
        return true;
      case 115200U:
        out = B115200;
        return true;
      case 230400U:
        out = B230400;
        return true;
      default:
        return false;
    }
  }

  void CloseFd() noexcept {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

  static uint64_t NowMs() noexcept {
    struct timespec ts;
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000U +
           static_cast<uint64_t>(ts.tv_nsec) / 1000000U;
  }
#else
  expected<Frame, RobotError> Transact(const Frame&, uint32_t,
                                       uint32_t) noexcept {
    return expected<Frame, RobotError>::error(RobotError::kIoError);
  }
  void CloseFd() noexcept { fd_ = -1; }
#endif

  SessionConfig cfg_;
  int fd_;
  SessionState state_;
  SessionStatistics stats_;
};

}  // namespace miia

#endif  // MIIA_SERIAL_SESSION_HPP_
