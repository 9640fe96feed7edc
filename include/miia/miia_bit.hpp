/**
 * @file miia_bit.hpp
 * @brief One robot on one serial port: session + dispatcher in a single object.
 *
 * @code
 *   miia::RobotConfig cfg;
 *   cfg.session.port_name.assign(miia::TruncateToCapacity, "/dev/ttyUSB0");
 *   miia::MiiaBit robot(cfg);
 *   if (!robot.Connect()) return 1;
 *   robot.SetRgbLed(12, 0, 90);
 *   if (robot.RefreshSensors()) {
 *     bool pressed = robot.InputButtonState().value();
 *   }
 * @endcode
 *
 * The port is closed by Disconnect() or on destruction.
 */

#ifndef MIIA_MIIA_BIT_HPP_
#define MIIA_MIIA_BIT_HPP_

#include "miia/dispatcher.hpp"
#include "miia/robot_config.hpp"
#include "miia/serial_session.hpp"

#include <cstdint>

namespace miia {

class MiiaBit final {
 public:
  explicit MiiaBit(const RobotConfig& cfg) noexcept
      : session_(cfg.session), dispatcher_(session_, cfg.dispatcher) {}

  ~MiiaBit() { Disconnect(); }

  MiiaBit(const MiiaBit&) = delete;
  MiiaBit& operator=(const MiiaBit&) = delete;

  expected<void, RobotError> Connect() noexcept { return session_.Open(); }
  void Disconnect() noexcept { session_.Close(); }
  bool IsConnected() const noexcept { return session_.IsOpen(); }

  expected<void, RobotError> SetRgbLed(int32_t red, int32_t green,
                                       int32_t blue) noexcept {
    return dispatcher_.SetRgbLed(red, green, blue);
  }

  expected<void, RobotError> SetServoAngle(int32_t position) noexcept {
    return dispatcher_.SetServoAngle(position);
  }

  expected<void, RobotError> SetMotor(MotorId motor, Direction direction,
                                      int32_t speed) noexcept {
    return dispatcher_.SetMotor(motor, direction, speed);
  }

  expected<void, RobotError> SetMotor(char motor, const char* direction,
                                      int32_t speed) noexcept {
    return dispatcher_.SetMotor(motor, direction, speed);
  }

  expected<void, RobotError> SetBuzzer(BuzzerState state) noexcept {
    return dispatcher_.SetBuzzer(state);
  }

  expected<void, RobotError> SetBuzzer(const char* state) noexcept {
    return dispatcher_.SetBuzzer(state);
  }

  expected<void, RobotError> SetMotorCalibration(char motor,
                                                 int32_t factor) noexcept {
    return dispatcher_.SetMotorCalibration(motor, factor);
  }

  expected<SensorSnapshot, RobotError> RefreshSensors() noexcept {
    return dispatcher_.RefreshSensors();
  }

  /// Empty until the first successful RefreshSensors().
  optional<bool> InputButtonState() const {
    return dispatcher_.Sensors().InputButtonState();
  }

  /// Empty until the first successful RefreshSensors().
  optional<uint16_t> DistanceSensor() const {
    return dispatcher_.Sensors().DistanceSensor();
  }

  SerialSession& Session() noexcept { return session_; }
  Dispatcher& GetDispatcher() noexcept { return dispatcher_; }

 private:
  SerialSession session_;
  Dispatcher dispatcher_;
};

}  // namespace miia

#endif  // MIIA_MIIA_BIT_HPP_
