/**
 * @file test_dispatcher.cpp
 * @brief Tests for dispatcher.hpp: validation before I/O, frame contents,
 *        retry policy and sensor refresh semantics.
 */

#include <catch2/catch_test_macros.hpp>
#include "miia/dispatcher.hpp"

#include "spy_link.hpp"

using miia::Direction;
using miia::MotorId;
using miia::Opcode;
using miia::RobotError;

using SpyDispatcher = miia::BasicDispatcher<SpyLink>;

// ============================================================================
// Actuators
// ============================================================================

TEST_CASE("dispatcher - SetRgbLed sends the three-channel frame", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueAck(Opcode::kRgbLed);

  REQUIRE(d.SetRgbLed(12, 0, 90).has_value());
  REQUIRE(link.sent.size() == 1U);
  REQUIRE(link.SentEquals(0, {204, 12, 205, 0, 206, 90}));
  REQUIRE(link.last_expected_len == 2U);
  REQUIRE(link.last_timeout_ms == miia::kDefaultReplyTimeoutMs);
}

TEST_CASE("dispatcher - Invalid arguments never reach the link", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);

  REQUIRE(d.SetRgbLed(256, 0, 0).get_error() == RobotError::kInvalidArgument);
  REQUIRE(d.SetRgbLed(0, 0, -1).get_error() == RobotError::kInvalidArgument);
  REQUIRE(d.SetServoAngle(101).get_error() == RobotError::kInvalidArgument);
  REQUIRE(d.SetServoAngle(-1).get_error() == RobotError::kInvalidArgument);
  REQUIRE(d.SetMotor('c', "forward", 10).get_error() ==
          RobotError::kInvalidArgument);
  REQUIRE(d.SetMotor('a', "sideways", 10).get_error() ==
          RobotError::kInvalidArgument);
  REQUIRE(d.SetMotor('a', nullptr, 10).get_error() ==
          RobotError::kInvalidArgument);
  REQUIRE(d.SetMotor(MotorId::kA, Direction::kForward, 101).get_error() ==
          RobotError::kInvalidArgument);
  REQUIRE(d.SetMotor(MotorId::kB, Direction::kReverse, -1).get_error() ==
          RobotError::kInvalidArgument);
  REQUIRE(d.SetBuzzer("loud").get_error() == RobotError::kInvalidArgument);

  REQUIRE(link.sent.empty());
  REQUIRE(d.GetStatistics().invalid_arguments == 10U);
  REQUIRE(d.GetStatistics().commands == 0U);
}

TEST_CASE("dispatcher - SetServoAngle", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueAck(Opcode::kServo);
  REQUIRE(d.SetServoAngle(85).has_value());
  REQUIRE(link.SentEquals(0, {208, 85}));
}

TEST_CASE("dispatcher - SetMotor direction codes", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueAck(Opcode::kMotorA);
  link.QueueAck(Opcode::kMotorB);
  link.QueueAck(Opcode::kMotorA);

  REQUIRE(d.SetMotor('a', "forward", 50).has_value());
  REQUIRE(d.SetMotor('b', "reverse", 25).has_value());
  REQUIRE(d.SetMotor('a', "stop", 80).has_value());

  REQUIRE(link.SentEquals(0, {202, 0, 50}));
  REQUIRE(link.SentEquals(1, {203, 1, 25}));
  // Stop always carries speed 0.
  REQUIRE(link.SentEquals(2, {202, 2, 0}));
}

TEST_CASE("dispatcher - Motor calibration offsets and clamps", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);

  REQUIRE(d.SetMotorCalibration('a', 10).has_value());
  REQUIRE(d.SetMotorCalibration(MotorId::kB, -20).has_value());
  REQUIRE(d.MotorCalibration(MotorId::kA) == 10);
  REQUIRE(d.MotorCalibration(MotorId::kB) == -20);
  REQUIRE(link.sent.empty());

  link.QueueAck(Opcode::kMotorA);
  link.QueueAck(Opcode::kMotorA);
  link.QueueAck(Opcode::kMotorB);
  link.QueueAck(Opcode::kMotorB);
  REQUIRE(d.SetMotor(MotorId::kA, Direction::kForward, 50).has_value());
  REQUIRE(d.SetMotor(MotorId::kA, Direction::kForward, 95).has_value());
  REQUIRE(d.SetMotor(MotorId::kB, Direction::kForward, 60).has_value());
  REQUIRE(d.SetMotor(MotorId::kB, Direction::kReverse, 10).has_value());

  REQUIRE(link.SentEquals(0, {202, 0, 60}));
  REQUIRE(link.SentEquals(1, {202, 0, 100}));
  REQUIRE(link.SentEquals(2, {203, 0, 40}));
  REQUIRE(link.SentEquals(3, {203, 1, 0}));

  REQUIRE(d.SetMotorCalibration('a', 51).get_error() ==
          RobotError::kInvalidArgument);
  REQUIRE(d.SetMotorCalibration('z', 0).get_error() ==
          RobotError::kInvalidArgument);
  REQUIRE(d.MotorCalibration(MotorId::kA) == 10);
}

TEST_CASE("dispatcher - Calibration from config", "[dispatcher]") {
  SpyLink link;
  miia::DispatcherConfig cfg;
  cfg.motor_b_calibration = 5;
  cfg.reply_timeout_ms = 250U;
  SpyDispatcher d(link, cfg);
  link.QueueAck(Opcode::kMotorB);

  REQUIRE(d.MotorCalibration(MotorId::kB) == 5);
  REQUIRE(d.SetMotor('b', "forward", 20).has_value());
  REQUIRE(link.SentEquals(0, {203, 0, 25}));
  REQUIRE(link.last_timeout_ms == 250U);
}

TEST_CASE("dispatcher - SetBuzzer", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueAck(Opcode::kBuzzer);
  link.QueueAck(Opcode::kBuzzer);
  REQUIRE(d.SetBuzzer("on").has_value());
  REQUIRE(d.SetBuzzer(miia::BuzzerState::kOff).has_value());
  REQUIRE(link.SentEquals(0, {201, 1}));
  REQUIRE(link.SentEquals(1, {201, 0}));
}

// ============================================================================
// Retry policy
// ============================================================================

TEST_CASE("dispatcher - Actuator timeout retries exactly once", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueError(RobotError::kTimeout);
  link.QueueError(RobotError::kTimeout);

  auto r = d.SetServoAngle(40);
  REQUIRE(r.get_error() == RobotError::kTimeout);
  REQUIRE(link.sent.size() == 2U);
  REQUIRE(link.reopen_calls == 1U);
  REQUIRE(d.GetStatistics().retries == 1U);
  REQUIRE(d.GetStatistics().timeouts == 2U);
}

TEST_CASE("dispatcher - Retry succeeds after reopen", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueError(RobotError::kTimeout);
  link.QueueAck(Opcode::kRgbLed);

  REQUIRE(d.SetRgbLed(1, 2, 3).has_value());
  REQUIRE(link.sent.size() == 2U);
  REQUIRE(link.reopen_calls == 1U);
  REQUIRE(link.SentEquals(1, {204, 1, 205, 2, 206, 3}));
}

TEST_CASE("dispatcher - Failed reopen abandons the retry", "[dispatcher]") {
  SpyLink link;
  link.reopen_ok = false;
  SpyDispatcher d(link);
  link.QueueError(RobotError::kTimeout);

  auto r = d.SetBuzzer("on");
  REQUIRE(r.get_error() == RobotError::kConnectionError);
  REQUIRE(link.sent.size() == 1U);
  REQUIRE(link.reopen_calls == 1U);
}

TEST_CASE("dispatcher - Non-timeout errors are not retried", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);

  SECTION("malformed reply") {
    link.QueueRaw({203, 0});  // echo of the wrong motor
    REQUIRE(d.SetMotor('a', "forward", 10).get_error() ==
            RobotError::kMalformedResponse);
    REQUIRE(d.GetStatistics().malformed_replies == 1U);
  }
  SECTION("over-long reply") {
    link.QueueRaw({208, 0, 0});
    REQUIRE(d.SetServoAngle(10).get_error() == RobotError::kMalformedResponse);
  }
  SECTION("degraded link") {
    link.QueueError(RobotError::kLinkDegraded);
    REQUIRE(d.SetServoAngle(10).get_error() == RobotError::kLinkDegraded);
  }
  SECTION("io error") {
    link.QueueError(RobotError::kIoError);
    REQUIRE(d.SetServoAngle(10).get_error() == RobotError::kIoError);
  }

  REQUIRE(link.sent.size() == 1U);
  REQUIRE(link.reopen_calls == 0U);
}

TEST_CASE("dispatcher - Firmware fault surfaces its code", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  REQUIRE(d.LastFirmwareCode() == 0U);

  link.QueueAck(Opcode::kServo, 0x05);
  REQUIRE(d.SetServoAngle(10).get_error() == RobotError::kFirmwareError);
  REQUIRE(d.LastFirmwareCode() == 0x05);
  REQUIRE(link.sent.size() == 1U);
  REQUIRE(d.GetStatistics().firmware_errors == 1U);
}

TEST_CASE("dispatcher - Ping", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueAck(Opcode::kPing);
  REQUIRE(d.Ping().has_value());
  REQUIRE(link.SentEquals(0, {0x00}));
}

// ============================================================================
// Sensors
// ============================================================================

TEST_CASE("dispatcher - RefreshSensors publishes a snapshot", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueSensors(true, 244U);

  auto r = d.RefreshSensors();
  REQUIRE(r.has_value());
  REQUIRE(r.value().input_button_state == true);
  REQUIRE(r.value().distance_sensor == 244U);
  REQUIRE(r.value().sequence == 1U);

  REQUIRE(link.SentEquals(0, {207}));
  REQUIRE(link.last_expected_len == 9U);
  REQUIRE(d.Sensors().InputButtonState().value() == true);
  REQUIRE(d.Sensors().DistanceSensor().value() == 244U);
  REQUIRE(d.GetStatistics().sensor_refreshes == 1U);
}

TEST_CASE("dispatcher - Sensor timeout is not retried", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueError(RobotError::kTimeout);

  REQUIRE(d.RefreshSensors().get_error() == RobotError::kTimeout);
  REQUIRE(link.sent.size() == 1U);
  REQUIRE(link.reopen_calls == 0U);
  REQUIRE(!d.Sensors().HasSnapshot());
}

TEST_CASE("dispatcher - Failed refresh keeps the previous snapshot", "[dispatcher]") {
  SpyLink link;
  SpyDispatcher d(link);
  link.QueueSensors(false, 37U);
  REQUIRE(d.RefreshSensors().has_value());

  SECTION("timeout") { link.QueueError(RobotError::kTimeout); }
  SECTION("bad markers") {
    link.QueueRaw({207, 0, 'c', 1, 'x', 'z', 0, 99, 'z'});
  }
  SECTION("firmware fault") { link.QueueSensors(true, 99U, 0x03); }
  SECTION("short reply") { link.QueueRaw({207, 0, 'c'}); }

  REQUIRE(!d.RefreshSensors().has_value());
  auto latest = d.Sensors().Latest();
  REQUIRE(latest.has_value());
  REQUIRE(latest.value().input_button_state == false);
  REQUIRE(latest.value().distance_sensor == 37U);
  REQUIRE(latest.value().sequence == 1U);
}

TEST_CASE("dispatcher - Checksummed link sizes", "[dispatcher]") {
  SpyLink link;
  link.opts.checksum = true;
  SpyDispatcher d(link);
  link.QueueSensors(false, 1000U);

  REQUIRE(d.RefreshSensors().has_value());
  REQUIRE(link.sent[0].size == 3U);
  REQUIRE(link.last_expected_len == 11U);
  REQUIRE(d.Sensors().DistanceSensor().value() == 1000U);
}
