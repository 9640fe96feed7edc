/**
 * @file miia_demo.cpp
 * @brief Drive a MiiA.bit board: LED, servo, motors, buzzer, sensor poll.
 *
 * Usage:
 *   miia_demo [config.ini] [port]
 *
 * Without a config file the built-in defaults apply (/dev/ttyUSB0, 57600).
 * A port given on the command line overrides [serial] port.
 */

#include "miia/config.hpp"
#include "miia/log.hpp"
#include "miia/miia_bit.hpp"
#include "miia/robot_config.hpp"

#include <cstdio>
#include <cstring>
#include <unistd.h>

namespace {

bool EndsWith(const char* s, const char* suffix) {
  const size_t n = std::strlen(s);
  const size_t m = std::strlen(suffix);
  return n >= m && std::strcmp(s + n - m, suffix) == 0;
}

void Report(const char* what, const miia::expected<void, miia::RobotError>& r) {
  if (r) {
    MIIA_LOG_INFO("demo", "%s: ok", what);
  } else {
    MIIA_LOG_WARN("demo", "%s: %s", what, miia::RobotErrorToString(r.get_error()));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  miia::log::Init();

  const char* config_path = nullptr;
  const char* port = nullptr;
  for (int i = 1; i < argc; ++i) {
    if (EndsWith(argv[i], ".ini") || EndsWith(argv[i], ".conf")) {
      config_path = argv[i];
    } else {
      port = argv[i];
    }
  }

#ifdef MIIA_CONFIG_INI_ENABLED
  miia::IniConfig store;
  if (config_path != nullptr) {
    auto loaded = store.LoadFile(config_path);
    if (!loaded) {
      MIIA_LOG_ERROR("demo", "cannot load %s (error %u)", config_path,
                     static_cast<unsigned>(loaded.get_error()));
      return 1;
    }
  }
#else
  miia::ConfigStore store;
  if (config_path != nullptr) {
    MIIA_LOG_ERROR("demo", "%s: built without the INI config backend",
                   config_path);
    return 1;
  }
#endif
  if (port != nullptr) (void)store.SetValue("serial", "port", port);

  auto cfg = miia::LoadRobotConfig(store);
  if (!cfg) {
    MIIA_LOG_ERROR("demo", "invalid configuration");
    return 1;
  }
  if (cfg.value().log_level.has_value()) {
    miia::log::SetLevel(cfg.value().log_level.value());
  }

  miia::MiiaBit robot(cfg.value());
  auto connected = robot.Connect();
  if (!connected) {
    MIIA_LOG_ERROR("demo", "connect to %s failed: %s",
                   cfg.value().session.port_name.c_str(),
                   miia::RobotErrorToString(connected.get_error()));
    return 1;
  }

  Report("rgb 12/0/90", robot.SetRgbLed(12, 0, 90));
  Report("servo 85", robot.SetServoAngle(85));
  Report("motor a forward 40", robot.SetMotor('a', "forward", 40));
  Report("motor b forward 40", robot.SetMotor('b', "forward", 40));
  ::usleep(500000);
  Report("motor a stop", robot.SetMotor('a', "stop", 0));
  Report("motor b stop", robot.SetMotor('b', "stop", 0));
  Report("buzzer on", robot.SetBuzzer("on"));
  ::usleep(200000);
  Report("buzzer off", robot.SetBuzzer("off"));

  for (int i = 0; i < 5; ++i) {
    auto snap = robot.RefreshSensors();
    if (snap) {
      std::printf("button=%s distance=%u\n",
                  snap.value().input_button_state ? "pressed" : "released",
                  static_cast<unsigned>(snap.value().distance_sensor));
    } else {
      MIIA_LOG_WARN("demo", "sensor refresh: %s",
                    miia::RobotErrorToString(snap.get_error()));
      break;
    }
    ::usleep(200000);
  }

  Report("rgb off", robot.SetRgbLed(0, 0, 0));
  robot.Disconnect();
  miia::log::Shutdown();
  return 0;
}
