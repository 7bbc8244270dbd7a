/* @file LabConfig.cpp
 * @brief defaults + validation for the bench configuration.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include "core/Errors.hpp"
#include "core/LabConfig.hpp"

using namespace ivlab::core;

namespace {

  template <typename T>
  void readInto(const nlohmann::json& obj, const char* key, T& out) {
    if (obj.contains(key) && !obj.at(key).is_null())
      out = obj.at(key).get<T>();
  }

  void readMillis(const nlohmann::json& obj, const char* key, std::chrono::milliseconds& out) {
    if (!obj.contains(key) || obj.at(key).is_null())
      return;
    const auto ms = obj.at(key).get<long long>();
    if (ms < 0)
      throw ValidationError(std::string("[Config] ") + key + " must be >= 0");
    out = std::chrono::milliseconds{ ms };
  }

  const nlohmann::json& section(const nlohmann::json& root, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!root.contains(key) || root.at(key).is_null())
      return empty;
    if (!root.at(key).is_object())
      throw ValidationError(std::string("[Config] section '") + key + "' must be an object");
    return root.at(key);
  }

} // namespace

LabConfig LabConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object())
    throw ValidationError("[Config] top level must be an object");

  LabConfig cfg;
  try {
    readInto(j, "protocols_dir", cfg.protocolsDir);
    readInto(j, "data_dir", cfg.dataDir);

    const auto& log = section(j, "log");
    readInto(log, "path", cfg.log.path);
    readInto(log, "console", cfg.log.console);
    if (log.contains("level"))
      cfg.log.level = logLevelFromString(log.at("level").get<std::string>());
    readInto(log, "queue_capacity", cfg.log.queueCapacity);
    if (cfg.log.queueCapacity == 0)
      throw ValidationError("[Config] log.queue_capacity must be > 0");

    const auto& smu = section(j, "smu");
    readInto(smu, "address", cfg.smu.address);
    readInto(smu, "baud", cfg.smu.baud);
    readInto(smu, "channels", cfg.smu.channels);
    readMillis(smu, "connect_timeout_ms", cfg.smu.connectTimeout);
    readMillis(smu, "io_timeout_ms", cfg.smu.ioTimeout);
    readInto(smu, "line_frequency_hz", cfg.smu.lineFrequencyHz);
    readInto(smu, "voltage_compliance", cfg.smu.voltageCompliance);
    if (cfg.smu.channels < 1)
      throw ValidationError("[Config] smu.channels must be >= 1");
    if (cfg.smu.lineFrequencyHz <= 0.0)
      throw ValidationError("[Config] smu.line_frequency_hz must be > 0");
    if (!(cfg.smu.voltageCompliance > 0.0))
      throw ValidationError("[Config] smu.voltage_compliance must be > 0");

    const auto& relays = section(j, "relays");
    readInto(relays, "pixel_port", cfg.relays.pixelPort);
    readInto(relays, "led_port", cfg.relays.ledPort);
    readInto(relays, "baud", cfg.relays.baud);
    readMillis(relays, "settle_ms", cfg.relays.settle);
    readMillis(relays, "reset_delay_ms", cfg.relays.resetDelay);
    readMillis(relays, "connect_timeout_ms", cfg.relays.connectTimeout);

    const auto& cal = section(j, "calibration");
    readInto(cal, "path", cfg.calibration.path);
    if (cal.contains("policy"))
      cfg.calibration.policy = calibration::policyFromString(cal.at("policy").get<std::string>());

    if (j.contains("mock") && !j.at("mock").is_null())
      cfg.mock = sim::MockBenchConfig::fromJson(j.at("mock"));
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("[Config] ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw ValidationError(std::string("[Config] mock: ") + e.what());
  }
  return cfg;
}
