#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"

namespace echome::core {

  /// How the Focus page reacts when the countdown reaches zero on its own.
  enum class CompletionPolicy {
    AutoReturn,      ///< show "Time's Up!" and go straight back to Navigation
    AwaitAcknowledge ///< stay on Focus until Stop or Finish is released
  };

  struct SerialSettings {
    bool enabled{ true };
    std::string portPath{ "/dev/ttyUSB0" };
    unsigned int baud{ 115200 };
  };

  struct BrokerSettings {
    bool enabled{ false };
    std::string host{ "127.0.0.1" };
    int port{ 1883 };
    std::string topic{ "topic/start" };
    std::string clientId{ "echome_smart_device_001" };
    int keepAliveSec{ 60 };
    std::chrono::milliseconds connectTimeout{ 5000 };
    std::chrono::milliseconds pollInterval{ 100 };
  };

  struct SessionSettings {
    double minDurationHours{ 0.0 };
    double maxDurationHours{ 2.0 };
    double defaultDurationHours{ 1.0 };
    std::chrono::milliseconds tickPeriod{ 1000 };
    CompletionPolicy completionPolicy{ CompletionPolicy::AutoReturn };
  };

  struct LogSettings {
    std::string path{ "echome_session.csv" };
    LogLevel level{ LogLevel::Info };
  };

  /// Everything the device reads at boot; defaults match the shipped hardware.
  struct DeviceConfig {
    SerialSettings serial;
    BrokerSettings broker;
    SessionSettings session;
    LogSettings log;
  };

  /**
 * @brief Validates \p doc and maps it onto DeviceConfig; missing keys keep their defaults.
 * @throws std::runtime_error on wrong types or out-of-range values.
 */
  DeviceConfig parseDeviceConfig(const nlohmann::json& doc);

  const char* toString(CompletionPolicy policy);

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Schema validation lives in `parseDeviceConfig()`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `parseDeviceConfig(load())`.
    DeviceConfig loadDeviceConfig() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace echome::core
