/* @file ConfigLoader.cpp
 * @brief JSON -> DeviceConfig with range checks
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// EchoMe headers
#include "core/ConfigLoader.hpp"
#include "io/SerialChannel.hpp"

namespace echome::core {

  namespace {

    using nlohmann::json;

    const json& section(const json& doc, const char* name) {
      static const json empty = json::object();
      auto it = doc.find(name);
      if (it == doc.end())
        return empty;
      if (!it->is_object())
        throw std::runtime_error(std::string("[ConfigLoader] '") + name + "' must be an object");
      return *it;
    }

    template <typename T> T read(const json& obj, const char* key, T fallback) {
      auto it = obj.find(key);
      if (it == obj.end())
        return fallback;
      try {
        return it->template get<T>();
      } catch (const json::exception& e) {
        throw std::runtime_error(std::string("[ConfigLoader] bad value for '") + key +
                                 "': " + e.what());
      }
    }

  } // namespace

  const char* toString(CompletionPolicy policy) {
    switch (policy) {
    case CompletionPolicy::AutoReturn:
      return "auto-return";
    case CompletionPolicy::AwaitAcknowledge:
      return "await-ack";
    }
    return "unknown";
  }

  DeviceConfig parseDeviceConfig(const nlohmann::json& doc) {
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] top-level JSON must be an object");

    DeviceConfig cfg;

    const json& serial = section(doc, "serial");
    cfg.serial.enabled = read(serial, "enabled", cfg.serial.enabled);
    cfg.serial.portPath = read(serial, "portPath", cfg.serial.portPath);
    cfg.serial.baud = read(serial, "baud", cfg.serial.baud);
    if (!io::SerialChannel::toSpeed(cfg.serial.baud))
      throw std::runtime_error("[ConfigLoader] unsupported baud rate " +
                               std::to_string(cfg.serial.baud));

    const json& broker = section(doc, "broker");
    cfg.broker.enabled = read(broker, "enabled", cfg.broker.enabled);
    cfg.broker.host = read(broker, "host", cfg.broker.host);
    cfg.broker.port = read(broker, "port", cfg.broker.port);
    cfg.broker.topic = read(broker, "topic", cfg.broker.topic);
    cfg.broker.clientId = read(broker, "clientId", cfg.broker.clientId);
    cfg.broker.keepAliveSec = read(broker, "keepAliveSec", cfg.broker.keepAliveSec);
    cfg.broker.connectTimeout = std::chrono::milliseconds{ read(
        broker, "connectTimeoutMs", static_cast<long>(cfg.broker.connectTimeout.count())) };
    cfg.broker.pollInterval = std::chrono::milliseconds{ read(
        broker, "pollIntervalMs", static_cast<long>(cfg.broker.pollInterval.count())) };
    if (cfg.broker.port <= 0 || cfg.broker.port > 65535)
      throw std::runtime_error("[ConfigLoader] broker.port out of range");
    if (cfg.broker.host.empty() || cfg.broker.topic.empty())
      throw std::runtime_error("[ConfigLoader] broker.host and broker.topic must be non-empty");
    if (cfg.broker.pollInterval.count() <= 0 ||
        cfg.broker.connectTimeout < cfg.broker.pollInterval)
      throw std::runtime_error("[ConfigLoader] broker poll interval/timeout inconsistent");

    const json& session = section(doc, "session");
    cfg.session.minDurationHours = read(session, "minDurationHours", cfg.session.minDurationHours);
    cfg.session.maxDurationHours = read(session, "maxDurationHours", cfg.session.maxDurationHours);
    cfg.session.defaultDurationHours =
        read(session, "defaultDurationHours", cfg.session.defaultDurationHours);
    cfg.session.tickPeriod = std::chrono::milliseconds{ read(
        session, "tickPeriodMs", static_cast<long>(cfg.session.tickPeriod.count())) };
    if (cfg.session.minDurationHours < 0.0 ||
        cfg.session.maxDurationHours <= cfg.session.minDurationHours)
      throw std::runtime_error("[ConfigLoader] session duration bounds invalid");
    if (cfg.session.tickPeriod.count() <= 0)
      throw std::runtime_error("[ConfigLoader] session.tickPeriodMs must be positive");

    auto policy = read(session, "completionPolicy", std::string(toString(cfg.session.completionPolicy)));
    if (policy == "auto-return")
      cfg.session.completionPolicy = CompletionPolicy::AutoReturn;
    else if (policy == "await-ack")
      cfg.session.completionPolicy = CompletionPolicy::AwaitAcknowledge;
    else
      throw std::runtime_error("[ConfigLoader] unknown completionPolicy '" + policy + "'");

    const json& log = section(doc, "log");
    cfg.log.path = read(log, "path", cfg.log.path);
    auto level = read(log, "level", std::string("info"));
    auto parsed = parseLogLevel(level);
    if (!parsed)
      throw std::runtime_error("[ConfigLoader] unknown log level '" + level + "'");
    cfg.log.level = *parsed;

    return cfg;
  }

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  nlohmann::json ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw std::runtime_error("[ConfigLoader] cannot open " + path_);

    try {
      return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
    }
  }

  DeviceConfig ConfigLoader::loadDeviceConfig() const { return parseDeviceConfig(load()); }

} // namespace echome::core
