/* @file main.cpp
 * @brief echome_device entry point: load config, open transports, run the page loop
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

// EchoMe headers
#include "core/BrokerPublisher.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SignalDispatcher.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/MosquittoClient.hpp"
#include "io/SerialChannel.hpp"
#include "ui/ConsoleDisplay.hpp"
#include "ui/UIController.hpp"

using namespace echome;

namespace {

  std::atomic<bool> g_keepRunning{ true };

  void onSignal(int) { g_keepRunning = false; }

  core::DeviceConfig loadConfig(const std::string& path, core::Logger& log) {
    try {
      auto cfg = core::ConfigLoader(path).loadDeviceConfig();
      log.info("[main] loaded config " + path);
      return cfg;
    } catch (const std::exception& e) {
      log.error(std::string(e.what()) + "; using built-in defaults");
      return core::DeviceConfig{};
    }
  }

  std::unique_ptr<io::SerialChannel> openSerial(const core::SerialSettings& s, core::Logger& log) {
    if (!s.enabled) {
      log.info("[main] serial disabled");
      return nullptr;
    }
    auto serial = std::make_unique<io::SerialChannel>();
    auto speed = io::SerialChannel::toSpeed(s.baud); // validated by parseDeviceConfig
    if (!speed || !serial->open(s.portPath, *speed))
      log.error("[main] cannot open " + s.portPath + ", companion signals will fail");
    else
      log.info("[main] serial " + s.portPath + " @ " + std::to_string(s.baud));
    return serial;
  }

  std::unique_ptr<core::BrokerPublisher> startBroker(const core::BrokerSettings& s,
                                                     std::shared_ptr<core::ErrorMonitor> errMon,
                                                     core::Logger& log) {
    if (!s.enabled) {
      log.info("[main] broker disabled");
      return nullptr;
    }
    auto client = std::make_unique<io::MosquittoClient>(s.host, s.port, s.clientId, s.keepAliveSec);
    auto publisher =
        std::make_unique<core::BrokerPublisher>(std::move(client), s, std::move(errMon), log);
    publisher->start();
    log.info("[main] broker " + s.host + ":" + std::to_string(s.port) + " topic " + s.topic);
    return publisher;
  }

} // namespace

int main(int argc, char* argv[]) {
  const std::string configPath = argc > 1 ? argv[1] : "config/echome.json";

  core::Logger log;
  log.setConsoleLevel(core::LogLevel::Info);
  auto cfg = loadConfig(configPath, log);

  if (!log.startNewRun(cfg.log.path))
    std::cerr << "[main] run log " << cfg.log.path << " unavailable, console only\n";
  log.setConsoleLevel(cfg.log.level);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  auto errorMonitor = std::make_shared<core::ErrorMonitor>(log);

  try {
    core::SignalDispatcher dispatcher(errorMonitor, log, openSerial(cfg.serial, log),
                                      startBroker(cfg.broker, errorMonitor, log));

    ui::ConsoleDisplay display(std::cout);
    core::SystemCoordinator coordinator(cfg, display, dispatcher, log);
    if (!coordinator.initialize()) {
      log.error("[main] page initialization failed");
      dispatcher.shutdown();
      log.finishRun();
      return 1;
    }

    ui::UIController panel(log);
    std::cout << ui::UIController::helpText() << std::endl;
    coordinator.run(panel, g_keepRunning);

    dispatcher.shutdown();
    log.info("[main] " + std::to_string(errorMonitor->failureCount()) +
             " transport failures this run");
  } catch (const std::exception& e) {
    log.error(std::string("[main] fatal: ") + e.what());
    log.finishRun();
    return 1;
  }

  log.finishRun();
  return 0;
}
