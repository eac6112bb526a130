/* @file SystemCoordinator.cpp
 * @brief boot wiring and the cooperative event loop
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <thread>

// EchoMe headers
#include "core/Logger.hpp"
#include "core/SystemCoordinator.hpp"
#include "ui/UIController.hpp"

using namespace echome::core;
using echome::ui::Control;
using echome::ui::UIEvent;

SystemCoordinator::SystemCoordinator(const DeviceConfig& config, ui::DisplaySurface& display,
                                     SignalDispatcher& dispatcher, Logger& log)
    : log_(log),
      params_(config.session.minDurationHours, config.session.maxDurationHours,
              config.session.defaultDurationHours),
      countdown_(timers_, config.session.tickPeriod),
      pages_(display, countdown_, params_, dispatcher, log, config.session.completionPolicy) {}

bool SystemCoordinator::initialize() {
  log_.info(std::string("[SystemCoordinator] initializing, completion policy ") +
            toString(pages_.completionPolicy()));
  return pages_.initialize();
}

void SystemCoordinator::onPress(Control control) { pages_.handlePress(control); }

void SystemCoordinator::onRelease(Control control) { pages_.handleRelease(control); }

void SystemCoordinator::onPressLost(Control control) {
  // the panel has no separate cancel gesture; treat it as a release
  pages_.handleRelease(control);
}

void SystemCoordinator::onValueChanged(Control control, int value) {
  pages_.handleValueChanged(control, value);
}

void SystemCoordinator::onTick(std::chrono::milliseconds now) { timers_.poll(now); }

bool SystemCoordinator::handleEvent(const UIEvent& event) {
  switch (event.kind) {
  case UIEvent::Kind::Press:
    onPress(event.control);
    break;
  case UIEvent::Kind::Release:
    onRelease(event.control);
    break;
  case UIEvent::Kind::PressLost:
    onPressLost(event.control);
    break;
  case UIEvent::Kind::ValueChanged:
    onValueChanged(event.control, event.value);
    break;
  case UIEvent::Kind::Quit:
    return false;
  }
  return true;
}

void SystemCoordinator::run(ui::UIController& panel, std::atomic<bool>& keepRunning) {
  using clock = std::chrono::steady_clock;

  panel.registerCallback([this, &keepRunning](const UIEvent& e) {
    if (!handleEvent(e)) {
      log_.info("[SystemCoordinator] quit requested");
      keepRunning = false;
    }
  });

  const auto t0 = clock::now();
  log_.info("[SystemCoordinator] event loop running");

  while (keepRunning) {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0);
    panel.poll(now);
    onTick(now);
    std::this_thread::sleep_for(kLoopPeriod);
  }

  panel.registerCallback({});
  log_.info("[SystemCoordinator] event loop stopped");
}
