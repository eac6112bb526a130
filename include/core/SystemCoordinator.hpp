#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for echome::core::SystemCoordinator.
 *
 *  © 2025 EchoMe Labs — licensed under MIT.
 */

#include <atomic>
#include <chrono>

#include "core/ConfigLoader.hpp"
#include "core/CountdownEngine.hpp"
#include "core/PageStateMachine.hpp"
#include "core/ParameterStore.hpp"
#include "core/TimerQueue.hpp"
#include "ui/InputSink.hpp"

namespace echome {
  namespace ui {
    class DisplaySurface;
    class UIController;
    struct UIEvent;
  } // namespace ui

  namespace core {

    class Logger;
    class SignalDispatcher;

    /**
 * @class SystemCoordinator
 * @brief Wires timers, countdown, parameters and pages together and runs the loop.
 *
 *  * Single-threaded: input, ticks and page changes all happen inside `run()` (or
 *    inside direct InputSink calls from tests).
 *  * Display and dispatcher are borrowed; they must outlive the coordinator.
 */
    class SystemCoordinator : public ui::InputSink {

    public:
      SystemCoordinator(const DeviceConfig& config, ui::DisplaySurface& display,
                        SignalDispatcher& dispatcher, Logger& log);
      ~SystemCoordinator() override = default;

      /// Build the pages and show Wakeup.
      bool initialize();

      // ---- InputSink -----------------------------------------------------------
      void onPress(ui::Control control) override;
      void onRelease(ui::Control control) override;
      void onPressLost(ui::Control control) override;
      void onValueChanged(ui::Control control, int value) override;
      void onTick(std::chrono::milliseconds now) override;

      /// Route one front-panel event; returns false for Quit.
      bool handleEvent(const ui::UIEvent& event);

      /// Poll \p panel and the timers every loop period until \p keepRunning drops.
      void run(ui::UIController& panel, std::atomic<bool>& keepRunning);

      Page currentPage() const { return pages_.current(); }
      const CountdownEngine& countdown() const { return countdown_; }
      const SessionParameterStore& parameters() const { return params_; }
      const TimerQueue& timers() const { return timers_; }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      static constexpr std::chrono::milliseconds kLoopPeriod{ 10 };

      Logger& log_;
      TimerQueue timers_;
      SessionParameterStore params_;
      CountdownEngine countdown_;
      PageStateMachine pages_; ///< declared last: registers itself on countdown_
    };

  } // namespace core
} // namespace echome
