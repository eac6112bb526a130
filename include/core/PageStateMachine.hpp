#pragma once
/** @file  PageStateMachine.hpp
 *  @brief Wakeup -> Navigation -> Focus page controller.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <array>

#include "core/ConfigLoader.hpp" // CompletionPolicy
#include "core/CountdownEngine.hpp"
#include "core/PageState.hpp"
#include "ui/InputSink.hpp" // Control

namespace echome {
  namespace ui {
    class DisplaySurface;
  }

  namespace core {

    class Logger;
    class SessionParameterStore;
    class SignalDispatcher;

    /**
 * @class PageStateMachine
 * @brief Owns the current page; every input and countdown event funnels through here.
 *
 *  | From       | Trigger                 | To         |
 *  |------------|-------------------------|------------|
 *  | Wakeup     | WakeButton released     | Navigation |
 *  | Navigation | DurationSlider changed  | Navigation |
 *  | Navigation | StartButton released    | Focus      |
 *  | Focus      | StopButton released     | Focus (pause/resume) or Navigation once done |
 *  | Focus      | FinishButton released   | Navigation |
 *  | Focus      | CompanionButton released| Focus      |
 *  | Focus      | countdown completed     | Navigation (AutoReturn) / Focus (AwaitAcknowledge) |
 *
 *  Anything else is logged and ignored. Press-lost is the same as release.
 */
    class PageStateMachine {
    public:
      PageStateMachine(ui::DisplaySurface& display, CountdownEngine& countdown,
                       SessionParameterStore& params, SignalDispatcher& dispatcher, Logger& log,
                       CompletionPolicy policy = CompletionPolicy::AutoReturn);
      ~PageStateMachine() = default;

      /// Build every page, then show Wakeup. False if any page failed to initialise.
      bool initialize();

      /// Hide the current page, show \p target, run exit/enter hooks.
      /// Unknown or uninitialised targets are logged and refused.
      bool switchTo(Page target);

      void handlePress(ui::Control control);
      void handleRelease(ui::Control control);
      void handleValueChanged(ui::Control control, int value);

      Page current() const { return current_; }
      bool isPageReady(Page page) const;
      CompletionPolicy completionPolicy() const { return policy_; }

      PageStateMachine(const PageStateMachine&) = delete;
      PageStateMachine& operator=(const PageStateMachine&) = delete;

    private:
      void onEnter(Page page);
      void onExit(Page page);

      void onWakeReleased();
      void onStartReleased();
      void onStopReleased();
      void onFinishReleased();
      void onCompanionReleased();
      void onDurationChanged(int sliderValue);

      void onCountdownEvent(CountdownEngine::Event e);
      void onSessionCompleted();

      void refreshFocusReadout();
      void refreshNavigation();
      void clearTransientStatus();
      void ignore(ui::Control control, const char* what);

      ui::DisplaySurface& display_;
      CountdownEngine& countdown_;
      SessionParameterStore& params_;
      SignalDispatcher& dispatcher_;
      Logger& log_;
      CompletionPolicy policy_;

      Page current_{ Page::Wakeup };
      std::array<bool, kPageCount> ready_{};
      bool statusPending_{ false }; ///< "Time's Up!" still on screen
    };

  } // namespace core
} // namespace echome
