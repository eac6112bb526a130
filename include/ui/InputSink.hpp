#pragma once
/** @file  InputSink.hpp
 *  @brief Capability the core implements and the front panel drives.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <chrono>

namespace echome {
  namespace ui {

    /** Touch targets across all pages. */
    enum class Control {
      WakeButton,      ///< Wakeup page circle
      StartButton,     ///< Navigation
      DurationSlider,  ///< Navigation, 0..100
      StopButton,      ///< Focus, pause/continue
      FinishButton,    ///< Focus
      CompanionButton, ///< Focus, "echo" -> companion moves
    };

    inline const char* toString(Control c) {
      switch (c) {
      case Control::WakeButton:
        return "WakeButton";
      case Control::StartButton:
        return "StartButton";
      case Control::DurationSlider:
        return "DurationSlider";
      case Control::StopButton:
        return "StopButton";
      case Control::FinishButton:
        return "FinishButton";
      case Control::CompanionButton:
        return "CompanionButton";
      }
      return "Unknown";
    }

    /**
 * @class InputSink
 * @brief Every input reaches the core through here, serialized on the loop thread.
 */
    class InputSink {
    public:
      virtual ~InputSink() = default;

      virtual void onPress(Control control) = 0;
      virtual void onRelease(Control control) = 0;
      /// Finger slid off the control before lifting.
      virtual void onPressLost(Control control) = 0;
      virtual void onValueChanged(Control control, int value) = 0;
      /// Loop heartbeat; drives the timers.
      virtual void onTick(std::chrono::milliseconds now) = 0;
    };

  } // namespace ui
} // namespace echome
