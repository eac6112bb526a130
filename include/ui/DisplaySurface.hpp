#pragma once
/** @file  DisplaySurface.hpp
 *  @brief What the page state machine may ask of the display toolkit.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <string>

#include "core/DisplayFormat.hpp" // Rgb
#include "core/PageState.hpp"

namespace echome {
  namespace ui {

    enum class Button { Start, Stop, Finish, Companion };

    inline const char* toString(Button b) {
      switch (b) {
      case Button::Start:
        return "Start";
      case Button::Stop:
        return "Stop";
      case Button::Finish:
        return "Finish";
      case Button::Companion:
        return "Companion";
      }
      return "Unknown";
    }

    /**
 * @class DisplaySurface
 * @brief Opaque page handles plus label/value setters; pixels stay with the toolkit.
 *
 *  * Setters address the widgets of the page that owns them (time/progress on Focus,
 *    duration/background on Navigation); status text goes to the visible page.
 *  * Implementations must not call back into the core from inside a setter.
 */
    class DisplaySurface {
    public:
      virtual ~DisplaySurface() = default;

      /// Build the widgets for \p page; false leaves the page unusable.
      virtual bool initPage(core::Page page) = 0;

      virtual void show(core::Page page) = 0;
      virtual void hide(core::Page page) = 0;

      virtual void setTimeText(const std::string& text) = 0;
      virtual void setProgressRatio(double ratio) = 0; ///< 0..1
      virtual void setStatusText(const std::string& text) = 0;
      virtual void setButtonLabel(Button button, const std::string& text) = 0;
      virtual void setDurationText(const std::string& text) = 0;
      virtual void setSliderValue(int value) = 0; ///< 0..100
      virtual void setBackgroundColor(core::Rgb color) = 0;
    };

  } // namespace ui
} // namespace echome
