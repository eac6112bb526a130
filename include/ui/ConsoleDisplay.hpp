#pragma once
/** @file  ConsoleDisplay.hpp
 *  @brief Text rendition of the three pages for a headless Linux host.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <array>
#include <ostream>
#include <string>

#include "ui/DisplaySurface.hpp"

namespace echome {
  namespace ui {

    /**
 * @class ConsoleDisplay
 * @brief DisplaySurface that prints one line per visible change.
 *
 *  * Setters aimed at a hidden page only update the cached state.
 *  * The per-second time readout rewrites the same terminal line.
 */
    class ConsoleDisplay : public DisplaySurface {
    public:
      explicit ConsoleDisplay(std::ostream& out);
      ~ConsoleDisplay() override = default;

      bool initPage(core::Page page) override;
      void show(core::Page page) override;
      void hide(core::Page page) override;

      void setTimeText(const std::string& text) override;
      void setProgressRatio(double ratio) override;
      void setStatusText(const std::string& text) override;
      void setButtonLabel(Button button, const std::string& text) override;
      void setDurationText(const std::string& text) override;
      void setSliderValue(int value) override;
      void setBackgroundColor(core::Rgb color) override;

      ConsoleDisplay(const ConsoleDisplay&) = delete;
      ConsoleDisplay& operator=(const ConsoleDisplay&) = delete;

    private:
      bool visible(core::Page page) const { return visible_[static_cast<std::size_t>(page)]; }
      void endLiveLine();
      void drawFocusLine();

      std::ostream& out_;
      std::array<bool, core::kPageCount> visible_{};
      bool liveLine_{ false }; ///< cursor sits on the '\r' time line

      std::string timeText_{ "00:00:00" };
      int progressPercent_{ 0 };
      std::string stopLabel_{ "Stop" };
      std::string finishLabel_{ "Finish" };
    };

  } // namespace ui
} // namespace echome
