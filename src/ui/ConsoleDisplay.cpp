/* @file ConsoleDisplay.cpp
 * @brief prints page changes and readouts; stands in for the LCD on a Linux host
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdio>

// EchoMe headers
#include "ui/ConsoleDisplay.hpp"

using namespace echome::ui;
using echome::core::Page;

ConsoleDisplay::ConsoleDisplay(std::ostream& out) : out_(out) {}

bool ConsoleDisplay::initPage(Page page) {
  visible_[static_cast<std::size_t>(page)] = false; // pages start hidden
  return true;
}

void ConsoleDisplay::show(Page page) {
  visible_[static_cast<std::size_t>(page)] = true;
  endLiveLine();
  out_ << "== " << core::toString(page) << " ==\n";
  if (page == Page::Focus)
    out_ << "   [" << stopLabel_ << "]  [echo]  [" << finishLabel_ << "]\n";
  out_.flush();
}

void ConsoleDisplay::hide(Page page) { visible_[static_cast<std::size_t>(page)] = false; }

void ConsoleDisplay::setTimeText(const std::string& text) {
  timeText_ = text;
  if (visible(Page::Focus))
    drawFocusLine();
}

void ConsoleDisplay::setProgressRatio(double ratio) {
  progressPercent_ = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * 100.0);
}

void ConsoleDisplay::setStatusText(const std::string& text) {
  if (text.empty())
    return;
  endLiveLine();
  out_ << "   status: " << text << "\n";
  out_.flush();
}

void ConsoleDisplay::setButtonLabel(Button button, const std::string& text) {
  if (button == Button::Stop)
    stopLabel_ = text;
  else if (button == Button::Finish)
    finishLabel_ = text;

  if (visible(Page::Focus)) {
    endLiveLine();
    out_ << "   [" << toString(button) << "] -> " << text << "\n";
    out_.flush();
  }
}

void ConsoleDisplay::setDurationText(const std::string& text) {
  if (!visible(Page::Navigation))
    return;
  endLiveLine();
  out_ << "   duration: " << text << "\n";
  out_.flush();
}

void ConsoleDisplay::setSliderValue(int value) {
  if (!visible(Page::Navigation))
    return;
  endLiveLine();
  out_ << "   slider: " << value << "/100\n";
  out_.flush();
}

void ConsoleDisplay::setBackgroundColor(echome::core::Rgb color) {
  if (!visible(Page::Navigation))
    return;
  char hex[8];
  std::snprintf(hex, sizeof(hex), "#%02X%02X%02X", color.r, color.g, color.b);
  endLiveLine();
  out_ << "   background: " << hex << "\n";
  out_.flush();
}

void ConsoleDisplay::endLiveLine() {
  if (!liveLine_)
    return;
  out_ << "\n";
  liveLine_ = false;
}

void ConsoleDisplay::drawFocusLine() {
  out_ << "\r   " << timeText_ << "  (" << progressPercent_ << "%)   ";
  out_.flush();
  liveLine_ = true;
}
