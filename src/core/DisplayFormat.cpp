/* @file DisplayFormat.cpp
 * @brief truncating clock / duration formatting and the navigation gradient
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdio>

// EchoMe headers
#include "core/DisplayFormat.hpp"

namespace echome::core {

  namespace {
    constexpr double kGuard = 1e-6; ///< keeps 0.7 h * 60 from truncating to 41

    constexpr Rgb kGradientStart{ 216, 226, 236 };
    constexpr Rgb kGradientEnd{ 252, 224, 231 };

    std::uint8_t blend(std::uint8_t from, std::uint8_t to, double ratio) {
      double v = from + (static_cast<int>(to) - static_cast<int>(from)) * ratio;
      return static_cast<std::uint8_t>(std::clamp(v, 0.0, 255.0));
    }
  } // namespace

  std::string formatClock(long totalSeconds) {
    if (totalSeconds < 0)
      totalSeconds = 0;

    long hours = totalSeconds / 3600;
    long minutes = (totalSeconds % 3600) / 60;
    long seconds = totalSeconds % 60;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld", hours, minutes, seconds);
    return buf;
  }

  std::string formatDurationLabel(double hours) {
    int total = wholeMinutes(hours);
    int h = total / 60;
    int m = total % 60;

    if (h > 0 && m > 0)
      return std::to_string(h) + "h " + std::to_string(m) + "min";
    if (h > 0)
      return std::to_string(h) + "h";
    return std::to_string(m) + "min";
  }

  int wholeMinutes(double hours) {
    if (hours <= 0.0)
      return 0;
    return static_cast<int>(hours * 60.0 + kGuard);
  }

  Rgb durationGradient(double ratio) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    return Rgb{ blend(kGradientStart.r, kGradientEnd.r, ratio),
                blend(kGradientStart.g, kGradientEnd.g, ratio),
                blend(kGradientStart.b, kGradientEnd.b, ratio) };
  }

} // namespace echome::core
