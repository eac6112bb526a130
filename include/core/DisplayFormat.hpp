#pragma once
/** @file  DisplayFormat.hpp
 *  @brief Text and colour derivations the pages show (clock, duration label, gradient).
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace echome::core {

  struct Rgb {
    std::uint8_t r{ 0 };
    std::uint8_t g{ 0 };
    std::uint8_t b{ 0 };

    bool operator==(const Rgb&) const = default;
  };

  /// "HH:MM:SS" from whole seconds (negative treated as 0).
  std::string formatClock(long totalSeconds);

  /// Slider caption: "1h 30min", "2h", "45min", "0min". Minutes are truncated.
  std::string formatDurationLabel(double hours);

  /// Hours -> whole minutes, truncated; the number the companion receives on Focus entry.
  int wholeMinutes(double hours);

  /// Navigation background: #D8E2EC at ratio 0 blending to #FCE0E7 at ratio 1.
  Rgb durationGradient(double ratio);

} // namespace echome::core
