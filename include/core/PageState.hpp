#pragma once
/** @file  PageState.hpp
 *  @brief The three mutually-exclusive device pages.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>

namespace echome {
  namespace core {

    enum class Page : std::uint8_t { Wakeup, Navigation, Focus, Count };
    static_assert(static_cast<std::uint8_t>(Page::Count) == 3,
                  "Page count changed please update code that depends on it");

    inline constexpr std::size_t kPageCount = static_cast<std::size_t>(Page::Count);

    inline const char* toString(Page p) {
      switch (p) {
      case Page::Wakeup:
        return "Wakeup";
      case Page::Navigation:
        return "Navigation";
      case Page::Focus:
        return "Focus";
      default:
        return "Unknown";
      }
    }

  } // namespace core
} // namespace echome
