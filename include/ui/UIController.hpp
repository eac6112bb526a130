#pragma once
/** @file  UIController.hpp
 *  @brief Line-command front panel for the Linux host build (polled by the event loop).
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "ui/InputSink.hpp" // Control

namespace echome {
  namespace core {
    class Logger;
  } // namespace core

  namespace ui {

    /** High-level user-interaction events emitted by the front panel. */
    struct UIEvent {
      enum class Kind { Press, Release, PressLost, ValueChanged, Quit };

      Kind kind{ Kind::Press };
      Control control{ Control::WakeButton };
      int value{ 0 }; ///< ValueChanged only

      bool operator==(const UIEvent&) const = default;
    };

    /**
 * @class UIController
 * @brief Reads newline-terminated commands from a file descriptor (stdin by default)
 *        without blocking and turns them into UIEvents.
 *
 *  Commands:  wake | start | stop | finish | echo (alias move)   press + release
 *             slider <0-100>                                   value change
 *             cancel <button>                                  press + press-lost
 *             quit
 *
 * * Does not own the descriptor; EOF just stops polling.
 */
    class UIController {

    public:
      /// Longest partial line kept between polls; anything longer is dropped up to its newline.
      static constexpr std::size_t kMaxLineBytes = 1024;

      explicit UIController(core::Logger& log, int inputFd = 0);
      ~UIController() = default;

      // ---- public API ----------------------------------------------------------
      /// Register a lambda or free function to receive front-panel events.
      void registerCallback(std::function<void(const UIEvent&)> cb);

      /// Drain whatever is readable right now; never waits.
      void poll(std::chrono::milliseconds now);

      bool isOpen() const { return fd_ >= 0; }
      std::size_t pending() const { return rx_buffer_.size(); }

      /// One command line -> events; empty for blank or unknown input.
      static std::vector<UIEvent> parseCommand(const std::string& line);

      /// Usage text for the console.
      static const char* helpText();

    private:
      void emit(const UIEvent& e) {
        if (cb_)
          cb_(e);
      }
      void handleLine(const std::string& line);

      core::Logger& log_;
      int fd_{ -1 };
      std::string rx_buffer_{}; ///< partial line carried between polls
      bool discarding_{ false }; ///< inside an over-long line, skip to its newline
      std::function<void(const UIEvent&)> cb_{};
    };

  } // namespace ui
} // namespace echome
