#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line writer (termios under the hood).
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace echome {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames output as ASCII lines terminated by `\n`; nothing is read back.
 *  * A write that would block longer than kWriteTimeout fails instead of stalling the loop.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      static constexpr std::chrono::milliseconds kWriteTimeout{ 50 };

      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO / timeout
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      /// 9600 -> B9600 etc.; std::nullopt for rates termios doesn't know.
      static std::optional<speed_t> toSpeed(unsigned int baud);

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      int fd_{ -1 }; ///< POSIX fd (-1==closed)
    };
  } // namespace io
} // namespace echome
