#pragma once
/** @file  OutboundSignal.hpp
 *  @brief One fire-and-forget notification to the companion system, with toWire.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <utility>

namespace echome {
  namespace protocols {

    enum class Channel : std::uint8_t { Serial, Broker, Count };
    static_assert(static_cast<std::uint8_t>(Channel::Count) == 2,
                  "Channel count changed please update code that depends on it");

    inline const char* toString(Channel c) {
      switch (c) {
      case Channel::Serial:
        return "Serial";
      case Channel::Broker:
        return "Broker";
      default:
        return "Unknown";
      }
    }

    /// Serial vocabulary understood by the companion host.
    namespace serial_cmd {
      inline constexpr const char* kStart = "start";
      inline constexpr const char* kReset = "reset";
      inline constexpr const char* kMove = "move";
    } // namespace serial_cmd

    /// Broker payloads published on the start topic.
    namespace broker_payload {
      inline constexpr const char* kStarted = "true";
      inline constexpr const char* kStopped = "false";
    } // namespace broker_payload

    struct OutboundSignal {
      Channel channel{ Channel::Serial };
      std::string payload;
      std::string topic; ///< Broker only; empty -> dispatcher's configured topic

      /// Serial lines are newline-terminated ASCII; broker payloads go out verbatim.
      std::string toWire() const {
        if (channel == Channel::Serial && (payload.empty() || payload.back() != '\n'))
          return payload + "\n";
        return payload;
      }

      static OutboundSignal serial(std::string line) {
        return OutboundSignal{ Channel::Serial, std::move(line), {} };
      }

      static OutboundSignal broker(std::string payload, std::string topic = {}) {
        return OutboundSignal{ Channel::Broker, std::move(payload), std::move(topic) };
      }
    };

  } // namespace protocols
} // namespace echome
