#pragma once
/** @file  BrokerClient.hpp
 *  @brief Minimal publish-only MQTT client contract.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <chrono>
#include <string>

namespace echome {
  namespace io {

    /**
 * @class BrokerClient
 * @brief What BrokerPublisher needs from an MQTT client: one bounded connect, QoS 0 publish.
 *
 *  * Called only from the publisher's worker thread.
 *  * `connect()` blocks at most \p timeout; it is never retried internally.
 */
    class BrokerClient {
    public:
      enum class State { Disconnected, Connecting, Connected };

      virtual ~BrokerClient() = default;

      /// Connect and poll every \p pollInterval until acknowledged or \p timeout elapses.
      virtual bool connect(std::chrono::milliseconds timeout,
                           std::chrono::milliseconds pollInterval) = 0;

      /// QoS 0, not retained. Returns false if the client refused the message; a dead link
      /// additionally leaves `state()` at Disconnected.
      virtual bool publish(const std::string& topic, const std::string& payload) = 0;

      virtual void disconnect() = 0;

      virtual State state() const = 0;
    };

    inline const char* toString(BrokerClient::State s) {
      switch (s) {
      case BrokerClient::State::Disconnected:
        return "Disconnected";
      case BrokerClient::State::Connecting:
        return "Connecting";
      case BrokerClient::State::Connected:
        return "Connected";
      }
      return "Unknown";
    }

  } // namespace io
} // namespace echome
