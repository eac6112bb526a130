#pragma once
/** @file  SignalDispatcher.hpp
 *  @brief Best-effort serial + broker fan-out for companion notifications.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// EchoMe headers
#include "core/BrokerPublisher.hpp" // SignalDispatcher optionally owns the broker worker
#include "core/ErrorMonitor.hpp"    // SignalDispatcher is a client to the error monitor
#include "io/SerialChannel.hpp"     // SignalDispatcher owns the SerialChannel and requires full type knowledge
#include "protocols/OutboundSignal.hpp"

namespace echome {
  namespace core {

    class Logger;

    /**
 * @class SignalDispatcher
 * @brief `send()` never throws and never blocks on the network.
 *
 *  * Serial: synchronous `writeLine()` on the pre-opened channel; no ack, no retry.
 *  * Broker: handed to BrokerPublisher's queue.
 *  * A channel that is absent (nullptr) is a logged no-op, so the device runs unplugged.
 */
    class SignalDispatcher {
    public:
      SignalDispatcher(std::shared_ptr<ErrorMonitor> errMonitor, Logger& log,
                       std::unique_ptr<io::SerialChannel> serial,
                       std::unique_ptr<BrokerPublisher> broker);
      ~SignalDispatcher();

      //---public APIs------------------------------------------------------
      void send(const protocols::OutboundSignal& signal) noexcept;

      void sendSerial(const std::string& line) noexcept {
        send(protocols::OutboundSignal::serial(line));
      }
      void publish(const std::string& payload) noexcept {
        send(protocols::OutboundSignal::broker(payload));
      }

      bool hasChannel(protocols::Channel channel) const;

      /// Stops the broker worker after it drains; serial stays open until destruction.
      void shutdown();

      SignalDispatcher(const SignalDispatcher&) = delete;
      SignalDispatcher& operator=(const SignalDispatcher&) = delete;

    private:
      void writeSerial(const protocols::OutboundSignal& signal);

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      Logger& log_;
      std::unique_ptr<io::SerialChannel> serial_;
      std::unique_ptr<BrokerPublisher> broker_;
    };

  } // namespace core
} // namespace echome
