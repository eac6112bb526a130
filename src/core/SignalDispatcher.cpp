/* @file SignalDispatcher.cpp
 * @brief fire-and-forget companion notifications over serial and MQTT
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

// EchoMe headers
#include "core/Logger.hpp"
#include "core/SignalDispatcher.hpp"

using namespace echome::core;
using echome::protocols::Channel;
using echome::protocols::OutboundSignal;

namespace {
  constexpr std::size_t kMaxLineBytes = 256;
}

SignalDispatcher::SignalDispatcher(std::shared_ptr<ErrorMonitor> errorMonitor, Logger& log,
                                   std::unique_ptr<io::SerialChannel> serial,
                                   std::unique_ptr<BrokerPublisher> broker)
    : errorMonitor_(std::move(errorMonitor)), log_(log), serial_(std::move(serial)),
      broker_(std::move(broker)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[SignalDispatcher] error monitor is nullptr");
}

SignalDispatcher::~SignalDispatcher() { shutdown(); }

void SignalDispatcher::send(const OutboundSignal& signal) noexcept {
  try {
    switch (signal.channel) {
    case Channel::Serial:
      writeSerial(signal);
      break;
    case Channel::Broker:
      if (!broker_) {
        log_.debug("[SignalDispatcher] broker disabled, skipped '" + signal.payload + "'");
        break;
      }
      broker_->enqueue(signal);
      break;
    default:
      errorMonitor_->notifyFailure("[SignalDispatcher] unknown channel");
      break;
    }
  } catch (const std::exception& e) {
    // transports must not take the page state machine down with them
    errorMonitor_->notifyFailure(std::string("[SignalDispatcher] ") +
                                 protocols::toString(signal.channel) + " send threw: " + e.what());
  }
}

void SignalDispatcher::writeSerial(const OutboundSignal& signal) {
  if (!serial_) {
    log_.debug("[SignalDispatcher] serial disabled, skipped '" + signal.payload + "'");
    return;
  }

  auto wire = signal.toWire();
  if (wire.size() > kMaxLineBytes) {
    errorMonitor_->notifyFailure("[SignalDispatcher] serial line exceeds " +
                                 std::to_string(kMaxLineBytes) + " bytes, dropped");
    return;
  }

  if (!serial_->writeLine(wire)) {
    errorMonitor_->notifyFailure("[SignalDispatcher] failed to write to serial device");
    return;
  }
  log_.info("[SignalDispatcher] serial sent: " + signal.payload);
}

bool SignalDispatcher::hasChannel(Channel channel) const {
  switch (channel) {
  case Channel::Serial:
    return serial_ != nullptr;
  case Channel::Broker:
    return broker_ != nullptr;
  default:
    return false;
  }
}

void SignalDispatcher::shutdown() {
  if (broker_)
    broker_->stop();
}
