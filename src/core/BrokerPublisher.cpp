/* @file BrokerPublisher.cpp
 * @brief asynchronous MQTT fan-out: bounded connect + QoS 0 publish on a worker thread
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// EchoMe headers
#include "core/BrokerPublisher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"

using namespace echome::core;
using echome::protocols::OutboundSignal;

BrokerPublisher::BrokerPublisher(std::unique_ptr<io::BrokerClient> client,
                                 BrokerSettings settings,
                                 std::shared_ptr<ErrorMonitor> errMonitor, Logger& log)
    : client_(std::move(client)), settings_(std::move(settings)),
      errorMonitor_(std::move(errMonitor)), log_(log) {
  if (!client_ || !errorMonitor_)
    throw std::invalid_argument("[BrokerPublisher] client and error monitor are required");
}

BrokerPublisher::~BrokerPublisher() { stop(); }

void BrokerPublisher::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (running_)
    return;
  running_ = true;
  worker_ = std::thread(&BrokerPublisher::workerLoop, this);
  log_.info("[BrokerPublisher] started for " + endpoint() + " topic " + settings_.topic);
}

void BrokerPublisher::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
  client_->disconnect();
  log_.info("[BrokerPublisher] stopped");
}

void BrokerPublisher::enqueue(OutboundSignal signal) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_) {
      errorMonitor_->notifyFailure("[BrokerPublisher] not running, dropped '" + signal.payload + "'");
      return;
    }
    if (!queue_.push(std::move(signal))) {
      errorMonitor_->notifyFailure("[BrokerPublisher] queue full, signal dropped");
      return;
    }
  }
  cv_.notify_one();
}

echome::io::BrokerClient::State BrokerPublisher::clientState() const { return client_->state(); }

void BrokerPublisher::workerLoop() {
  while (true) {
    std::optional<OutboundSignal> next;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      next = queue_.pop();
      if (!next && !running_)
        break; // drained and asked to stop
    }
    if (next)
      deliver(*next);
  }
}

void BrokerPublisher::deliver(const OutboundSignal& signal) {
  bool connectTried = false;
  if (client_->state() != io::BrokerClient::State::Connected) {
    connectTried = true;
    if (!connectOnce())
      return;
  }

  const std::string& topic = signal.topic.empty() ? settings_.topic : signal.topic;
  bool ok = client_->publish(topic, signal.toWire());

  // the broker may have dropped an idle session; that signal still gets its one connect
  if (!ok && !connectTried && client_->state() == io::BrokerClient::State::Disconnected) {
    log_.warn("[BrokerPublisher] link to " + endpoint() + " was stale, reconnecting");
    if (!connectOnce())
      return;
    ok = client_->publish(topic, signal.toWire());
  }

  if (!ok) {
    errorMonitor_->notifyFailure("[BrokerPublisher] publish to " + topic + " failed");
    return;
  }

  ++published_;
  log_.info("[BrokerPublisher] published to " + topic + ": " + signal.payload);
}

bool BrokerPublisher::connectOnce() {
  log_.info("[BrokerPublisher] connecting to " + endpoint());
  if (!client_->connect(settings_.connectTimeout, settings_.pollInterval)) {
    errorMonitor_->notifyFailure("[BrokerPublisher] connect to " + endpoint() + " failed");
    return false;
  }
  log_.info("[BrokerPublisher] connected to " + endpoint());
  return true;
}

std::string BrokerPublisher::endpoint() const {
  return settings_.host + ":" + std::to_string(settings_.port);
}
