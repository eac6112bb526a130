#pragma once
/** @file  BrokerPublisher.hpp
 *  @brief Worker thread that owns the MQTT connection so the event loop never waits on it.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "core/ConfigLoader.hpp" // BrokerSettings
#include "core/RingBuffer.hpp"
#include "io/BrokerClient.hpp"
#include "protocols/OutboundSignal.hpp"

namespace echome::core {

  class ErrorMonitor;
  class Logger;

  /**
 * @class BrokerPublisher
 * @brief `enqueue()` returns immediately; the worker connects (once per signal, bounded)
 *        and publishes.
 *
 *  * Connect failure or publish refusal -> ErrorMonitor; the signal is dropped, not retried.
 *  * A publish that finds the link dead (idle session dropped by the broker) spends the
 *    signal's single connect attempt and publishes once more.
 *  * Queue is bounded; overflow drops the newest signal and reports it.
 *  * `stop()` delivers what is already queued, then joins.
 */
  class BrokerPublisher {
  public:
    static constexpr std::size_t kQueueCapacity = 16;

    BrokerPublisher(std::unique_ptr<io::BrokerClient> client, BrokerSettings settings,
                    std::shared_ptr<ErrorMonitor> errMonitor, Logger& log);
    ~BrokerPublisher(); ///< stop()

    void start(); ///< launch worker thread
    void stop();  ///< drain + disconnect + join

    /// Queue \p signal for the worker. Non-blocking; drops (and reports) when full or stopped.
    void enqueue(protocols::OutboundSignal signal);

    bool isRunning() const { return running_.load(); }
    std::size_t published() const { return published_.load(); }
    io::BrokerClient::State clientState() const;

    BrokerPublisher(const BrokerPublisher&) = delete;
    BrokerPublisher& operator=(const BrokerPublisher&) = delete;

  private:
    void workerLoop();
    void deliver(const protocols::OutboundSignal& signal);
    bool connectOnce(); ///< one bounded attempt, failure reported
    std::string endpoint() const;

    std::unique_ptr<io::BrokerClient> client_;
    BrokerSettings settings_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    Logger& log_;

    RingBuffer<protocols::OutboundSignal> queue_{ kQueueCapacity };
    std::mutex mtx_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{ false };
    std::atomic<std::size_t> published_{ 0 };
  };

} // namespace echome::core
