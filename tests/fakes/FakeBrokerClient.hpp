#pragma once
/** @file  FakeBrokerClient.hpp
 *  @brief In-memory BrokerClient for BrokerPublisher testing.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <atomic>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "io/BrokerClient.hpp"

namespace echome {
  namespace test {

    /**
 * @class FakeBrokerClient
 * @brief Called from the publisher's worker thread, inspected from the test thread.
 */
    class FakeBrokerClient : public echome::io::BrokerClient {
    public:
      std::atomic<bool> connect_succeeds{ true };
      std::atomic<bool> publish_succeeds{ true };
      /// Next publish finds the broker gone: fails and drops to Disconnected, once.
      std::atomic<bool> link_dropped{ false };
      std::atomic<int> connect_calls{ 0 };
      std::atomic<int> disconnect_calls{ 0 };

      bool connect(std::chrono::milliseconds, std::chrono::milliseconds) override {
        ++connect_calls;
        state_ = connect_succeeds ? State::Connected : State::Disconnected;
        return connect_succeeds;
      }

      bool publish(const std::string& topic, const std::string& payload) override {
        if (link_dropped.exchange(false)) {
          state_ = State::Disconnected;
          return false;
        }
        if (!publish_succeeds)
          return false;
        std::lock_guard<std::mutex> lock(mtx_);
        published_.emplace_back(topic, payload);
        return true;
      }

      void disconnect() override {
        ++disconnect_calls;
        state_ = State::Disconnected;
      }

      State state() const override { return state_.load(); }

      /// Start out as if an earlier signal had already connected.
      void assumeConnected() { state_ = State::Connected; }

      std::vector<std::pair<std::string, std::string>> published() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return published_;
      }

    private:
      std::atomic<State> state_{ State::Disconnected };
      mutable std::mutex mtx_;
      std::vector<std::pair<std::string, std::string>> published_;
    };

  } // namespace test
} // namespace echome
