#pragma once
/** @file  MosquittoClient.hpp
 *  @brief BrokerClient on top of libmosquitto.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <string>

#include "io/BrokerClient.hpp"

struct mosquitto; // libmosquitto handle, keeps <mosquitto.h> out of our headers

namespace echome {
  namespace io {

    /**
 * @class MosquittoClient
 * @brief Owns one `struct mosquitto*`; drives its network loop manually (no mosquitto thread).
 *
 *  * Connection state is flipped by libmosquitto's connect/disconnect callbacks,
 *    which run inside `mosquitto_loop()` on the caller's (worker) thread.
 *  * Non-copyable, non-movable (libmosquitto keeps `this` as userdata).
 */
    class MosquittoClient : public BrokerClient {
    public:
      MosquittoClient(std::string host, int port, std::string clientId, int keepAliveSec);
      ~MosquittoClient() override;

      bool connect(std::chrono::milliseconds timeout,
                   std::chrono::milliseconds pollInterval) override;
      bool publish(const std::string& topic, const std::string& payload) override;
      void disconnect() override;
      State state() const override { return state_.load(); }

      MosquittoClient(const MosquittoClient&) = delete;
      MosquittoClient& operator=(const MosquittoClient&) = delete;

    private:
      static void onConnect(struct mosquitto* mosq, void* self, int rc);
      static void onDisconnect(struct mosquitto* mosq, void* self, int rc);

      struct mosquitto* mosq_{ nullptr };
      std::string host_;
      int port_;
      std::string clientId_;
      int keepAliveSec_;
      std::atomic<State> state_{ State::Disconnected };
    };

  } // namespace io
} // namespace echome
