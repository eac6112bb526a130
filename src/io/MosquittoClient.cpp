/* @file MosquittoClient.cpp
 * @brief libmosquitto wrapper: bounded connect, QoS 0 publish, manual loop pumping
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>
#include <mutex>
#include <utility>

// 3rd-party headers
#include <mosquitto.h>

// EchoMe headers
#include "io/MosquittoClient.hpp"

using namespace echome::io;

namespace {
  constexpr int kQosAtMostOnce = 0;
  constexpr int kFlushLoopMs = 10;

  std::once_flag libInitFlag;
} // namespace

MosquittoClient::MosquittoClient(std::string host, int port, std::string clientId,
                                 int keepAliveSec)
    : host_(std::move(host)), port_(port), clientId_(std::move(clientId)),
      keepAliveSec_(keepAliveSec) {
  std::call_once(libInitFlag, [] { mosquitto_lib_init(); });

  mosq_ = mosquitto_new(clientId_.c_str(), true, this);
  if (mosq_ == nullptr) {
    std::cerr << "Error: mosquitto_new failed for client " << clientId_ << "\n";
    return;
  }
  mosquitto_connect_callback_set(mosq_, &MosquittoClient::onConnect);
  mosquitto_disconnect_callback_set(mosq_, &MosquittoClient::onDisconnect);
}

MosquittoClient::~MosquittoClient() {
  if (mosq_ == nullptr)
    return;
  disconnect();
  mosquitto_destroy(mosq_);
  mosq_ = nullptr;
}

bool MosquittoClient::connect(std::chrono::milliseconds timeout,
                              std::chrono::milliseconds pollInterval) {
  if (mosq_ == nullptr)
    return false;
  if (state_ == State::Connected)
    return true;

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  // non-blocking TCP connect; the SYN wait is bounded by the loop below, not by the kernel
  state_ = State::Connecting;
  int rc = mosquitto_connect_async(mosq_, host_.c_str(), port_, keepAliveSec_);
  if (rc != MOSQ_ERR_SUCCESS) {
    std::cerr << "Error: mosquitto_connect_async " << host_ << ":" << port_ << ": "
              << mosquitto_strerror(rc) << "\n";
    state_ = State::Disconnected;
    return false;
  }

  // socket writable -> CONNECT sent -> CONNACK flips state_ through onConnect
  while (state_ == State::Connecting && std::chrono::steady_clock::now() < deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto slice = std::max(std::chrono::milliseconds{ 1 }, std::min(pollInterval, left));
    rc = mosquitto_loop(mosq_, static_cast<int>(slice.count()), 1);
    if (rc != MOSQ_ERR_SUCCESS) {
      std::cerr << "Error: mosquitto_loop while connecting to " << host_ << ":" << port_ << ": "
                << mosquitto_strerror(rc) << "\n";
      break;
    }
  }

  if (state_ != State::Connected) {
    mosquitto_disconnect(mosq_);
    state_ = State::Disconnected;
    return false;
  }
  return true;
}

bool MosquittoClient::publish(const std::string& topic, const std::string& payload) {
  if (mosq_ == nullptr || state_ != State::Connected)
    return false;

  // nothing pumps the loop between signals; a zero-wait pass notices a link the broker dropped
  int rc = mosquitto_loop(mosq_, 0, 1);
  if (rc != MOSQ_ERR_SUCCESS) {
    std::cerr << "Error: broker link lost before publish: " << mosquitto_strerror(rc) << "\n";
    state_ = State::Disconnected;
    return false;
  }
  if (state_ != State::Connected)
    return false;

  int mid = 0;
  rc = mosquitto_publish(mosq_, &mid, topic.c_str(), static_cast<int>(payload.size()),
                         payload.data(), kQosAtMostOnce, false);
  if (rc != MOSQ_ERR_SUCCESS) {
    std::cerr << "Error: mosquitto_publish " << topic << ": " << mosquitto_strerror(rc) << "\n";
    if (rc == MOSQ_ERR_NO_CONN || rc == MOSQ_ERR_CONN_LOST)
      state_ = State::Disconnected;
    return false;
  }

  // push the packet out now; QoS 0 has no acknowledgement to wait for
  rc = mosquitto_loop(mosq_, kFlushLoopMs, 1);
  if (rc != MOSQ_ERR_SUCCESS) {
    std::cerr << "Error: mosquitto_loop after publish: " << mosquitto_strerror(rc) << "\n";
    state_ = State::Disconnected;
    return false;
  }
  return true;
}

void MosquittoClient::disconnect() {
  if (mosq_ == nullptr || state_ == State::Disconnected)
    return;
  mosquitto_disconnect(mosq_);
  state_ = State::Disconnected;
}

void MosquittoClient::onConnect(struct mosquitto*, void* self, int rc) {
  auto* client = static_cast<MosquittoClient*>(self);
  if (rc == 0) {
    client->state_ = State::Connected;
  } else {
    std::cerr << "Error: broker refused connection: " << mosquitto_connack_string(rc) << "\n";
    client->state_ = State::Disconnected;
  }
}

void MosquittoClient::onDisconnect(struct mosquitto*, void* self, int) {
  static_cast<MosquittoClient*>(self)->state_ = State::Disconnected;
}
