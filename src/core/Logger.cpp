/* @file Logger.cpp
 * @brief console mirror + CSV run log drained by a worker thread
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>
#include <vector>

// EchoMe headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

namespace echome {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      }
      return "UNKNOWN";
    }

    std::optional<LogLevel> parseLogLevel(const std::string& name) {
      if (name == "debug")
        return LogLevel::Debug;
      if (name == "info")
        return LogLevel::Info;
      if (name == "warn")
        return LogLevel::Warn;
      if (name == "error")
        return LogLevel::Error;
      return std::nullopt;
    }

    Logger::Logger() : buffer_(std::make_unique<RingBuffer<LogEvent>>(kQueueCapacity)) {}

    Logger::~Logger() { finishRun(); }

    bool Logger::startNewRun(const std::string& csvPath) {
      finishRun();

      if (!csvFile_.open(csvPath)) {
        log(LogLevel::Error, "[Logger] cannot open run log " + csvPath);
        return false;
      }

      running_ = true;
      worker_ = std::thread(&Logger::workerLoop, this);
      return true;
    }

    void Logger::log(LogLevel level, const std::string& message) {
      log(LogEvent{ std::chrono::system_clock::now(), level, message });
    }

    void Logger::log(const LogEvent& event) {
      if (event.level >= consoleLevel_.load()) {
        std::lock_guard<std::mutex> lock(consoleMtx_);
        std::cerr << toString(event.level) << ' ' << event.message << '\n';
      }

      if (!running_.load())
        return;

      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!buffer_->push(event)) {
          ++dropped_;
          return;
        }
      }
      cv_.notify_one();
    }

    void Logger::finishRun() {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_.load())
          return;
        running_ = false;
      }
      cv_.notify_all();
      if (worker_.joinable())
        worker_.join();
      csvFile_.close();
    }

    std::string Logger::toCsv(const LogEvent& event) {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    event.when.time_since_epoch())
                    .count();

      std::string row = std::to_string(ms) + ',' + toString(event.level) + ",\"";
      for (char c : event.message) {
        if (c == '"')
          row += "\"\""; // RFC 4180 quote escaping
        else if (c == '\n' || c == '\r')
          row += ' ';
        else
          row += c;
      }
      row += "\"\n";
      return row;
    }

    void Logger::workerLoop() {
      std::vector<LogEvent> batch;

      while (true) {
        bool keepGoing = true;
        {
          std::unique_lock<std::mutex> lock(mtx_);
          cv_.wait(lock, [this] { return !buffer_->empty() || !running_.load(); });
          while (auto ev = buffer_->pop())
            batch.push_back(std::move(*ev));
          keepGoing = running_.load();
        }

        for (const auto& ev : batch)
          csvFile_.write(toCsv(ev));
        batch.clear();
        csvFile_.flush();

        if (!keepGoing)
          break;
      }
    }

  } // namespace core
} // namespace echome
