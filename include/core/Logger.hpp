#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace echome {
  namespace core {

    enum class LogLevel { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    /// Parses "debug" / "info" / "warn" / "error"; std::nullopt otherwise.
    std::optional<LogLevel> parseLogLevel(const std::string& name);

    struct LogEvent {
      std::chrono::system_clock::time_point when{};
      LogLevel level{ LogLevel::Info };
      std::string message; ///< "[Component] text"
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Diagnostics for every component; persists a CSV run log when a run is open.
 *
 *  * `log()` never blocks on disk: events go into a bounded ring buffer that the
 *    worker drains. A full buffer drops the event and bumps `dropped()`.
 *  * Events at or above the console level are mirrored to std::cerr on the caller's thread.
 *  * Safe to call from the event loop and the broker worker concurrently.
 */
    class Logger {

    public:
      static constexpr std::size_t kQueueCapacity = 512;

      Logger();
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(const LogEvent& event);              ///< enqueue event (non-blocking)
      void finishRun();                             ///< flush + join worker thread

      void debug(const std::string& message) { log(LogLevel::Debug, message); }
      void info(const std::string& message) { log(LogLevel::Info, message); }
      void warn(const std::string& message) { log(LogLevel::Warn, message); }
      void error(const std::string& message) { log(LogLevel::Error, message); }
      void log(LogLevel level, const std::string& message);

      void setConsoleLevel(LogLevel level) { consoleLevel_.store(level); }
      LogLevel consoleLevel() const { return consoleLevel_.load(); }

      bool isRunning() const { return running_.load(); }
      std::size_t dropped() const { return dropped_.load(); }

      /// CSV row for one event, including the trailing newline.
      static std::string toCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex mtx_;
      std::mutex consoleMtx_;
      std::condition_variable cv_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> consoleLevel_{ LogLevel::Warn };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace echome
