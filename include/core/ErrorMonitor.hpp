#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central transport-fault aggregator.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace echome::core {

  class Logger;

  /**
 * @class ErrorMonitor
 * @brief Serial writes and the broker worker call `notifyFailure()`; nothing escalates.
 *
 * * Thread-safe (mutex-protected map), used from the loop and the broker worker.
 * * Debounces duplicate failures: the first occurrence of a message is logged as an
 *   error, repeats only at debug level so an unplugged companion doesn't flood the log.
 */
  class ErrorMonitor {
  public:
    explicit ErrorMonitor(Logger& log);
    virtual ~ErrorMonitor() = default;

    /// Called by transports on fault; logs and counts, never throws.
    virtual void notifyFailure(const std::string& message);

    /// Total failures reported since construction.
    std::size_t failureCount() const;

    /// Number of times \p message has been reported.
    std::size_t occurrences(const std::string& message) const;

  private:
    Logger& log_;
    std::unordered_map<std::string, std::size_t> seen_; ///< de-dupe list
    std::size_t total_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace echome::core
