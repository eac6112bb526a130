/* @file ErrorMonitor.cpp
 * @brief logs and counts transport failures; the device keeps running regardless
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"

namespace echome {
  namespace core {

    ErrorMonitor::ErrorMonitor(Logger& log) : log_(log) {}

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::size_t count = 0;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        count = ++seen_[message];
        ++total_;
      }

      if (count == 1)
        log_.error(message);
      else
        log_.debug(message + " (repeated " + std::to_string(count) + "x)");
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return total_;
    }

    std::size_t ErrorMonitor::occurrences(const std::string& message) const {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = seen_.find(message);
      return it == seen_.end() ? 0 : it->second;
    }

  } // namespace core
} // namespace echome
