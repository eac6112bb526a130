#pragma once
/** @file  TimerQueue.hpp
 *  @brief Periodic callbacks driven by the event loop's `poll(now)`.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

namespace echome {
  namespace core {

    /**
 * @class TimerQueue
 * @brief Owner loop calls `poll(now)` every ~10 ms; due timers fire on that thread.
 *
 *  * No threads, no signals: a timer can only fire from inside `poll()`.
 *  * `cancel()` is idempotent; cancelling an unknown id is a no-op.
 *  * Callbacks may schedule or cancel timers (their own included) while firing.
 *  * A late poll fires a timer once and re-arms it one period after `now`;
 *    missed periods are not replayed.
 */
    class TimerQueue {
    public:
      using TimerId = std::uint32_t;
      using Callback = std::function<void()>;

      static constexpr TimerId kInvalidTimer = 0;

      TimerQueue() = default;
      ~TimerQueue() = default;

      /// Arm a periodic timer; the first expiry is one \p period after the last poll time.
      TimerId schedule(std::chrono::milliseconds period, Callback cb);

      /// @returns true if \p id was armed and is now cancelled.
      bool cancel(TimerId id);

      bool isScheduled(TimerId id) const { return timers_.count(id) != 0; }
      std::size_t size() const { return timers_.size(); }

      void poll(std::chrono::milliseconds now);

      std::chrono::milliseconds now() const { return now_; }

      TimerQueue(const TimerQueue&) = delete;
      TimerQueue& operator=(const TimerQueue&) = delete;

    private:
      struct Entry {
        std::chrono::milliseconds period{ 0 };
        std::chrono::milliseconds deadline{ 0 };
        Callback cb{};
      };

      std::map<TimerId, Entry> timers_; ///< ordered by id -> deterministic firing order
      std::chrono::milliseconds now_{ 0 };
      TimerId nextId_{ 1 };
    };

  } // namespace core
} // namespace echome
