#pragma once
/** @file  CountdownEngine.hpp
 *  @brief Focus-session countdown: start / pause / resume / stop on a fixed tick.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <utility>

#include "core/TimerQueue.hpp"

namespace echome {
  namespace core {

    /**
 * @class CountdownEngine
 * @brief Tracks one session in fractional hours and decrements it once per tick.
 *
 *  * Every tick subtracts exactly one tick period, independent of wall-clock drift.
 *  * A tick that leaves less than half a period on the clock completes the session:
 *    remaining clamps to 0, ticking stops, `Completed` is emitted exactly once.
 *  * The periodic timer lives in the shared TimerQueue, so ticks run on the loop thread.
 */
    class CountdownEngine {
    public:
      enum class Event { Tick, Completed };

      using Callback = std::function<void(Event)>;

      CountdownEngine(TimerQueue& timers,
                      std::chrono::milliseconds tickPeriod = std::chrono::seconds{ 1 });
      ~CountdownEngine();

      void registerCallback(Callback cb) { cb_ = std::move(cb); }

      /// Reset to \p durationHours and start ticking. Non-positive -> zero-length session.
      void start(double durationHours);
      void pause();  ///< no-op unless running
      void resume(); ///< no-op unless paused
      void stop();   ///< cancel ticking; remaining keeps its last value
      void reset();  ///< stop + total = remaining = 0

      /** One tick's worth of work; the TimerQueue callback lands here. */
      void tick();

      double totalHours() const { return total_; }
      double remainingHours() const { return remaining_; }
      double elapsedHours() const { return total_ - remaining_; }
      double tickHours() const { return tickHours_; }
      std::chrono::milliseconds tickPeriod() const { return tickPeriod_; }

      /// Remaining time in whole seconds, truncated.
      long remainingSeconds() const;

      /// remaining / total in [0, 1]; 0 for a zero-length session.
      double progressRatio() const;

      bool isRunning() const { return running_; }
      bool isPaused() const { return paused_; }
      bool isTicking() const { return timerId_ != TimerQueue::kInvalidTimer; }

      CountdownEngine(const CountdownEngine&) = delete;
      CountdownEngine& operator=(const CountdownEngine&) = delete;

    private:
      void armTimer();
      void cancelTimer();
      void emit(Event e) {
        if (cb_)
          cb_(e);
      }

      TimerQueue& timers_;
      std::chrono::milliseconds tickPeriod_;
      double tickHours_;

      TimerQueue::TimerId timerId_{ TimerQueue::kInvalidTimer };
      Callback cb_{};

      double total_{ 0.0 };
      double remaining_{ 0.0 };
      bool running_{ false };
      bool paused_{ false };
    };

  } // namespace core
} // namespace echome
