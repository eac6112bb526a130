/* @file CountdownEngine.cpp
 * @brief fixed-decrement focus countdown scheduled on the loop's TimerQueue
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <algorithm>

// EchoMe headers
#include "core/CountdownEngine.hpp"

using namespace echome::core;

namespace {
  constexpr double kMsPerHour = 3600.0 * 1000.0;
  constexpr double kSecondsPerHour = 3600.0;
  constexpr double kTruncationGuard = 1e-6; ///< seconds; absorbs fp drift before truncating
} // namespace

CountdownEngine::CountdownEngine(TimerQueue& timers, std::chrono::milliseconds tickPeriod)
    : timers_(timers), tickPeriod_(tickPeriod.count() > 0 ? tickPeriod : std::chrono::seconds{ 1 }),
      tickHours_(static_cast<double>(tickPeriod_.count()) / kMsPerHour) {}

CountdownEngine::~CountdownEngine() { cancelTimer(); }

void CountdownEngine::start(double durationHours) {
  cancelTimer();

  total_ = std::max(0.0, durationHours);
  remaining_ = total_;
  running_ = true;
  paused_ = false;

  armTimer();
}

void CountdownEngine::pause() {
  if (!running_)
    return;

  cancelTimer();
  running_ = false;
  paused_ = true;
}

void CountdownEngine::resume() {
  if (!paused_)
    return;

  // ticking picks up from elapsedHours() = total_ - remaining_, which pause() froze
  paused_ = false;
  running_ = true;
  armTimer();
}

void CountdownEngine::stop() {
  cancelTimer();
  running_ = false;
  paused_ = false;
}

void CountdownEngine::reset() {
  stop();
  total_ = 0.0;
  remaining_ = 0.0;
}

void CountdownEngine::tick() {
  if (!running_ || paused_)
    return;

  remaining_ -= tickHours_;

  const bool finished = remaining_ < tickHours_ * 0.5;
  if (finished) {
    remaining_ = 0.0;
    running_ = false;
    cancelTimer();
  }

  emit(Event::Tick);
  if (finished)
    emit(Event::Completed);
}

long CountdownEngine::remainingSeconds() const {
  return static_cast<long>(remaining_ * kSecondsPerHour + kTruncationGuard);
}

double CountdownEngine::progressRatio() const {
  if (total_ <= 0.0)
    return 0.0;
  return std::clamp(remaining_ / total_, 0.0, 1.0);
}

void CountdownEngine::armTimer() {
  cancelTimer();
  timerId_ = timers_.schedule(tickPeriod_, [this] { tick(); });
}

void CountdownEngine::cancelTimer() {
  if (timerId_ == TimerQueue::kInvalidTimer)
    return;
  timers_.cancel(timerId_);
  timerId_ = TimerQueue::kInvalidTimer;
}
