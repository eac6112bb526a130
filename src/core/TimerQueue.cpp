/* @file TimerQueue.cpp
 * @brief cooperative timer wheel for the single UI/event-loop thread
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <utility>
#include <vector>

// EchoMe headers
#include "core/TimerQueue.hpp"

using namespace echome::core;

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds period, Callback cb) {
  if (period.count() <= 0)
    period = std::chrono::milliseconds{ 1 };

  TimerId id = nextId_++;
  if (nextId_ == kInvalidTimer)
    nextId_ = 1; // wrapped

  timers_[id] = Entry{ period, now_ + period, std::move(cb) };
  return id;
}

bool TimerQueue::cancel(TimerId id) { return timers_.erase(id) != 0; }

void TimerQueue::poll(std::chrono::milliseconds now) {
  if (now > now_)
    now_ = now;

  // snapshot ids first: callbacks are free to mutate timers_
  std::vector<TimerId> due;
  for (const auto& [id, entry] : timers_) {
    if (entry.deadline <= now_)
      due.push_back(id);
  }

  for (TimerId id : due) {
    auto it = timers_.find(id);
    if (it == timers_.end())
      continue; // cancelled by an earlier callback

    Entry& entry = it->second;
    entry.deadline += entry.period;
    if (entry.deadline <= now_)
      entry.deadline = now_ + entry.period;

    // copy: the callback may cancel (and destroy) this entry
    Callback cb = entry.cb;
    if (cb)
      cb();
  }
}
