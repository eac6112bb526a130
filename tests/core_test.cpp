// EchoMe-Prod headers
#include "core/CountdownEngine.hpp"
#include "core/DisplayFormat.hpp"
#include "core/ParameterStore.hpp"
#include "core/RingBuffer.hpp"
#include "core/TimerQueue.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <utility>
#include <vector>

namespace echome::test {

  using echome::core::CountdownEngine;
  using echome::core::SessionParameterStore;
  using echome::core::TimerQueue;
  using namespace std::chrono_literals;

  // ---- TimerQueue ------------------------------------------------------------

  TEST(timer_queue, fires_on_period_and_rearms) {
    TimerQueue q;
    int fired = 0;
    q.schedule(1000ms, [&] { ++fired; });

    q.poll(999ms);
    EXPECT_EQ(fired, 0);
    q.poll(1000ms);
    EXPECT_EQ(fired, 1);
    q.poll(1500ms);
    EXPECT_EQ(fired, 1);
    q.poll(2000ms);
    EXPECT_EQ(fired, 2);
  }

  TEST(timer_queue, late_poll_fires_once_without_replaying_missed_periods) {
    TimerQueue q;
    int fired = 0;
    q.schedule(1000ms, [&] { ++fired; });

    q.poll(5500ms);
    EXPECT_EQ(fired, 1);
    q.poll(6000ms);
    EXPECT_EQ(fired, 1);
    q.poll(6500ms);
    EXPECT_EQ(fired, 2);
  }

  TEST(timer_queue, cancel_is_idempotent) {
    TimerQueue q;
    int fired = 0;
    auto id = q.schedule(100ms, [&] { ++fired; });

    EXPECT_TRUE(q.isScheduled(id));
    EXPECT_TRUE(q.cancel(id));
    EXPECT_FALSE(q.cancel(id));
    EXPECT_FALSE(q.cancel(4242));
    EXPECT_FALSE(q.cancel(TimerQueue::kInvalidTimer));

    q.poll(1s);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(q.size(), 0u);
  }

  TEST(timer_queue, callback_may_cancel_itself_and_others) {
    TimerQueue q;
    TimerQueue::TimerId self = TimerQueue::kInvalidTimer;
    TimerQueue::TimerId other = TimerQueue::kInvalidTimer;
    int selfFired = 0;
    int otherFired = 0;

    self = q.schedule(100ms, [&] {
      ++selfFired;
      q.cancel(self);
      q.cancel(other);
    });
    other = q.schedule(100ms, [&] { ++otherFired; });

    q.poll(100ms);
    q.poll(200ms);
    EXPECT_EQ(selfFired, 1);
    EXPECT_EQ(otherFired, 0);
    EXPECT_EQ(q.size(), 0u);
  }

  // ---- CountdownEngine -------------------------------------------------------

  class CountdownEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      engine.registerCallback([this](CountdownEngine::Event e) {
        if (e == CountdownEngine::Event::Tick)
          ++ticks;
        else
          ++completions;
      });
    }

    /// One tick period of loop time.
    void advance(int periods = 1) {
      for (int i = 0; i < periods; ++i) {
        now += 1000ms;
        timers.poll(now);
      }
    }

    TimerQueue timers;
    CountdownEngine engine{ timers, 1000ms };
    std::chrono::milliseconds now{ 0 };
    int ticks = 0;
    int completions = 0;
  };

  TEST_F(CountdownEngineTest, start_sets_total_and_remaining) {
    engine.start(1.5);

    EXPECT_DOUBLE_EQ(engine.totalHours(), 1.5);
    EXPECT_DOUBLE_EQ(engine.remainingHours(), 1.5);
    EXPECT_TRUE(engine.isRunning());
    EXPECT_FALSE(engine.isPaused());
    EXPECT_TRUE(engine.isTicking());
    EXPECT_EQ(engine.remainingSeconds(), 5400);
  }

  TEST_F(CountdownEngineTest, each_tick_removes_one_second_then_clamps_to_zero) {
    engine.start(0.001); // 3.6 s

    const double oneSecond = 1.0 / 3600.0;
    double before = engine.remainingHours();
    while (engine.isRunning()) {
      advance();
      double after = engine.remainingHours();
      ASSERT_GE(after, 0.0);
      if (engine.isRunning())
        EXPECT_NEAR(before - after, oneSecond, 1e-12);
      before = after;
    }

    EXPECT_EQ(engine.remainingHours(), 0.0);
    EXPECT_EQ(ticks, 4);
    EXPECT_EQ(completions, 1);
  }

  TEST_F(CountdownEngineTest, five_second_session_completes_once_after_five_ticks) {
    engine.start(0.0014);

    advance(4);
    EXPECT_EQ(completions, 0);
    EXPECT_TRUE(engine.isRunning());

    advance();
    EXPECT_EQ(ticks, 5);
    EXPECT_EQ(completions, 1);
    EXPECT_FALSE(engine.isRunning());
    EXPECT_FALSE(engine.isTicking());

    advance(10);
    EXPECT_EQ(ticks, 5);
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(timers.size(), 0u);
  }

  TEST_F(CountdownEngineTest, ninety_minute_session_completes_on_tick_5400) {
    engine.start(1.5);

    advance(5399);
    EXPECT_EQ(completions, 0);
    EXPECT_EQ(engine.remainingSeconds(), 1);

    advance();
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(engine.remainingHours(), 0.0);
  }

  TEST_F(CountdownEngineTest, non_positive_duration_completes_on_first_tick) {
    engine.start(-3.0);
    EXPECT_EQ(engine.totalHours(), 0.0);
    EXPECT_EQ(engine.progressRatio(), 0.0);

    advance();
    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(engine.remainingHours(), 0.0);
  }

  TEST_F(CountdownEngineTest, pause_twice_equals_pause_once) {
    engine.start(1.0);
    advance(3);

    engine.pause();
    const double remaining = engine.remainingHours();
    const bool running = engine.isRunning();
    const bool paused = engine.isPaused();

    engine.pause();
    EXPECT_EQ(engine.remainingHours(), remaining);
    EXPECT_EQ(engine.isRunning(), running);
    EXPECT_EQ(engine.isPaused(), paused);
    EXPECT_FALSE(engine.isTicking());

    advance(20);
    EXPECT_EQ(engine.remainingHours(), remaining);
    EXPECT_EQ(ticks, 3);
  }

  TEST_F(CountdownEngineTest, resume_when_not_paused_is_noop) {
    engine.resume(); // never started
    EXPECT_FALSE(engine.isRunning());
    EXPECT_FALSE(engine.isTicking());

    engine.start(1.0);
    advance(2);
    engine.resume(); // running, not paused
    EXPECT_TRUE(engine.isRunning());
    EXPECT_EQ(timers.size(), 1u);

    advance();
    EXPECT_EQ(ticks, 3);
  }

  TEST_F(CountdownEngineTest, resume_continues_from_frozen_elapsed_time) {
    engine.start(1.0);
    advance(10);
    engine.pause();
    const double elapsed = engine.elapsedHours();

    advance(100);
    engine.resume();
    engine.resume();
    EXPECT_DOUBLE_EQ(engine.elapsedHours(), elapsed);
    EXPECT_EQ(timers.size(), 1u);

    advance();
    EXPECT_NEAR(engine.elapsedHours(), elapsed + engine.tickHours(), 1e-12);
    EXPECT_EQ(ticks, 11);
  }

  TEST_F(CountdownEngineTest, stop_keeps_remaining_and_reset_clears_it) {
    engine.start(1.0);
    advance(60);
    engine.stop();

    EXPECT_FALSE(engine.isRunning());
    EXPECT_FALSE(engine.isPaused());
    EXPECT_EQ(engine.remainingSeconds(), 3540);

    advance(5);
    EXPECT_EQ(ticks, 60);

    engine.stop(); // double stop, double cancel
    engine.reset();
    EXPECT_EQ(engine.totalHours(), 0.0);
    EXPECT_EQ(engine.remainingHours(), 0.0);
    EXPECT_EQ(completions, 0);
  }

  TEST_F(CountdownEngineTest, restart_replaces_the_running_timer) {
    engine.start(1.0);
    advance(5);
    engine.start(0.5);

    EXPECT_EQ(timers.size(), 1u);
    EXPECT_DOUBLE_EQ(engine.remainingHours(), 0.5);
    EXPECT_DOUBLE_EQ(engine.progressRatio(), 1.0);
  }

  // ---- SessionParameterStore -----------------------------------------------

  TEST(parameter_store, clamps_out_of_range_durations) {
    SessionParameterStore store;
    store.set(-1.0);
    EXPECT_EQ(store.get(), 0.0);
    store.set(999.0);
    EXPECT_EQ(store.get(), 2.0);
    store.set(0.75);
    EXPECT_EQ(store.get(), 0.75);
  }

  TEST(parameter_store, ignores_nan_and_clamps_initial_value) {
    SessionParameterStore store(0.0, 2.0, 5.0);
    EXPECT_EQ(store.get(), 2.0);
    store.set(std::numeric_limits<double>::quiet_NaN());
    EXPECT_EQ(store.get(), 2.0);
  }

  TEST(parameter_store, slider_maps_linearly_onto_bounds) {
    SessionParameterStore store;
    store.setFromSlider(75);
    EXPECT_DOUBLE_EQ(store.get(), 1.5);
    EXPECT_EQ(store.sliderValue(), 75);
    EXPECT_DOUBLE_EQ(store.ratio(), 0.75);

    store.setFromSlider(-10);
    EXPECT_EQ(store.get(), 0.0);
    store.setFromSlider(250);
    EXPECT_EQ(store.get(), 2.0);
    EXPECT_EQ(store.sliderValue(), 100);
  }

  TEST(parameter_store, honours_configured_bounds) {
    SessionParameterStore store(0.25, 1.0, 0.5);
    store.set(0.0);
    EXPECT_EQ(store.get(), 0.25);
    store.setFromSlider(100);
    EXPECT_EQ(store.get(), 1.0);
    EXPECT_EQ(store.bounds(), std::make_pair(0.25, 1.0));
  }

  // ---- DisplayFormat ---------------------------------------------------------

  TEST(display_format, clock_truncates_to_whole_seconds) {
    EXPECT_EQ(core::formatClock(5400), "01:30:00");
    EXPECT_EQ(core::formatClock(3599), "00:59:59");
    EXPECT_EQ(core::formatClock(0), "00:00:00");
    EXPECT_EQ(core::formatClock(-7), "00:00:00");
  }

  TEST(display_format, duration_label_and_minutes) {
    EXPECT_EQ(core::formatDurationLabel(1.5), "1h 30min");
    EXPECT_EQ(core::formatDurationLabel(2.0), "2h");
    EXPECT_EQ(core::formatDurationLabel(0.75), "45min");
    EXPECT_EQ(core::formatDurationLabel(0.0), "0min");

    EXPECT_EQ(core::wholeMinutes(1.5), 90);
    EXPECT_EQ(core::wholeMinutes(0.7), 42);
    EXPECT_EQ(core::wholeMinutes(0.0014), 0);
    EXPECT_EQ(core::wholeMinutes(-1.0), 0);
  }

  TEST(display_format, gradient_spans_the_two_endpoints) {
    EXPECT_EQ(core::durationGradient(0.0), (core::Rgb{ 216, 226, 236 }));
    EXPECT_EQ(core::durationGradient(1.0), (core::Rgb{ 252, 224, 231 }));
    EXPECT_EQ(core::durationGradient(7.0), core::durationGradient(1.0));

    auto mid = core::durationGradient(0.5);
    EXPECT_EQ(mid.r, 234);
  }

  // ---- RingBuffer ------------------------------------------------------------

  TEST(ring_buffer, fifo_and_bounded) {
    core::RingBuffer<int> rb(3);
    EXPECT_TRUE(rb.empty());
    EXPECT_TRUE(rb.push(1));
    EXPECT_TRUE(rb.push(2));
    EXPECT_TRUE(rb.push(3));
    EXPECT_TRUE(rb.full());
    EXPECT_FALSE(rb.push(4));

    EXPECT_EQ(rb.pop(), 1);
    EXPECT_TRUE(rb.push(5));
    EXPECT_EQ(rb.pop(), 2);
    EXPECT_EQ(rb.pop(), 3);
    EXPECT_EQ(rb.pop(), 5);
    EXPECT_FALSE(rb.pop().has_value());
  }

} // namespace echome::test
