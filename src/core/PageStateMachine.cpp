/* @file PageStateMachine.cpp
 * @brief page transitions, countdown orchestration and companion signalling
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <string>

// EchoMe headers
#include "core/DisplayFormat.hpp"
#include "core/Logger.hpp"
#include "core/PageStateMachine.hpp"
#include "core/ParameterStore.hpp"
#include "core/SignalDispatcher.hpp"
#include "ui/DisplaySurface.hpp"

using namespace echome::core;
using echome::ui::Button;
using echome::ui::Control;
namespace serial_cmd = echome::protocols::serial_cmd;
namespace broker_payload = echome::protocols::broker_payload;

namespace {
  constexpr const char* kTimesUp = "Time's Up!";
  constexpr const char* kFinished = "Finished";
  constexpr const char* kDone = "Done";
  constexpr const char* kStop = "Stop";
  constexpr const char* kContinue = "Continue";
  constexpr const char* kFinish = "Finish";
} // namespace

PageStateMachine::PageStateMachine(ui::DisplaySurface& display, CountdownEngine& countdown,
                                   SessionParameterStore& params, SignalDispatcher& dispatcher,
                                   Logger& log, CompletionPolicy policy)
    : display_(display), countdown_(countdown), params_(params), dispatcher_(dispatcher),
      log_(log), policy_(policy) {
  countdown_.registerCallback([this](CountdownEngine::Event e) { onCountdownEvent(e); });
}

bool PageStateMachine::initialize() {
  bool allReady = true;
  for (std::size_t i = 0; i < kPageCount; ++i) {
    auto page = static_cast<Page>(i);
    ready_[i] = display_.initPage(page);
    if (!ready_[i]) {
      log_.error(std::string("[PageStateMachine] failed to init ") + toString(page) + " page");
      allReady = false;
    }
  }

  current_ = Page::Wakeup;
  if (ready_[static_cast<std::size_t>(Page::Wakeup)])
    display_.show(Page::Wakeup);

  if (allReady)
    log_.info("[PageStateMachine] pages initialized, showing Wakeup");
  return allReady;
}

bool PageStateMachine::isPageReady(Page page) const {
  auto idx = static_cast<std::size_t>(page);
  return idx < kPageCount && ready_[idx];
}

bool PageStateMachine::switchTo(Page target) {
  auto idx = static_cast<std::size_t>(target);
  if (idx >= kPageCount) {
    log_.error("[PageStateMachine] invalid page " + std::to_string(idx));
    return false;
  }
  if (!ready_[idx]) {
    log_.error(std::string("[PageStateMachine] page ") + toString(target) + " not initialized");
    return false;
  }

  Page previous = current_;
  onExit(previous);
  display_.hide(previous);

  current_ = target;
  display_.show(target);
  onEnter(target);

  log_.info(std::string("[PageStateMachine] switched ") + toString(previous) + " -> " +
            toString(target));
  return true;
}

// ---- input -----------------------------------------------------------------

void PageStateMachine::handlePress(Control control) {
  // actions fire on release; press only gives the toolkit its pressed look
  bool mine = (current_ == Page::Wakeup && control == Control::WakeButton) ||
              (current_ == Page::Navigation && control == Control::StartButton) ||
              (current_ == Page::Focus &&
               (control == Control::StopButton || control == Control::FinishButton ||
                control == Control::CompanionButton));
  if (!mine) {
    ignore(control, "press");
    return;
  }
  log_.debug(std::string("[PageStateMachine] ") + ui::toString(control) + " pressed");
}

void PageStateMachine::handleRelease(Control control) {
  clearTransientStatus();

  switch (current_) {
  case Page::Wakeup:
    if (control == Control::WakeButton)
      return onWakeReleased();
    break;
  case Page::Navigation:
    if (control == Control::StartButton)
      return onStartReleased();
    break;
  case Page::Focus:
    if (control == Control::StopButton)
      return onStopReleased();
    if (control == Control::FinishButton)
      return onFinishReleased();
    if (control == Control::CompanionButton)
      return onCompanionReleased();
    break;
  default:
    break;
  }
  ignore(control, "release");
}

void PageStateMachine::handleValueChanged(Control control, int value) {
  clearTransientStatus();

  if (current_ == Page::Navigation && control == Control::DurationSlider) {
    onDurationChanged(value);
    return;
  }
  ignore(control, "value change");
}

// ---- transitions -------------------------------------------------------------

void PageStateMachine::onWakeReleased() {
  log_.info("[PageStateMachine] wake released");
  switchTo(Page::Navigation);
}

void PageStateMachine::onDurationChanged(int sliderValue) {
  params_.setFromSlider(sliderValue);
  refreshNavigation();
  log_.debug("[PageStateMachine] duration slider " + std::to_string(sliderValue) + " -> " +
             formatDurationLabel(params_.get()));
}

void PageStateMachine::onStartReleased() {
  if (!isPageReady(Page::Focus)) {
    log_.error("[PageStateMachine] focus page not initialized, start ignored");
    return;
  }

  log_.info("[PageStateMachine] start released, focus for " + formatDurationLabel(params_.get()));
  dispatcher_.sendSerial(serial_cmd::kStart);
  dispatcher_.publish(broker_payload::kStarted);
  switchTo(Page::Focus);
}

void PageStateMachine::onStopReleased() {
  if (countdown_.isPaused()) {
    countdown_.resume();
    display_.setButtonLabel(Button::Stop, kStop);
    display_.setStatusText("");
    log_.info("[PageStateMachine] focus session resumed");
  } else if (countdown_.isRunning()) {
    countdown_.pause();
    display_.setButtonLabel(Button::Stop, kContinue);
    display_.setStatusText("");
    log_.info("[PageStateMachine] focus session paused at " +
              formatClock(countdown_.remainingSeconds()));
  } else {
    log_.info("[PageStateMachine] focus session over, returning to navigation");
    switchTo(Page::Navigation);
  }
}

void PageStateMachine::onFinishReleased() {
  countdown_.stop();
  display_.setStatusText(kFinished);
  display_.setButtonLabel(Button::Stop, kDone);

  dispatcher_.sendSerial(serial_cmd::kReset);
  dispatcher_.publish(broker_payload::kStopped);

  log_.info("[PageStateMachine] focus session finished by user with " +
            formatClock(countdown_.remainingSeconds()) + " left");
  switchTo(Page::Navigation);
}

void PageStateMachine::onCompanionReleased() {
  log_.info("[PageStateMachine] companion button released");
  dispatcher_.sendSerial(serial_cmd::kMove);
}

void PageStateMachine::onCountdownEvent(CountdownEngine::Event e) {
  if (current_ != Page::Focus) {
    log_.warn("[PageStateMachine] countdown event outside Focus page ignored");
    return;
  }

  switch (e) {
  case CountdownEngine::Event::Tick:
    refreshFocusReadout();
    break;
  case CountdownEngine::Event::Completed:
    onSessionCompleted();
    break;
  }
}

void PageStateMachine::onSessionCompleted() {
  log_.info("[PageStateMachine] focus session completed");
  display_.setStatusText(kTimesUp);
  display_.setButtonLabel(Button::Stop, kDone);
  display_.setButtonLabel(Button::Finish, kDone);

  if (policy_ != CompletionPolicy::AutoReturn)
    return; // next Stop/Finish release leaves the page

  statusPending_ = true;
  if (switchTo(Page::Navigation))
    display_.setStatusText(kTimesUp);
  else
    statusPending_ = false;
}

// ---- enter / exit hooks ----------------------------------------------------

void PageStateMachine::onEnter(Page page) {
  switch (page) {
  case Page::Navigation:
    if (!statusPending_)
      display_.setStatusText("");
    display_.setSliderValue(params_.sliderValue());
    refreshNavigation();
    break;
  case Page::Focus: {
    double hours = params_.get();
    countdown_.start(hours);
    dispatcher_.sendSerial(std::to_string(wholeMinutes(hours)));

    display_.setStatusText("");
    display_.setButtonLabel(Button::Stop, kStop);
    display_.setButtonLabel(Button::Finish, kFinish);
    refreshFocusReadout();
    log_.info("[PageStateMachine] focus session started: " + formatDurationLabel(hours));
    break;
  }
  default:
    break;
  }
}

void PageStateMachine::onExit(Page page) {
  if (page == Page::Focus)
    countdown_.reset(); // the session does not outlive the page
}

// ---- display helpers ---------------------------------------------------------

void PageStateMachine::refreshFocusReadout() {
  // ratio first: a text display redraws the whole readout on the time update
  display_.setProgressRatio(countdown_.progressRatio());
  display_.setTimeText(formatClock(countdown_.remainingSeconds()));
}

void PageStateMachine::refreshNavigation() {
  display_.setDurationText(formatDurationLabel(params_.get()));
  display_.setBackgroundColor(durationGradient(params_.ratio()));
}

void PageStateMachine::clearTransientStatus() {
  if (!statusPending_)
    return;
  statusPending_ = false;
  display_.setStatusText("");
}

void PageStateMachine::ignore(Control control, const char* what) {
  log_.debug(std::string("[PageStateMachine] ignored ") + what + " of " + ui::toString(control) +
             " on " + toString(current_));
}
