/* @file UIController.cpp
 * @brief non-blocking command reader standing in for the touch panel on a Linux host
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <unistd.h>

// EchoMe headers
#include "core/Logger.hpp"
#include "ui/UIController.hpp"

using namespace echome::ui;

namespace {

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  std::optional<Control> buttonByName(const std::string& name) {
    if (name == "wake")
      return Control::WakeButton;
    if (name == "start")
      return Control::StartButton;
    if (name == "stop")
      return Control::StopButton;
    if (name == "finish")
      return Control::FinishButton;
    if (name == "echo" || name == "move")
      return Control::CompanionButton;
    return std::nullopt;
  }

} // namespace

UIController::UIController(echome::core::Logger& log, int inputFd) : log_(log), fd_(inputFd) {}

void UIController::registerCallback(std::function<void(const UIEvent&)> cb) { cb_ = std::move(cb); }

const char* UIController::helpText() {
  return "commands: wake | start | stop | finish | echo | slider <0-100> | cancel <button> | quit";
}

std::vector<UIEvent> UIController::parseCommand(const std::string& line) {
  std::istringstream in(line);
  std::string verb;
  if (!(in >> verb))
    return {};
  verb = lower(verb);

  if (verb == "quit" || verb == "exit")
    return { UIEvent{ UIEvent::Kind::Quit } };

  if (verb == "slider") {
    std::string arg;
    if (!(in >> arg))
      return {};
    int value = 0;
    auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
    if (ec != std::errc{} || ptr != arg.data() + arg.size())
      return {};
    return { UIEvent{ UIEvent::Kind::ValueChanged, Control::DurationSlider, value } };
  }

  if (verb == "cancel") {
    std::string arg;
    if (!(in >> arg))
      return {};
    auto button = buttonByName(lower(arg));
    if (!button)
      return {};
    return { UIEvent{ UIEvent::Kind::Press, *button }, UIEvent{ UIEvent::Kind::PressLost, *button } };
  }

  auto button = buttonByName(verb);
  if (!button)
    return {};
  return { UIEvent{ UIEvent::Kind::Press, *button }, UIEvent{ UIEvent::Kind::Release, *button } };
}

void UIController::poll(std::chrono::milliseconds) {
  if (fd_ < 0)
    return;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  while (fd_ >= 0) {
    int rc = ::poll(&pfd, 1, 0);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      log_.error(std::string("[UIController] poll: ") + strerror(errno));
      fd_ = -1;
      return;
    }
    if (rc == 0 || !(pfd.revents & (POLLIN | POLLHUP)))
      return; // nothing pending

    ssize_t n = ::read(fd_, temp, sizeof(temp));
    if (n > 0) {
      rx_buffer_.append(temp, static_cast<std::size_t>(n));
    } else if (n == 0) { // EOF
      log_.info("[UIController] input closed");
      fd_ = -1;
    } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    } else {
      log_.error(std::string("[UIController] read: ") + strerror(errno));
      fd_ = -1;
    }

    // Check for complete lines
    std::size_t pos;
    while ((pos = rx_buffer_.find('\n')) != std::string::npos) {
      std::string line = rx_buffer_.substr(0, pos);
      rx_buffer_.erase(0, pos + 1);
      if (discarding_) {
        discarding_ = false; // tail of the dropped line
        continue;
      }
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      handleLine(line);
    }

    if (rx_buffer_.size() > kMaxLineBytes) {
      if (!discarding_)
        log_.warn("[UIController] input line longer than " + std::to_string(kMaxLineBytes) +
                  " bytes dropped");
      rx_buffer_.clear();
      discarding_ = true;
    }
  }
}

void UIController::handleLine(const std::string& line) {
  auto events = parseCommand(line);
  if (events.empty()) {
    if (line.find_first_not_of(" \t") != std::string::npos)
      log_.warn("[UIController] unknown command '" + line + "'; " + helpText());
    return;
  }
  for (const auto& e : events)
    emit(e);
}
