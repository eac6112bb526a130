// EchoMe-Prod headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"
#include "io/MosquittoClient.hpp"
#include "io/SerialChannel.hpp"
#include "ui/ConsoleDisplay.hpp"
#include "ui/UIController.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <pty.h> // openpty
#include <sys/socket.h>
#include <unistd.h>

namespace echome::test {

  using echome::core::Logger;
  using echome::core::LogEvent;
  using echome::core::LogLevel;
  using echome::ui::Control;
  using echome::ui::UIController;
  using echome::ui::UIEvent;

  namespace {
    std::string readFile(const std::string& path) {
      std::ifstream in(path);
      return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string tempPath(const char* tag) {
      return std::string("/tmp/echome_") + tag + "_" + std::to_string(::getpid());
    }

    /// A loopback port nobody listens on: bind to port 0, read it back, close.
    int closedLoopbackPort() {
      int fd = ::socket(AF_INET, SOCK_STREAM, 0);
      if (fd < 0)
        return -1;
      sockaddr_in addr{};
      addr.sin_family = AF_INET;
      addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
      addr.sin_port = 0;
      socklen_t len = sizeof(addr);
      int port = -1;
      if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
          ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
        port = ntohs(addr.sin_port);
      ::close(fd);
      return port;
    }
  } // namespace

  TEST(serial_channel, opens_writes_closes) {
    // create a false ttyUSB0 "device"
    int masterFd, slaveFd;
    char slaveName[64];
    ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));

    // check that we can open a serial channel to slave dev
    echome::io::SerialChannel chan;
    ASSERT_TRUE(chan.open(slaveName, B115200));
    EXPECT_TRUE(chan.isOpen());

    ASSERT_TRUE(chan.writeLine("start"));
    ASSERT_TRUE(chan.writeLine("90\n")); // already framed, no second newline

    // Reader on master side
    std::string got;
    char buf[32];
    pollfd pfd{ masterFd, POLLIN, 0 };
    while (got.size() < 9 && ::poll(&pfd, 1, 200) > 0) {
      ssize_t n = ::read(masterFd, buf, sizeof(buf));
      if (n <= 0)
        break;
      got.append(buf, static_cast<std::size_t>(n));
    }
    EXPECT_EQ(got, "start\n90\n");

    chan.close();
    EXPECT_FALSE(chan.isOpen());
    EXPECT_FALSE(chan.writeLine("reset"));

    ::close(slaveFd);
    ::close(masterFd);
  }

  TEST(serial_channel, open_missing_device_fails) {
    echome::io::SerialChannel chan;
    EXPECT_FALSE(chan.open("/dev/echome-does-not-exist", B115200));
    EXPECT_FALSE(chan.isOpen());
  }

  TEST(serial_channel, baud_table) {
    EXPECT_EQ(echome::io::SerialChannel::toSpeed(115200), B115200);
    EXPECT_EQ(echome::io::SerialChannel::toSpeed(9600), B9600);
    EXPECT_FALSE(echome::io::SerialChannel::toSpeed(1234).has_value());
  }

  TEST(file_logger, appends_and_flushes) {
    const auto path = tempPath("filelogger.csv");
    std::remove(path.c_str());

    {
      echome::io::FileLogger fl;
      ASSERT_TRUE(fl.open(path));
      fl.write("a,1\n");
      ASSERT_TRUE(fl.flush());
      EXPECT_EQ(readFile(path), "a,1\n");
      fl.write("b,2\n");
    } // destructor flushes

    {
      echome::io::FileLogger fl;
      ASSERT_TRUE(fl.open(path));
      fl.write("c,3\n");
    }
    EXPECT_EQ(readFile(path), "a,1\nb,2\nc,3\n");
    std::remove(path.c_str());
  }

  TEST(file_logger, open_in_missing_directory_fails) {
    echome::io::FileLogger fl;
    EXPECT_FALSE(fl.open("/nonexistent-dir/echome/run.csv"));
    EXPECT_FALSE(fl.isOpen());
    EXPECT_FALSE(fl.flush());
  }

  // ---- Logger ----------------------------------------------------------------

  TEST(logger, csv_row_escapes_quotes_and_newlines) {
    LogEvent ev{ std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123)),
                 LogLevel::Warn, "say \"hi\"\nnow" };
    EXPECT_EQ(Logger::toCsv(ev), "1700000000123,WARN,\"say \"\"hi\"\" now\"\n");
  }

  TEST(logger, parses_level_names) {
    EXPECT_EQ(core::parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(core::parseLogLevel("error"), LogLevel::Error);
    EXPECT_FALSE(core::parseLogLevel("loud").has_value());
    EXPECT_STREQ(core::toString(LogLevel::Info), "INFO");
  }

  TEST(logger, run_log_persists_events) {
    const auto path = tempPath("run.csv");
    std::remove(path.c_str());

    Logger log;
    log.setConsoleLevel(LogLevel::Error);
    ASSERT_TRUE(log.startNewRun(path));
    EXPECT_TRUE(log.isRunning());
    log.info("[Test] first");
    log.debug("[Test] second");
    log.finishRun();
    EXPECT_FALSE(log.isRunning());

    auto text = readFile(path);
    EXPECT_NE(text.find(",INFO,\"[Test] first\""), std::string::npos);
    EXPECT_NE(text.find(",DEBUG,\"[Test] second\""), std::string::npos);
    EXPECT_EQ(log.dropped(), 0u);

    log.info("[Test] after finish"); // console only, no crash
    std::remove(path.c_str());
  }

  TEST(logger, unwritable_run_log_reports_false) {
    Logger log;
    log.setConsoleLevel(LogLevel::Error);
    EXPECT_FALSE(log.startNewRun("/nonexistent-dir/echome/run.csv"));
    EXPECT_FALSE(log.isRunning());
  }

  // ---- UIController ----------------------------------------------------------

  TEST(ui_controller, parses_button_commands) {
    EXPECT_EQ(UIController::parseCommand("wake"),
              (std::vector<UIEvent>{ { UIEvent::Kind::Press, Control::WakeButton },
                                     { UIEvent::Kind::Release, Control::WakeButton } }));
    EXPECT_EQ(UIController::parseCommand("  STOP "),
              (std::vector<UIEvent>{ { UIEvent::Kind::Press, Control::StopButton },
                                     { UIEvent::Kind::Release, Control::StopButton } }));
    EXPECT_EQ(UIController::parseCommand("move")[1].control, Control::CompanionButton);
  }

  TEST(ui_controller, parses_slider_cancel_and_quit) {
    EXPECT_EQ(UIController::parseCommand("slider 75"),
              (std::vector<UIEvent>{ { UIEvent::Kind::ValueChanged, Control::DurationSlider, 75 } }));
    EXPECT_EQ(UIController::parseCommand("cancel finish"),
              (std::vector<UIEvent>{ { UIEvent::Kind::Press, Control::FinishButton },
                                     { UIEvent::Kind::PressLost, Control::FinishButton } }));
    EXPECT_EQ(UIController::parseCommand("quit")[0].kind, UIEvent::Kind::Quit);
    EXPECT_EQ(UIController::parseCommand("exit")[0].kind, UIEvent::Kind::Quit);
  }

  TEST(ui_controller, rejects_malformed_commands) {
    EXPECT_TRUE(UIController::parseCommand("").empty());
    EXPECT_TRUE(UIController::parseCommand("slider").empty());
    EXPECT_TRUE(UIController::parseCommand("slider 7x").empty());
    EXPECT_TRUE(UIController::parseCommand("cancel").empty());
    EXPECT_TRUE(UIController::parseCommand("cancel slider").empty());
    EXPECT_TRUE(UIController::parseCommand("dance").empty());
  }

  TEST(ui_controller, poll_reads_lines_from_fd_without_blocking) {
    int fds[2];
    ASSERT_EQ(0, ::pipe(fds));

    Logger log;
    log.setConsoleLevel(LogLevel::Error);
    UIController panel(log, fds[0]);
    std::vector<UIEvent> events;
    panel.registerCallback([&](const UIEvent& e) { events.push_back(e); });

    panel.poll(std::chrono::milliseconds{ 0 }); // nothing written yet
    EXPECT_TRUE(events.empty());

    const char* partial = "wake\nslid";
    ASSERT_EQ(::write(fds[1], partial, std::strlen(partial)), static_cast<ssize_t>(std::strlen(partial)));
    panel.poll(std::chrono::milliseconds{ 10 });
    EXPECT_EQ(events.size(), 2u);

    const char* rest = "er 20\r\n";
    ASSERT_EQ(::write(fds[1], rest, std::strlen(rest)), static_cast<ssize_t>(std::strlen(rest)));
    panel.poll(std::chrono::milliseconds{ 20 });
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[2], (UIEvent{ UIEvent::Kind::ValueChanged, Control::DurationSlider, 20 }));

    ::close(fds[1]);
    panel.poll(std::chrono::milliseconds{ 30 });
    EXPECT_FALSE(panel.isOpen());
    ::close(fds[0]);
  }

  TEST(ui_controller, overlong_line_is_dropped_and_reading_continues) {
    int fds[2];
    ASSERT_EQ(0, ::pipe(fds));

    Logger log;
    log.setConsoleLevel(LogLevel::Error);
    UIController panel(log, fds[0]);
    std::vector<UIEvent> events;
    panel.registerCallback([&](const UIEvent& e) { events.push_back(e); });

    const std::string flood(4000, 'x'); // no newline
    ASSERT_EQ(::write(fds[1], flood.data(), flood.size()), static_cast<ssize_t>(flood.size()));
    panel.poll(std::chrono::milliseconds{ 0 });
    EXPECT_LE(panel.pending(), UIController::kMaxLineBytes);
    EXPECT_TRUE(events.empty());

    // the rest of the flooded line is skipped, the next command is not
    const char* tail = "xxxwake\nwake\n";
    ASSERT_EQ(::write(fds[1], tail, std::strlen(tail)), static_cast<ssize_t>(std::strlen(tail)));
    panel.poll(std::chrono::milliseconds{ 10 });
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], (UIEvent{ UIEvent::Kind::Press, Control::WakeButton }));
    EXPECT_EQ(panel.pending(), 0u);

    ::close(fds[1]);
    ::close(fds[0]);
  }

  // ---- MosquittoClient -------------------------------------------------------

  TEST(mosquitto_client, publish_before_connect_is_refused) {
    echome::io::MosquittoClient client("127.0.0.1", 1883, "echome-test-idle", 60);
    EXPECT_EQ(client.state(), echome::io::BrokerClient::State::Disconnected);
    EXPECT_FALSE(client.publish("topic/start", "true"));
    EXPECT_EQ(client.state(), echome::io::BrokerClient::State::Disconnected);
    EXPECT_NO_THROW(client.disconnect());
  }

  TEST(mosquitto_client, connect_to_closed_port_fails_within_timeout) {
    const int port = closedLoopbackPort();
    ASSERT_GT(port, 0);

    echome::io::MosquittoClient client("127.0.0.1", port, "echome-test-refused", 60);
    const auto timeout = std::chrono::milliseconds{ 500 };
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.connect(timeout, std::chrono::milliseconds{ 50 }));
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_LT(elapsed, timeout + std::chrono::seconds{ 1 });
    EXPECT_EQ(client.state(), echome::io::BrokerClient::State::Disconnected);
    EXPECT_FALSE(client.publish("topic/start", "true"));
  }

  TEST(mosquitto_client, connect_to_silent_host_is_bounded) {
    // TEST-NET-1: never answers, so only the deadline ends the attempt
    echome::io::MosquittoClient client("192.0.2.1", 1883, "echome-test-silent", 60);
    const auto timeout = std::chrono::milliseconds{ 300 };
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.connect(timeout, std::chrono::milliseconds{ 50 }));
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_LT(elapsed, timeout + std::chrono::seconds{ 1 });
    EXPECT_EQ(client.state(), echome::io::BrokerClient::State::Disconnected);
  }

  // ---- ConsoleDisplay --------------------------------------------------------

  TEST(console_display, prints_only_visible_page_updates) {
    std::ostringstream out;
    echome::ui::ConsoleDisplay display(out);
    using echome::core::Page;

    for (auto p : { Page::Wakeup, Page::Navigation, Page::Focus })
      ASSERT_TRUE(display.initPage(p));

    display.setDurationText("1h"); // Navigation hidden
    EXPECT_TRUE(out.str().empty());

    display.show(Page::Navigation);
    display.setDurationText("1h 30min");
    display.setBackgroundColor(core::Rgb{ 216, 226, 236 });
    display.setStatusText("Time's Up!");

    const auto text = out.str();
    EXPECT_NE(text.find("== Navigation =="), std::string::npos);
    EXPECT_NE(text.find("duration: 1h 30min"), std::string::npos);
    EXPECT_NE(text.find("#D8E2EC"), std::string::npos);
    EXPECT_NE(text.find("status: Time's Up!"), std::string::npos);
  }

} // namespace echome::test
