/* @file FileLogger.cpp
 * @brief buffered append-only writer used by the Logger worker thread
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <utility>

// EchoMe headers
#include "io/FileLogger.hpp"

using namespace echome::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.clear();
  buffer_.reserve(kFlushThreshold);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (fp_ == nullptr)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  if (!buffer_.empty()) {
    std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      // keep the unwritten tail for the next attempt
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
