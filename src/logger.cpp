// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#include "logger.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>

Logger g_logger;

void init_logger()
{
  const char* destination = std::getenv("DPULL_LOGFILE");
  if (destination) {
    g_logger.init(destination);
  }
}

void Logger::init(const std::string& destination)
{
  _enabled = false;
  _stream = nullptr;
  if (_file.is_open()) {
    _file.close();
  }

  if (destination.empty()) {
    return;
  }

  if (destination == "-") {
    _stream = &std::cerr;
  } else {
    _file.open(destination, std::ios::app);
    if (!_file.is_open()) {
      return;
    }
    _stream = &_file;
  }
  _enabled = true;
}

void Logger::log(const std::string& msg)
{
  if (!_enabled || !_stream) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  struct tm tm;
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  *_stream << "[" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
           << std::setw(3) << ms.count() << "] " << msg << std::endl;
}
