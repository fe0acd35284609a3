/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include "tokcheck/util/logging.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>

namespace tokcheck {

namespace {

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

LogLevel level_from_env() {
  const char *env = std::getenv("TOKCHECK_LOG_LEVEL");
  if (env == nullptr) {
    return LogLevel::INFO;
  }
  return parse_log_level(env);
}

std::atomic<int> &threshold() {
  static std::atomic<int> value{static_cast<int>(level_from_env())};
  return value;
}

// Strip directories so messages stay short.
const char *base_name(const char *file) {
  const char *name = file;
  for (const char *p = file; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') {
      name = p + 1;
    }
  }
  return name;
}

} // namespace

LogLevel parse_log_level(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    return LogLevel::DEBUG;
  }
  if (lower == "warning" || lower == "warn") {
    return LogLevel::WARNING;
  }
  if (lower == "error") {
    return LogLevel::ERROR;
  }
  if (lower == "fatal") {
    return LogLevel::FATAL;
  }
  return LogLevel::INFO;
}

LogLevel log_level() { return static_cast<LogLevel>(threshold().load()); }

void set_log_level(LogLevel level) {
  threshold().store(static_cast<int>(level));
}

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= threshold().load();
}

LogMessage::LogMessage(const char *file, int line, LogLevel level)
    : level_(level) {
  stream_ << "[" << level_name(level) << " " << base_name(file) << ":" << line
          << "] ";
}

LogMessage::~LogMessage() {
  stream_ << '\n';
  std::cerr << stream_.str();
  if (level_ == LogLevel::FATAL) {
    std::cerr.flush();
    std::abort();
  }
}

} // namespace tokcheck
