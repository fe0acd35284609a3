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

#pragma once

#include "tokcheck/util/macros.h"
#include <iostream>
#include <sstream>
#include <string>

namespace tokcheck {

enum class LogLevel : int {
  DEBUG = -1,
  INFO = 0,
  WARNING = 1,
  ERROR = 2,
  FATAL = 3,
};

/// Returns the active threshold. It is read once from the
/// `TOKCHECK_LOG_LEVEL` environment variable (`debug`, `info`, `warning`,
/// `error` or `fatal`, case-insensitive) and defaults to INFO.
LogLevel log_level();

/// Overrides the threshold for the rest of the process.
void set_log_level(LogLevel level);

/// Parses a level name. Unknown names map to INFO.
LogLevel parse_log_level(const std::string &name);

bool log_enabled(LogLevel level);

/// One log statement. The message is buffered and written to stderr when the
/// object is destroyed; FATAL aborts the process afterwards.
class LogMessage {
public:
  LogMessage(const char *file, int line, LogLevel level);
  ~LogMessage();

  std::ostream &stream() { return stream_; }

  TOKCHECK_DISALLOW_COPY_AND_ASSIGN(LogMessage);

private:
  LogLevel level_;
  std::ostringstream stream_;
};

/// Swallows the stream expression of a disabled log statement.
class Voidify {
public:
  void operator&(std::ostream &) {}
};

} // namespace tokcheck

#define TOKCHECK_LOG_INTERNAL(level)                                           \
  ::tokcheck::LogMessage(__FILE__, __LINE__, level).stream()

#define TOKCHECK_LOG(level)                                                    \
  !::tokcheck::log_enabled(::tokcheck::LogLevel::level)                        \
      ? (void)0                                                                \
      : ::tokcheck::Voidify() &                                                \
            TOKCHECK_LOG_INTERNAL(::tokcheck::LogLevel::level)

#define TOKCHECK_CHECK(condition)                                              \
  (condition) ? (void)0                                                        \
              : ::tokcheck::Voidify() &                                        \
                    TOKCHECK_LOG_INTERNAL(::tokcheck::LogLevel::FATAL)         \
                        << " Check failed: " #condition " "
