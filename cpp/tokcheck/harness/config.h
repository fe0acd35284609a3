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

#include "tokcheck/util/error.h"
#include "tokcheck/util/result.h"
#include <optional>

namespace tokcheck {
namespace harness {

/// Configuration shared by the encode verifier and the decode driver.
///
/// Types with distinct human-readable and compact representations must pick
/// one explicitly; asking an unmarked verifier which form is wanted fails the
/// test.
///
/// ```cpp
/// EXPECT_TRUE(assert_tokens(Config::compact(), ts, tokens));
/// ```
struct Config {
  /// Answer to is_human_readable(). Unset means the test did not say.
  std::optional<bool> human_readable;

  Config() = default;

  static Config readable() {
    Config config;
    config.human_readable = true;
    return config;
  }

  static Config compact() {
    Config config;
    config.human_readable = false;
    return config;
  }

  /// The configured answer, or an error asking the test to choose one.
  Result<bool, Error> is_human_readable() const {
    if (!human_readable) {
      return Unexpected(Error::custom(
          "Types which have different human-readable and compact "
          "representations must explicitly mark their test cases with "
          "Config::readable() or Config::compact()"));
    }
    return *human_readable;
  }
};

} // namespace harness
} // namespace tokcheck
